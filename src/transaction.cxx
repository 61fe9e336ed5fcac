/** Implementation of the pgtx::transaction_manager and related classes.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include <exception>
#include <tuple>

#include "pgtx/except.hxx"
#include "pgtx/internal/concat.hxx"
#include "pgtx/internal/gates/connection-transaction.hxx"
#include "pgtx/savepoint.hxx"
#include "pgtx/transaction.hxx"


pgtx::result pgtx::transaction_handle::exec(
  std::string const &sql, params const &args, query_options const &opts)
{
  auto &ctx{context()};
  if (opts.savepoint)
    return savepoint_scope{ctx}.exec(sql, args);
  return ctx.exec(command_kind::statement, sql, args);
}


void pgtx::transaction_handle::rollback(std::string reason)
{
  throw internal::rollback_request{&context(), std::move(reason)};
}


bool pgtx::transaction_handle::failed() const
{
  return context().failed();
}


pgtx::strategy pgtx::transaction_handle::get_strategy() const
{
  return context().get_strategy();
}


pgtx::transaction_context &pgtx::transaction_handle::context() const
{
  if (not m_slot or *m_slot == nullptr)
    throw usage_error{
      "Using a transaction handle after its transaction has ended."};
  return **m_slot;
}


pgtx::transaction_manager::transaction_manager(connection &cx, strategy s) :
        m_conn{cx}, m_context{cx, s}
{
  switch (s)
  {
  case strategy::strict: m_context.exec(command_kind::begin, "BEGIN", {}); break;

  case strategy::naive:
    // If the enclosing transaction has failed already, there is no point in
    // setting a savepoint; the server would refuse it anyway.
    if (m_context.failed())
      break;
    m_anchor = m_context.next_savepoint_name();
    try
    {
      m_context.exec(
        command_kind::savepoint, internal::concat("SAVEPOINT ", m_anchor), {});
    }
    catch (sql_error const &)
    {
      if (auto *const outer{m_context.parent()}; outer != nullptr)
        outer->mark_failed();
      throw;
    }
    break;
  }
}


pgtx::transaction_manager::~transaction_manager() noexcept
{
  if (m_done)
    return;
  m_done = true;
  if (m_conn.is_terminated())
    return;
  rollback_quietly();
}


bool pgtx::transaction_manager::commit()
{
  if (m_done)
    throw usage_error{"Committing a transaction that is already closed."};
  m_done = true;

  if (m_context.get_strategy() == strategy::strict)
  {
    if (m_context.failed())
    {
      strict_rollback();
      m_context.close();
      return false;
    }
    try
    {
      m_context.exec(command_kind::commit, "COMMIT", {});
    }
    catch (sql_error const &e)
    {
      internal::gate::connection_transaction{m_conn}.check_alive();
      m_conn.process_notice(internal::concat(
        "COMMIT failed, transaction was rolled back: ", e.what(), "\n"));
      m_context.close();
      return false;
    }
    m_context.close();
    return true;
  }

  if (std::empty(m_anchor))
  {
    m_context.close();
    return false;
  }
  if (m_context.failed())
  {
    // The enclosing transaction goes on as it was before this one started.
    auto const restored{naive_rollback()};
    m_context.close();
    return restored;
  }
  try
  {
    m_context.exec(
      command_kind::release, internal::concat("RELEASE SAVEPOINT ", m_anchor),
      {});
  }
  catch (sql_error const &e)
  {
    internal::gate::connection_transaction{m_conn}.check_alive();
    m_conn.process_notice(internal::concat(
      "Could not release savepoint ", m_anchor, ", rolling back: ", e.what(),
      "\n"));
    naive_rollback();
    m_context.close();
    return false;
  }
  m_context.close();
  return true;
}


void pgtx::transaction_manager::rollback()
{
  if (m_done)
    throw usage_error{"Rolling back a transaction that is already closed."};
  m_done = true;

  if (m_context.get_strategy() == strategy::strict)
    strict_rollback();
  else
    std::ignore = naive_rollback();
  m_context.close();
}


void pgtx::transaction_manager::abandon()
{
  if (m_done)
    return;
  m_done = true;
  internal::gate::connection_transaction{m_conn}.check_alive();
  rollback_quietly();
}


void pgtx::transaction_manager::strict_rollback()
{
  try
  {
    m_context.exec(command_kind::rollback, "ROLLBACK", {});
  }
  catch (sql_error const &e)
  {
    internal::gate::connection_transaction{m_conn}.check_alive();
    m_conn.process_notice(
      internal::concat("Error rolling back transaction: ", e.what(), "\n"));
  }
}


bool pgtx::transaction_manager::naive_rollback()
{
  if (std::empty(m_anchor))
    return false;
  bool ok{true};
  try
  {
    m_context.exec(
      command_kind::rollback_to,
      internal::concat("ROLLBACK TO SAVEPOINT ", m_anchor), {});
  }
  catch (sql_error const &e)
  {
    internal::gate::connection_transaction{m_conn}.check_alive();
    m_conn.process_notice(internal::concat(
      "Error rolling back to savepoint ", m_anchor, ": ", e.what(), "\n"));
    ok = false;
  }
  try
  {
    m_context.exec(
      command_kind::release, internal::concat("RELEASE SAVEPOINT ", m_anchor),
      {});
  }
  catch (sql_error const &e)
  {
    internal::gate::connection_transaction{m_conn}.check_alive();
    // Now the enclosing transaction is aborted as well.
    if (auto *const outer{m_context.parent()}; outer != nullptr)
      outer->mark_failed();
    m_conn.process_notice(internal::concat(
      "Error releasing savepoint ", m_anchor, ": ", e.what(), "\n"));
    ok = false;
  }
  return ok;
}


void pgtx::transaction_manager::rollback_quietly() noexcept
{
  try
  {
    if (m_context.get_strategy() == strategy::strict)
      m_context.exec(command_kind::rollback, "ROLLBACK", {});
    else
      std::ignore = naive_rollback();
  }
  catch (std::exception const &e)
  {
    m_conn.process_notice(internal::concat(
      "Error while rolling back transaction: ", e.what(), "\n"));
  }
  m_context.close();
}
