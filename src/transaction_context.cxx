/** Implementation of the pgtx::transaction_context class.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include "pgtx/backend.hxx"
#include "pgtx/connection.hxx"
#include "pgtx/except.hxx"
#include "pgtx/internal/concat.hxx"
#include "pgtx/internal/gates/connection-transaction.hxx"
#include "pgtx/savepoint.hxx"
#include "pgtx/sqlstate.hxx"
#include "pgtx/transaction_context.hxx"


pgtx::transaction_context *
pgtx::transaction_context::enter(connection &cx, strategy s)
{
  internal::gate::connection_transaction gate{cx};
  auto *const current{gate.current_context()};
  if (current == nullptr)
    gate.checkout();
  else
    gate.check_alive();

  switch (s)
  {
  case strategy::strict:
    if (current != nullptr)
      throw usage_error{
        "Started strict transaction while another transaction is still "
        "active."};
    break;

  case strategy::naive:
    if (cx.believed_status() == transaction_status::idle)
      throw usage_error{
        "Started naive transaction outside of a transaction block.  Open "
        "one first, or use a strict transaction."};
    break;
  }
  return current;
}


pgtx::transaction_context::transaction_context(connection &cx, strategy s) :
        m_conn{cx},
        m_strategy{s},
        m_parent{enter(cx, s)},
        m_slot{std::make_shared<transaction_context *>(this)}
{
  internal::gate::connection_transaction{m_conn}.register_context(this);
  if (m_strategy == strategy::naive and
      m_conn.believed_status() == transaction_status::failed)
    m_failed = true;
}


pgtx::transaction_context::~transaction_context() noexcept
{
  *m_slot = nullptr;
  if (m_frame != nullptr)
    m_conn.process_notice(internal::concat(
      "Closing transaction while savepoint ", m_frame->name(),
      " is still open.\n"));
  internal::gate::connection_transaction{m_conn}.unregister_context(this);
}


pgtx::result pgtx::transaction_context::exec(
  command_kind kind, std::string const &sql, params const &args)
{
  internal::gate::connection_transaction gate{m_conn};
  gate.check_alive();

  if (m_closed)
    throw usage_error{internal::concat(
      "Attempt to execute '", sql, "' in a transaction that is already "
      "closed.")};
  if (gate.current_context() != this)
    throw usage_error{internal::concat(
      "Attempt to execute '", sql,
      "' in a transaction while a nested transaction is active.")};

  if (
    m_failed and kind != command_kind::rollback and
    kind != command_kind::rollback_to and kind != command_kind::release)
    throw_failed(sql);

  try
  {
    return gate.run(kind, sql, args);
  }
  catch (sql_error const &)
  {
    // A failed command aborts the transaction, unless a query-level
    // savepoint is there to catch it.
    if (
      m_frame == nullptr and kind != command_kind::begin and
      kind != command_kind::commit and kind != command_kind::rollback)
      m_failed = true;
    throw;
  }
}


std::string pgtx::transaction_context::next_savepoint_name()
{
  if (m_parent != nullptr)
    return m_parent->next_savepoint_name();
  return internal::concat("pgtx_savepoint_", ++m_savepoint_counter);
}


void pgtx::transaction_context::register_frame(savepoint_frame *frame)
{
  if (frame == nullptr)
    throw internal_error{"null savepoint registered."};
  if (m_frame != nullptr)
  {
    if (m_frame == frame)
      throw usage_error{
        internal::concat("Started twice: savepoint ", frame->name())};
    throw usage_error{internal::concat(
      "Started savepoint ", frame->name(), " while savepoint ",
      m_frame->name(), " still active.")};
  }
  m_frame = frame;
}


void pgtx::transaction_context::unregister_frame(
  savepoint_frame *frame) noexcept
{
  if (frame != m_frame)
  {
    m_conn.process_notice(internal::concat(
      "Closing savepoint ", frame->name(),
      " which is not the transaction's open savepoint.\n"));
    return;
  }
  m_frame = nullptr;
}


void pgtx::transaction_context::throw_failed(std::string const &sql) const
{
  server_error const err{
    std::string{sqlstate::in_failed_sql_transaction}, "ERROR",
    "current transaction is aborted, commands ignored until end of "
    "transaction block",
    ""};
  throw in_failed_sql_transaction{
    err.text(), sql, err.sqlstate.c_str()};
}
