/** Implementation of savepoints: pgtx::savepoint_frame, pgtx::savepoint_scope.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include <exception>
#include <utility>

#include "pgtx/connection.hxx"
#include "pgtx/except.hxx"
#include "pgtx/internal/concat.hxx"
#include "pgtx/internal/gates/transaction_context-savepoint_frame.hxx"
#include "pgtx/savepoint.hxx"
#include "pgtx/transaction_context.hxx"


pgtx::savepoint_frame::savepoint_frame(
  transaction_context &ctx, std::string name) :
        m_context{ctx}, m_name{std::move(name)}
{
  internal::gate::transaction_context_savepoint_frame gate{m_context};
  gate.register_frame(this);
  try
  {
    m_context.exec(
      command_kind::savepoint, internal::concat("SAVEPOINT ", m_name), {});
  }
  catch (std::exception const &)
  {
    gate.unregister_frame(this);
    if (m_context.conn().believed_status() == transaction_status::failed)
      m_context.mark_failed();
    throw;
  }
}


pgtx::savepoint_frame::~savepoint_frame() noexcept
{
  if (m_released)
    return;

  auto const &cx{m_context.conn()};
  if (not cx.is_terminated())
  {
    try
    {
      rollback_to();
    }
    catch (std::exception const &e)
    {
      m_context.conn().process_notice(internal::concat(
        "Error rolling back to savepoint ", m_name, ": ", e.what(), "\n"));
    }
    try
    {
      release();
    }
    catch (std::exception const &e)
    {
      m_context.conn().process_notice(internal::concat(
        "Error releasing savepoint ", m_name, ": ", e.what(), "\n"));
    }
  }
  end();
}


void pgtx::savepoint_frame::rollback_to()
{
  if (m_released)
    throw usage_error{internal::concat(
      "Rolling back to savepoint ", m_name, ", which was already released.")};
  m_context.exec(
    command_kind::rollback_to,
    internal::concat("ROLLBACK TO SAVEPOINT ", m_name), {});
}


void pgtx::savepoint_frame::release()
{
  if (m_released)
    throw usage_error{
      internal::concat("Releasing savepoint ", m_name, " twice.")};
  try
  {
    m_context.exec(
      command_kind::release, internal::concat("RELEASE SAVEPOINT ", m_name),
      {});
  }
  catch (sql_error const &)
  {
    end();
    m_context.mark_failed();
    throw;
  }
  catch (std::exception const &)
  {
    end();
    throw;
  }
  end();
}


void pgtx::savepoint_frame::end() noexcept
{
  if (m_released)
    return;
  m_released = true;
  internal::gate::transaction_context_savepoint_frame{m_context}
    .unregister_frame(this);
}


pgtx::result
pgtx::savepoint_scope::exec(std::string const &sql, params const &args)
{
  savepoint_frame frame{m_context, std::string{frame_name}};

  result res;
  std::exception_ptr failure;
  try
  {
    res = m_context.exec(command_kind::statement, sql, args);
  }
  catch (sql_error const &)
  {
    failure = std::current_exception();
  }

  if (failure)
  {
    try
    {
      frame.rollback_to();
    }
    catch (sql_error const &e)
    {
      m_context.conn().process_notice(internal::concat(
        "Error rolling back to savepoint ", frame.name(), ": ", e.what(),
        "\n"));
    }
  }

  // If this fails, its error replaces the query's outcome.
  frame.release();

  if (failure)
    std::rethrow_exception(failure);
  return res;
}
