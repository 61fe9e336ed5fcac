/** Implementation of the pgtx::connection class.
 *
 * pgtx::connection encapsulates a connection to a database.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include <exception>
#include <iostream>
#include <utility>

#include "pgtx/connection.hxx"
#include "pgtx/except.hxx"
#include "pgtx/internal/concat.hxx"
#include "pgtx/pq_backend.hxx"
#include "pgtx/transaction_context.hxx"


namespace
{
void write_to_stderr(std::string_view msg) noexcept
{
  std::cerr << msg;
}
} // namespace


pgtx::connection::connection(
  std::unique_ptr<backend> back, connection_options opts) :
        m_backend{std::move(back)},
        m_options{std::move(opts)},
        m_tracker{m_options.transactions == strategy::naive},
        m_classifier{m_options.disconnect_on_error_codes},
        m_notice_handler{write_to_stderr}
{
  if (not m_backend)
    throw argument_error{"Creating connection without a backend."};
  m_backend->set_notice_handler(
    [this](std::string_view msg) { process_notice(msg); });
  if (not m_backend->is_open())
    throw broken_connection{"Backend is not connected."};
}


pgtx::connection::connection(
  std::string const &conninfo, connection_options opts) :
        connection{std::make_unique<pq_backend>(conninfo), std::move(opts)}
{}


pgtx::connection::~connection() noexcept
{
  if (m_context != nullptr)
    process_notice("Closing connection while a transaction is active.\n");
}


pgtx::result pgtx::connection::exec(
  std::string const &sql, params const &args, query_options const &opts)
{
  if (m_context != nullptr)
    throw usage_error{internal::concat(
      "Attempt to execute '", sql,
      "' directly on a connection while a transaction is active.  Use the "
      "transaction handle.")};
  if (opts.savepoint)
    throw usage_error{internal::concat(
      "Requested a savepoint for '", sql,
      "' outside of any transaction.  There is nothing to roll back to.")};
  checkout();
  return run(command_kind::statement, sql, args);
}


void pgtx::connection::ping()
{
  check_alive();
  transaction_status observed{};
  try
  {
    observed = m_backend->current_status();
  }
  catch (broken_connection const &e)
  {
    terminate(e.what());
  }
  if (auto const verdict{m_tracker.verify(observed)}; not verdict.ok)
    terminate_desync(verdict.message());
}


void pgtx::connection::poll()
{
  check_alive();
}


void pgtx::connection::on_termination(termination_handler handler)
{
  if (m_terminated)
    handler(m_reason);
  else
    m_termination_handlers.push_back(std::move(handler));
}


void pgtx::connection::process_notice(std::string_view msg) noexcept
{
  if (m_notice_handler and not std::empty(msg))
    m_notice_handler(msg);
}


pgtx::result pgtx::connection::run(
  command_kind kind, std::string const &sql, params const &args)
{
  check_alive();

  reply rep;
  transaction_status observed{};
  try
  {
    rep = m_backend->execute(sql, args);
    observed = m_backend->current_status();
  }
  catch (broken_connection const &e)
  {
    terminate(e.what());
  }

  if (auto const verdict{m_tracker.update(kind, not rep.ok(), observed)};
      not verdict.ok)
    terminate_desync(verdict.message());

  if (rep.error)
  {
    auto const text{rep.error->text()};
    if (m_classifier.classify(rep.error->sqlstate) == error_class::disconnect)
      terminate_after_error(text);
    throw_sql_error(text, sql, rep.error->sqlstate);
  }
  return std::move(rep.data);
}


void pgtx::connection::checkout()
{
  check_alive();
  if (m_tracker.lenient())
    return;
  ping();
}


void pgtx::connection::check_alive()
{
  if (m_terminated)
    throw connection_terminated{m_reason};
}


void pgtx::connection::terminate_after_error(
  std::string const &reason) noexcept
{
  if (m_terminated)
    return;
  m_reason = reason;
  carry_out_termination();
}


void pgtx::connection::terminate(std::string const &reason)
{
  if (not m_terminated)
  {
    m_reason = reason;
    carry_out_termination();
  }
  throw connection_terminated{m_reason};
}


void pgtx::connection::terminate_desync(std::string const &reason)
{
  if (not m_terminated)
  {
    m_reason = reason;
    carry_out_termination();
  }
  throw protocol_violation{m_reason};
}


void pgtx::connection::carry_out_termination() noexcept
{
  if (m_terminated)
    return;
  m_terminated = true;
  m_backend->request_termination(m_reason);
  process_notice(internal::concat("disconnected: ", m_reason, "\n"));

  auto const handlers{std::move(m_termination_handlers)};
  m_termination_handlers.clear();
  for (auto const &handler : handlers)
  {
    try
    {
      handler(m_reason);
    }
    catch (std::exception const &e)
    {
      process_notice(
        internal::concat("Exception in termination handler: ", e.what(), "\n"));
    }
  }
}


void pgtx::connection::register_context(transaction_context *ctx)
{
  if (ctx == nullptr)
    throw internal_error{"null transaction context registered."};
  if (ctx->parent() != m_context)
    throw internal_error{
      "Registering a transaction context that does not nest in the current "
      "one."};
  m_context = ctx;
}


void pgtx::connection::unregister_context(transaction_context *ctx) noexcept
{
  if (ctx != m_context)
  {
    process_notice(
      "Closing a transaction context that is not the current one.\n");
    return;
  }
  m_context = ctx->parent();
}
