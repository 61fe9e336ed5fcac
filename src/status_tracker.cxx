/** Implementation of the pgtx::status_tracker class.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include "pgtx/internal/concat.hxx"
#include "pgtx/status_tracker.hxx"


std::string pgtx::status_verdict::message() const
{
  return internal::concat("unexpected status: ", to_string(observed));
}


pgtx::transaction_status
pgtx::status_tracker::expect(command_kind kind, bool error) const noexcept
{
  // An error inside a transaction block aborts it.  Outside of one, there
  // is nothing to abort.
  auto const aborted{
    (m_believed == transaction_status::idle) ? transaction_status::idle :
                                               transaction_status::failed};

  switch (kind)
  {
  case command_kind::begin:
    return error ? m_believed : transaction_status::in_transaction;

  case command_kind::commit:
  case command_kind::rollback: return transaction_status::idle;

  case command_kind::savepoint:
  case command_kind::release:
  case command_kind::rollback_to:
    return error ? aborted : transaction_status::in_transaction;

  case command_kind::statement: return error ? aborted : m_believed;
  }
  PGTX_UNREACHABLE;
}


pgtx::status_verdict pgtx::status_tracker::update(
  command_kind kind, bool error, transaction_status observed) noexcept
{
  if (m_lenient and kind == command_kind::statement)
  {
    m_believed = observed;
    return {true, observed, observed};
  }

  auto const expected{expect(kind, error)};
  if (expected != observed)
    return {false, expected, observed};
  m_believed = observed;
  return {true, expected, observed};
}


pgtx::status_verdict
pgtx::status_tracker::verify(transaction_status observed) const noexcept
{
  return {m_believed == observed, m_believed, observed};
}
