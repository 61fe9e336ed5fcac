#include <pgtx/status_tracker.hxx>

#include "../test_helpers.hxx"


namespace
{
using pgtx::command_kind;
using pgtx::transaction_status;


void test_status_tracker_follows_transaction_block()
{
  pgtx::status_tracker t;
  PGTX_CHECK_EQUAL(
    t.believed(), transaction_status::idle, "Tracker should start idle.");

  PGTX_CHECK(
    t.update(command_kind::begin, false, transaction_status::in_transaction)
      .ok,
    "BEGIN did not lead into a transaction block.");
  PGTX_CHECK(
    t.update(
       command_kind::statement, false, transaction_status::in_transaction)
      .ok,
    "Successful statement changed the status.");
  PGTX_CHECK(
    t.update(command_kind::statement, true, transaction_status::failed).ok,
    "Error inside a block did not fail the transaction.");
  PGTX_CHECK_EQUAL(
    t.believed(), transaction_status::failed, "Tracker missed the failure.");
  PGTX_CHECK(
    t.update(
       command_kind::rollback_to, false, transaction_status::in_transaction)
      .ok,
    "ROLLBACK TO did not recover the transaction.");
  PGTX_CHECK(
    t.update(command_kind::commit, false, transaction_status::idle).ok,
    "COMMIT did not end the transaction.");
  PGTX_CHECK_EQUAL(
    t.believed(), transaction_status::idle, "Not idle after commit.");
}


void test_status_tracker_expectations()
{
  pgtx::status_tracker t;
  PGTX_CHECK_EQUAL(
    t.expect(command_kind::statement, true), transaction_status::idle,
    "Error outside a transaction block should leave us idle.");
  PGTX_CHECK_EQUAL(
    t.expect(command_kind::begin, true), transaction_status::idle,
    "Failed BEGIN should not open a block.");

  t.update(
    command_kind::begin, false, transaction_status::in_transaction);
  PGTX_CHECK_EQUAL(
    t.expect(command_kind::savepoint, true), transaction_status::failed,
    "Failed SAVEPOINT should abort the transaction.");
  PGTX_CHECK_EQUAL(
    t.expect(command_kind::release, false),
    transaction_status::in_transaction, "Bad expectation for RELEASE.");
  PGTX_CHECK_EQUAL(
    t.expect(command_kind::commit, true), transaction_status::idle,
    "A failed COMMIT still ends the transaction.");
  PGTX_CHECK_EQUAL(
    t.expect(command_kind::rollback, false), transaction_status::idle,
    "Bad expectation for ROLLBACK.");
}


void test_status_tracker_reports_mismatch()
{
  pgtx::status_tracker t;
  auto const verdict{
    t.update(command_kind::begin, false, transaction_status::idle)};
  PGTX_CHECK(not verdict.ok, "Mismatch went unnoticed.");
  PGTX_CHECK_EQUAL(
    verdict.expected, transaction_status::in_transaction,
    "Wrong expected status.");
  PGTX_CHECK_EQUAL(
    verdict.observed, transaction_status::idle, "Wrong observed status.");
  PGTX_CHECK_EQUAL(
    verdict.message(), "unexpected status: idle", "Wrong mismatch message.");
  PGTX_CHECK_EQUAL(
    t.believed(), transaction_status::idle,
    "Mismatch should not change what we believe.");

  // A raw BEGIN is only a statement, as far as we know.
  auto const raw{t.update(
    command_kind::statement, false, transaction_status::in_transaction)};
  PGTX_CHECK(not raw.ok, "Statement opening a block went unnoticed.");
  PGTX_CHECK_EQUAL(
    raw.message(), "unexpected status: in_transaction",
    "Wrong message for raw BEGIN.");
}


void test_status_tracker_verify()
{
  pgtx::status_tracker t;
  PGTX_CHECK(t.verify(transaction_status::idle).ok, "Idle did not verify.");
  auto const verdict{t.verify(transaction_status::failed)};
  PGTX_CHECK(not verdict.ok, "Bad status verified.");
  PGTX_CHECK_EQUAL(
    verdict.message(), "unexpected status: failed",
    "Wrong verification message.");
}


void test_lenient_status_tracker_adopts_statement_status()
{
  pgtx::status_tracker t{true};
  PGTX_CHECK(t.lenient(), "Tracker is not lenient.");

  PGTX_CHECK(
    t.update(
       command_kind::statement, false, transaction_status::in_transaction)
      .ok,
    "Lenient tracker rejected a caller's BEGIN.");
  PGTX_CHECK_EQUAL(
    t.believed(), transaction_status::in_transaction,
    "Lenient tracker did not adopt the observed status.");

  // Our own control commands are still held to the rules.
  PGTX_CHECK(
    not t.update(command_kind::savepoint, false, transaction_status::idle).ok,
    "Lenient tracker accepted a bad SAVEPOINT outcome.");

  t.reset();
  PGTX_CHECK_EQUAL(
    t.believed(), transaction_status::idle, "Reset did not go idle.");
}


PGTX_REGISTER_TEST(test_status_tracker_follows_transaction_block);
PGTX_REGISTER_TEST(test_status_tracker_expectations);
PGTX_REGISTER_TEST(test_status_tracker_reports_mismatch);
PGTX_REGISTER_TEST(test_status_tracker_verify);
PGTX_REGISTER_TEST(test_lenient_status_tracker_adopts_statement_status);
} // namespace
