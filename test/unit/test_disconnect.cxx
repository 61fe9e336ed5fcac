#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include <pgtx/transaction.hxx>

#include "../fake_server.hxx"
#include "../test_helpers.hxx"


namespace
{
using strings = std::vector<std::string>;


pgtx::connection_options read_only_disconnects()
{
  pgtx::connection_options opts;
  opts.disconnect_on_error_codes =
    pgtx::disconnect_policy{"read_only_sql_transaction"};
  return opts;
}


std::string const read_only_reason{
  "ERROR 25006 (read_only_sql_transaction): cannot execute INSERT in a "
  "read-only transaction"};


bool logged(pgtx::test::fixture const &fx, std::string const &line)
{
  for (auto const &msg : fx.notices)
    if (msg == line)
      return true;
  return false;
}


void test_disconnect_error_is_reported_before_termination()
{
  pgtx::test::fixture fx{read_only_disconnects()};
  try
  {
    std::ignore =
      pgtx::transaction(fx.cx, [&fx](pgtx::transaction_handle &tx) {
        tx.exec("SET TRANSACTION READ ONLY");
        PGTX_CHECK_THROWS(
          tx.exec("INSERT INTO uniques VALUES (1)"),
          pgtx::read_only_sql_transaction,
          "Write in read-only transaction went unnoticed.");
        PGTX_CHECK(fx.cx.is_terminated(), "Termination was put off.");
        PGTX_CHECK_EQUAL(
          fx.server->terminations(), strings{read_only_reason},
          "Server was not told to terminate.");
        PGTX_CHECK_EQUAL(
          std::size(fx.terminations), 1u,
          "Termination handler was not called.");
        tx.exec("SELECT 1");
      });
    PGTX_CHECK_NOTREACHED("Transaction survived a disconnect error.");
  }
  catch (pgtx::connection_terminated const &e)
  {
    PGTX_CHECK_EQUAL(e.reason(), read_only_reason, "Wrong reason.");
    PGTX_CHECK_EQUAL(std::string{e.what()}, read_only_reason, "Bad what().");
  }

  PGTX_CHECK(fx.cx.is_terminated(), "Connection is not terminated.");
  PGTX_CHECK_EQUAL(
    fx.cx.termination_reason(), read_only_reason, "Wrong stored reason.");
  PGTX_CHECK_EQUAL(
    fx.terminations, strings{read_only_reason},
    "Termination handler saw the wrong reason.");
  PGTX_CHECK_EQUAL(
    fx.server->terminations(), strings{read_only_reason},
    "Server was told the wrong reason.");
  PGTX_CHECK(
    logged(fx, "disconnected: " + read_only_reason + "\n"),
    "Termination was not logged.");
  PGTX_CHECK_EQUAL(
    fx.server->count("ROLLBACK"), 0u, "Rolled back a dead connection.");
  PGTX_CHECK_EQUAL(
    fx.server->count("COMMIT"), 0u, "Committed on a dead connection.");
}


void test_terminated_connection_stays_terminated()
{
  pgtx::test::fixture fx{read_only_disconnects()};
  fx.server->set_read_only(true);
  PGTX_CHECK_THROWS(
    fx.cx.exec("INSERT INTO uniques VALUES (1)"),
    pgtx::read_only_sql_transaction, "Write on standby went unnoticed.");

  PGTX_CHECK_THROWS(
    fx.cx.poll(), pgtx::connection_terminated,
    "Termination was not reported.");
  PGTX_CHECK_THROWS(
    fx.cx.exec("SELECT 1"), pgtx::connection_terminated,
    "Terminated connection executed a query.");
  PGTX_CHECK_THROWS(
    fx.cx.ping(), pgtx::connection_terminated,
    "Terminated connection answered a ping.");
  PGTX_CHECK_THROWS(
    std::ignore = pgtx::transaction(
      fx.cx, [](pgtx::transaction_handle &) {}),
    pgtx::connection_terminated,
    "Transaction started on terminated connection.");

  try
  {
    fx.cx.exec("SELECT 2");
    PGTX_CHECK_NOTREACHED("Terminated connection executed a query.");
  }
  catch (pgtx::connection_terminated const &e)
  {
    PGTX_CHECK_EQUAL(e.reason(), read_only_reason, "Reason changed.");
  }

  PGTX_CHECK_EQUAL(
    std::size(fx.terminations), 1u, "Termination handler called again.");
  PGTX_CHECK_EQUAL(
    std::size(fx.server->terminations()), 1u, "Server terminated again.");
  PGTX_CHECK_EQUAL(fx.server->count("SELECT 1"), 0u, "Query was sent.");
}


void test_local_errors_do_not_terminate()
{
  pgtx::test::fixture fx{read_only_disconnects()};
  fx.cx.exec("INSERT INTO uniques VALUES (1)").no_rows();
  PGTX_CHECK_THROWS(
    fx.cx.exec("INSERT INTO uniques VALUES (1)"), pgtx::unique_violation,
    "Duplicate key went unnoticed.");
  PGTX_CHECK(not fx.cx.is_terminated(), "Local error terminates.");
  PGTX_CHECK(std::empty(fx.terminations), "Local error called handlers.");
  PGTX_CHECK_SUCCEEDS(fx.cx.ping(), "Connection unusable after local error.");
}


void test_raw_begin_is_a_protocol_violation()
{
  pgtx::test::fixture fx;
  try
  {
    fx.cx.exec("BEGIN");
    PGTX_CHECK_NOTREACHED("Raw BEGIN went unnoticed.");
  }
  catch (pgtx::protocol_violation const &e)
  {
    PGTX_CHECK_EQUAL(
      e.reason(), "unexpected status: in_transaction", "Wrong reason.");
  }
  PGTX_CHECK(fx.cx.is_terminated(), "Connection survived desync.");
  PGTX_CHECK_EQUAL(
    fx.terminations, strings{"unexpected status: in_transaction"},
    "Handler saw wrong reason.");
  PGTX_CHECK_EQUAL(
    fx.server->terminations(), strings{"unexpected status: in_transaction"},
    "Server saw wrong reason.");
  PGTX_CHECK_THROWS(
    fx.cx.exec("SELECT 1"), pgtx::connection_terminated,
    "Desynced connection still works.");
}


void test_raw_rollback_in_transaction_is_a_protocol_violation()
{
  pgtx::test::fixture fx;
  try
  {
    std::ignore = pgtx::transaction(fx.cx, [](pgtx::transaction_handle &tx) {
      tx.exec("INSERT INTO uniques VALUES (1)").no_rows();
      tx.exec("ROLLBACK");
    });
    PGTX_CHECK_NOTREACHED("Raw ROLLBACK went unnoticed.");
  }
  catch (pgtx::protocol_violation const &e)
  {
    PGTX_CHECK_EQUAL(e.reason(), "unexpected status: idle", "Wrong reason.");
  }
  PGTX_CHECK_EQUAL(
    fx.server->count("ROLLBACK"), 1u, "Sent a ROLLBACK of our own.");
  PGTX_CHECK(std::empty(fx.server->committed()), "Data committed.");
  PGTX_CHECK(
    not fx.cx.in_transaction_context(), "Transaction context left behind.");
}


void test_status_change_behind_our_back()
{
  pgtx::test::fixture fx;
  fx.server->force_status(pgtx::transaction_status::in_transaction);
  try
  {
    fx.cx.ping();
    PGTX_CHECK_NOTREACHED("Status change went unnoticed.");
  }
  catch (pgtx::protocol_violation const &e)
  {
    PGTX_CHECK_EQUAL(
      e.reason(), "unexpected status: in_transaction", "Wrong reason.");
  }

  pgtx::test::fixture fx2;
  fx2.server->force_status(pgtx::transaction_status::failed);
  PGTX_CHECK_THROWS(
    fx2.cx.exec("SELECT 1"), pgtx::protocol_violation,
    "Query went out on a desynced connection.");
  PGTX_CHECK_EQUAL(fx2.server->count("SELECT 1"), 0u, "Query was sent.");
}


void test_lost_connection_terminates()
{
  pgtx::test::fixture fx;
  fx.server->drop_connection();
  PGTX_CHECK_THROWS(
    fx.cx.exec("SELECT 1"), pgtx::connection_terminated,
    "Lost connection went unnoticed.");
  PGTX_CHECK(fx.cx.is_terminated(), "Connection not terminated.");
  PGTX_CHECK_EQUAL(
    fx.terminations, strings{fx.cx.termination_reason()},
    "Handler saw wrong reason.");

  pgtx::test::fixture fx2;
  try
  {
    std::ignore =
      pgtx::transaction(fx2.cx, [&fx2](pgtx::transaction_handle &tx) {
        fx2.server->drop_connection();
        tx.exec("SELECT 1");
      });
    PGTX_CHECK_NOTREACHED("Lost connection in transaction went unnoticed.");
  }
  catch (pgtx::connection_terminated const &e)
  {
    PGTX_CHECK_EQUAL(
      e.reason().find("server closed the connection unexpectedly"), 0u,
      "Reason does not come from the backend.");
  }
  PGTX_CHECK_EQUAL(std::size(fx2.terminations), 1u, "Handler not called.");
}


void test_disconnect_error_terminates_without_further_use()
{
  pgtx::test::fixture fx{read_only_disconnects()};
  fx.server->set_read_only(true);
  bool server_told_first{false};
  fx.cx.on_termination([&fx, &server_told_first](std::string const &) {
    server_told_first = not std::empty(fx.server->terminations());
  });

  PGTX_CHECK_THROWS(
    fx.cx.exec("INSERT INTO uniques VALUES (1)"),
    pgtx::read_only_sql_transaction, "Write on standby went unnoticed.");

  PGTX_CHECK(fx.cx.is_terminated(), "Connection was not terminated.");
  PGTX_CHECK_EQUAL(
    fx.server->terminations(), strings{read_only_reason},
    "Server was not told to terminate.");
  PGTX_CHECK_EQUAL(
    fx.terminations, strings{read_only_reason},
    "Termination handler was not called.");
  PGTX_CHECK(server_told_first, "Handlers ran before the server was told.");
  PGTX_CHECK(
    logged(fx, "disconnected: " + read_only_reason + "\n"),
    "Termination was not logged.");
}


void test_termination_handlers()
{
  pgtx::test::fixture fx;
  fx.cx.on_termination([](std::string const &) {
    throw std::runtime_error{"handler trouble"};
  });
  fx.server->drop_connection();
  PGTX_CHECK_THROWS(
    fx.cx.ping(), pgtx::connection_terminated,
    "Lost connection went unnoticed.");
  PGTX_CHECK_EQUAL(
    std::size(fx.terminations), 1u, "Failing handler stopped the others.");
  PGTX_CHECK(
    logged(fx, "Exception in termination handler: handler trouble\n"),
    "Handler exception was not logged.");

  std::string late;
  fx.cx.on_termination([&late](std::string const &reason) { late = reason; });
  PGTX_CHECK_EQUAL(
    late, fx.cx.termination_reason(), "Late handler was not called.");
}


PGTX_REGISTER_TEST(test_disconnect_error_is_reported_before_termination);
PGTX_REGISTER_TEST(test_terminated_connection_stays_terminated);
PGTX_REGISTER_TEST(test_local_errors_do_not_terminate);
PGTX_REGISTER_TEST(test_raw_begin_is_a_protocol_violation);
PGTX_REGISTER_TEST(test_raw_rollback_in_transaction_is_a_protocol_violation);
PGTX_REGISTER_TEST(test_status_change_behind_our_back);
PGTX_REGISTER_TEST(test_lost_connection_terminates);
PGTX_REGISTER_TEST(test_disconnect_error_terminates_without_further_use);
PGTX_REGISTER_TEST(test_termination_handlers);
} // namespace
