/* In-memory stand-in for a PostgreSQL server, for tests.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_TEST_FAKE_SERVER
#define PGTX_H_TEST_FAKE_SERVER

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <pgtx/backend.hxx>
#include <pgtx/connection.hxx>


namespace pgtx::test
{
/// Simulated PostgreSQL server, just smart enough for transaction tests.
/** Follows the server's rules for transaction blocks, savepoints, and failed
 * transactions.  Has one table, `uniques`, with a single integer column that
 * has a unique constraint.  Understands:
 *
 * - `BEGIN`, `COMMIT`, `ROLLBACK`
 * - `SAVEPOINT x`, `RELEASE [SAVEPOINT] x`, `ROLLBACK TO [SAVEPOINT] x`
 * - `SET TRANSACTION READ ONLY`
 * - `SELECT <integer>`
 * - `SELECT count(*) FROM uniques`
 * - `INSERT INTO uniques VALUES (<v>)` where v is an integer literal, `$n`,
 *   or `CAST($n AS int)`
 * - `DELETE FROM uniques`
 *
 * Anything else is a syntax error.  Every command received goes into the
 * @ref log.
 */
class fake_server
{
public:
  fake_server() = default;

  reply execute(std::string const &sql, params const &args);

  [[nodiscard]] transaction_status status() const noexcept
  {
    return m_status;
  }
  [[nodiscard]] bool connected() const noexcept { return m_connected; }

  /// Every command received so far, in order.
  [[nodiscard]] std::vector<std::string> const &log() const noexcept
  {
    return m_log;
  }
  void clear_log() noexcept { m_log.clear(); }

  /// How many times the log contains exactly @c sql.
  [[nodiscard]] std::size_t count(std::string_view sql) const;

  /// Rows in `uniques` as committed.
  [[nodiscard]] std::vector<int> const &committed() const noexcept
  {
    return m_committed;
  }

  /// Names of open savepoints, outermost first.
  [[nodiscard]] std::vector<std::string> savepoints() const;

  /// Make the server refuse all writes, as a hot standby would.
  void set_read_only(bool ro) noexcept { m_read_only = ro; }

  /// Change the transaction status behind the client's back.
  void force_status(transaction_status s) noexcept { m_status = s; }

  /// Make the next command fail with this error.
  void fail_next(server_error err) { m_fail_next = std::move(err); }

  /// Break the connection.  The next command fails as if the socket died.
  void drop_connection() noexcept { m_connected = false; }

  /// Client asked us to close the connection.
  void terminate(std::string const &reason);

  /// Reasons given in every termination request received.
  [[nodiscard]] std::vector<std::string> const &terminations() const noexcept
  {
    return m_terminations;
  }

  /// Take the notices the server generated since the last call.
  [[nodiscard]] std::vector<std::string> take_notices();

private:
  using table = std::vector<int>;

  reply run(std::string_view cmd, params const &args);
  reply fail(
    std::string_view sqlstate, std::string message,
    bool ends_transaction = false);
  void notice(std::string_view msg);

  reply begin();
  reply commit();
  reply rollback();
  reply savepoint(std::string_view name);
  reply release(std::string_view name);
  reply rollback_to(std::string_view name);
  reply set_transaction(std::string_view rest);
  reply select(std::string_view rest);
  reply insert(std::string_view value, params const &args);
  reply remove();

  [[nodiscard]] bool in_block() const noexcept
  {
    return m_status != transaction_status::idle;
  }
  [[nodiscard]] table &visible() noexcept
  {
    return in_block() ? m_working : m_committed;
  }
  [[nodiscard]] bool writable() const noexcept
  {
    return not m_read_only and not m_read_only_tx;
  }

  /// Index of the most recent savepoint of that name, if any.
  [[nodiscard]] std::optional<std::size_t>
  find_savepoint(std::string_view name) const;

  transaction_status m_status{transaction_status::idle};
  bool m_connected{true};
  bool m_read_only{false};
  bool m_read_only_tx{false};
  table m_committed;
  table m_working;
  std::vector<std::pair<std::string, table>> m_savepoints;
  std::optional<server_error> m_fail_next;
  std::vector<std::string> m_log;
  std::vector<std::string> m_terminations;
  std::vector<std::string> m_notices;
};


/// A @ref backend talking to a @ref fake_server.
class fake_backend final : public backend
{
public:
  explicit fake_backend(std::shared_ptr<fake_server> server) :
          m_server{std::move(server)}
  {}

  reply execute(std::string const &sql, params const &args) override;
  transaction_status current_status() const override;
  void request_termination(std::string const &reason) noexcept override;
  bool is_open() const noexcept override;

private:
  std::shared_ptr<fake_server> m_server;
};


/// A fake server, and a connection to it.
struct fixture
{
  explicit fixture(connection_options opts = {});

  std::shared_ptr<fake_server> server;
  /// Everything the connection logged.
  std::vector<std::string> notices;
  /// Termination reasons, as seen by the connection's termination handler.
  std::vector<std::string> terminations;
  connection cx;
};


/// Connection options for the naive strategy.
connection_options naive_options();
} // namespace pgtx::test
#endif
