/* Definition of the pgtx::connection class.
 *
 * pgtx::connection encapsulates a connection to a database.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_CONNECTION
#define PGTX_H_CONNECTION

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pgtx/backend.hxx"
#include "pgtx/compiler-public.hxx"
#include "pgtx/error_classifier.hxx"
#include "pgtx/options.hxx"
#include "pgtx/params.hxx"
#include "pgtx/result.hxx"
#include "pgtx/status_tracker.hxx"
#include "pgtx/types.hxx"


namespace pgtx::internal::gate
{
class connection_transaction;
} // namespace pgtx::internal::gate


namespace pgtx
{
/// Per-query options.
struct PGTX_LIBEXPORT query_options
{
  /// Run the query inside its own savepoint.
  /** If the query fails, only the savepoint is rolled back, and the enclosing
   * transaction can carry on.  Only valid inside a @ref transaction().
   */
  bool savepoint{false};
};


/// Callback receiving the reason when a connection is terminated.
using termination_handler = std::function<void(std::string const &)>;


/// Connection to a database.
/** This is the first class to look at when you wish to work with a database
 * through pgtx.  It sends commands through a @ref backend, and keeps track
 * of the transaction status the server should be in.
 *
 * Every round trip passes through here.  After each one, the connection
 * checks the server's reported transaction status against its own
 * expectation.  If the two disagree, it terminates itself with a
 * @ref protocol_violation.
 *
 * A connection may also terminate because a command failed with an error that
 * the @ref disconnect_policy names.  In that case the caller first gets the
 * error as an ordinary @ref sql_error.  By then the termination has already
 * happened: the backend has been told to drop the socket, and the termination
 * handlers have been called.  The next attempt to use the connection throws
 * @ref connection_terminated.
 *
 * Once terminated, a connection stays terminated.  Every attempt to use it
 * throws @ref connection_terminated with the same reason.
 *
 * A connection is not thread-safe.  Use it from one thread at a time.
 */
class PGTX_LIBEXPORT connection
{
public:
  /// Take over a backend.
  explicit connection(
    std::unique_ptr<backend> back, connection_options opts = {});

  /// Connect to a database through libpq.
  /** @param conninfo A libpq connection string, e.g. "dbname=test".
   */
  explicit connection(
    std::string const &conninfo, connection_options opts = {});

  ~connection() noexcept;

  connection(connection const &) = delete;
  connection &operator=(connection const &) = delete;

  /// Execute a command outside of any transaction.
  /** Inside a @ref transaction(), use the @ref transaction_handle instead.
   * @throw usage_error if a transaction is active, or if @c opts asks for a
   * savepoint: there is no transaction for it to be part of.
   */
  result exec(
    std::string const &sql, params const &args = {},
    query_options const &opts = {});

  /// Check that the server's transaction status is what we believe it is.
  /** @throw protocol_violation on mismatch.  The connection is terminated.
   */
  void ping();

  /// Check that the connection has not been terminated.
  /** @throw connection_terminated if it has.
   */
  void poll();

  /// The transaction status we expect the server to be in.
  [[nodiscard]] transaction_status believed_status() const noexcept
  {
    return m_tracker.believed();
  }

  /// Has this connection been terminated?
  [[nodiscard]] bool is_terminated() const noexcept { return m_terminated; }

  /// Why the connection was terminated.
  /** Empty string if it was not.
   */
  [[nodiscard]] std::string const &termination_reason() const noexcept
  {
    return m_reason;
  }

  /// Does a @ref transaction() currently hold this connection?
  [[nodiscard]] bool in_transaction_context() const noexcept
  {
    return m_context != nullptr;
  }

  [[nodiscard]] connection_options const &options() const noexcept
  {
    return m_options;
  }

  /// Register a callback for when the connection terminates.
  /** Each handler gets called once, with the termination reason.  If the
   * connection is already terminated, the handler is called right away.
   */
  void on_termination(termination_handler handler);

  /// Set where this connection's log messages go.
  /** The default handler writes to standard error.  Pass an empty function
   * to discard messages.
   */
  void set_notice_handler(notice_handler handler)
  {
    m_notice_handler = std::move(handler);
  }

  /// Pass a message to the notice handler.  Should end in a newline.
  void process_notice(std::string_view msg) noexcept;

private:
  friend class internal::gate::connection_transaction;

  /// Send one command, check the resulting status, and report any error.
  result run(command_kind kind, std::string const &sql, params const &args);

  /// Verify the server's status before starting something new.
  void checkout();

  /// Throw @ref connection_terminated if terminated.
  void check_alive();

  /// Terminate, but leave it to the caller to report the error that caused it.
  void terminate_after_error(std::string const &reason) noexcept;

  /// Terminate now, and throw @ref connection_terminated.
  [[noreturn]] void terminate(std::string const &reason);

  /// Terminate now because of a status mismatch; throw @ref protocol_violation.
  [[noreturn]] void terminate_desync(std::string const &reason);

  /// Carry out a termination.  Does not throw.
  void carry_out_termination() noexcept;

  void register_context(transaction_context *ctx);
  void unregister_context(transaction_context *ctx) noexcept;
  [[nodiscard]] transaction_context *current_context() const noexcept
  {
    return m_context;
  }

  std::unique_ptr<backend> m_backend;
  connection_options m_options;
  status_tracker m_tracker;
  error_classifier m_classifier;

  /// Innermost active transaction context, if any.
  transaction_context *m_context{nullptr};

  notice_handler m_notice_handler;
  std::vector<termination_handler> m_termination_handlers;

  bool m_terminated{false};
  std::string m_reason;
};
} // namespace pgtx
#endif
