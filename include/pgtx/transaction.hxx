/* Definition of pgtx::transaction() and its supporting classes.
 *
 * pgtx::transaction() runs a function inside a transaction, and commits or
 * rolls back depending on how that function ends.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_TRANSACTION
#define PGTX_H_TRANSACTION

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "pgtx/compiler-public.hxx"
#include "pgtx/connection.hxx"
#include "pgtx/except.hxx"
#include "pgtx/savepoint.hxx"
#include "pgtx/transaction_context.hxx"


namespace pgtx::internal
{
/// Thrown by @ref transaction_handle::rollback to unwind the body.
/** Deliberately not derived from @c std::exception, so that code in the body
 * which catches @c std::exception does not intercept it.
 */
class PGTX_LIBEXPORT rollback_request
{
public:
  rollback_request(transaction_context const *target, std::string reason) :
          m_target{target}, m_reason{std::move(reason)}
  {}

  /// The context whose @ref transaction() call should roll back.
  [[nodiscard]] transaction_context const *target() const noexcept
  {
    return m_target;
  }

  [[nodiscard]] std::string const &reason() const noexcept { return m_reason; }

private:
  transaction_context const *m_target;
  std::string m_reason;
};
} // namespace pgtx::internal


namespace pgtx
{
/// Rollback reason when a transaction fails to commit.
inline constexpr std::string_view implicit_rollback_reason{"rollback"};


/// How a @ref transaction() call ended: committed with a value, or rolled back.
template<typename T> class outcome
{
public:
  using value_type = T;

  [[nodiscard]] static outcome success(T value)
  {
    outcome out;
    out.m_value.emplace(std::move(value));
    return out;
  }

  [[nodiscard]] static outcome rollback(std::string reason)
  {
    outcome out;
    out.m_reason = std::move(reason);
    return out;
  }

  /// Did the transaction commit?
  [[nodiscard]] bool committed() const noexcept { return m_value.has_value(); }
  [[nodiscard]] bool rolled_back() const noexcept { return not committed(); }
  explicit operator bool() const noexcept { return committed(); }

  /// The body's return value.
  /** @throw usage_error if the transaction was rolled back.
   */
  [[nodiscard]] T &value() &
  {
    check_committed();
    return *m_value;
  }
  [[nodiscard]] T const &value() const &
  {
    check_committed();
    return *m_value;
  }
  [[nodiscard]] T &&value() &&
  {
    check_committed();
    return std::move(*m_value);
  }

  /// Why the transaction was rolled back.  Empty if it committed.
  [[nodiscard]] std::string const &reason() const noexcept { return m_reason; }

private:
  outcome() = default;

  void check_committed() const
  {
    if (not committed())
      throw usage_error{
        "Asked for the value of a transaction that was rolled back (" +
        m_reason + ")."};
  }

  std::optional<T> m_value;
  std::string m_reason;
};


/// Outcome of a @ref transaction() whose body returns nothing.
template<> class outcome<void>
{
public:
  using value_type = void;

  [[nodiscard]] static outcome success()
  {
    outcome out;
    out.m_committed = true;
    return out;
  }

  [[nodiscard]] static outcome rollback(std::string reason)
  {
    outcome out;
    out.m_reason = std::move(reason);
    return out;
  }

  [[nodiscard]] bool committed() const noexcept { return m_committed; }
  [[nodiscard]] bool rolled_back() const noexcept { return not m_committed; }
  explicit operator bool() const noexcept { return committed(); }

  [[nodiscard]] std::string const &reason() const noexcept { return m_reason; }

private:
  outcome() = default;

  bool m_committed{false};
  std::string m_reason;
};


/// What the body of a @ref transaction() uses to talk to the database.
/** A handle is only good for as long as its @ref transaction() call runs.
 * Copies of it are fine, but using any of them after the call has returned
 * throws @ref usage_error.
 */
class PGTX_LIBEXPORT transaction_handle
{
public:
  /// Execute a command in the transaction.
  /** Pass @c query_options{true} to run the command in its own savepoint;
   * see @ref savepoint_scope.
   */
  result exec(
    std::string const &sql, params const &args = {},
    query_options const &opts = {});

  /// Roll back the transaction, and leave the body.
  /** The @ref transaction() call that produced this handle returns an
   * outcome that is rolled back, with @c reason.  If nested transactions
   * are active, they are rolled back on the way out.
   */
  [[noreturn]] void rollback(std::string reason = "rollback");

  /// Has a command in this transaction failed?
  [[nodiscard]] bool failed() const;

  [[nodiscard]] strategy get_strategy() const;

private:
  friend class transaction_manager;
  explicit transaction_handle(std::shared_ptr<transaction_context *> slot) :
          m_slot{std::move(slot)}
  {}

  [[nodiscard]] transaction_context &context() const;

  std::shared_ptr<transaction_context *> m_slot;
};


/// Begins, commits, and rolls back the transaction of one transaction() call.
/** You won't normally use this directly; @ref transaction() does it for you.
 *
 * A strict transaction manager issues BEGIN when it is constructed, and
 * COMMIT or ROLLBACK at the end.
 *
 * A naive transaction manager assumes that somebody else has opened a
 * transaction block already.  It sets a savepoint as its "anchor."  To commit
 * it releases the anchor.  To roll back it rolls back to the anchor and then
 * releases it.  Work done before the naive transaction started is never
 * affected.
 *
 * If the manager is destroyed before it commits or rolls back, it rolls back.
 */
class PGTX_LIBEXPORT transaction_manager
{
public:
  transaction_manager(connection &cx, strategy s);
  ~transaction_manager() noexcept;

  transaction_manager(transaction_manager const &) = delete;
  transaction_manager &operator=(transaction_manager const &) = delete;

  [[nodiscard]] transaction_handle handle() const
  {
    return transaction_handle{m_context.slot()};
  }

  /// Commit the transaction.
  /** @return True if it committed; false if it had to be rolled back instead.
   */
  [[nodiscard]] bool commit();

  /// Roll back the transaction.
  void rollback();

  /// Roll back as part of unwinding from an error.
  /** If the connection has been terminated, this throws
   * @ref connection_terminated instead.  Otherwise,
   * errors are logged but not thrown.
   */
  void abandon();

  /// Is @c req meant for this transaction?
  [[nodiscard]] bool
  is_target(internal::rollback_request const &req) const noexcept
  {
    return req.target() == &m_context;
  }

  [[nodiscard]] transaction_context const &context() const noexcept
  {
    return m_context;
  }

  /// Name of a naive transaction's anchor savepoint.  Empty if there is none.
  [[nodiscard]] std::string const &anchor() const noexcept { return m_anchor; }

private:
  void strict_rollback();
  /// Roll back to the anchor and release it.  False if either step failed.
  [[nodiscard]] bool naive_rollback();
  void rollback_quietly() noexcept;

  connection &m_conn;
  transaction_context m_context;
  std::string m_anchor;
  bool m_done{false};
};


/// Run @c body inside a transaction.
/** Calls @c body with a @ref transaction_handle.  If @c body returns
 * normally, the transaction commits and you get its return value as a
 * successful @ref outcome.  If it calls @ref transaction_handle::rollback,
 * you get a rolled-back outcome with the reason it gave.
 *
 * If a command in a strict transaction failed and the body returns anyway,
 * the commit turns into a rollback, and the outcome's reason is "rollback".
 * A naive transaction in that situation rolls back to its anchor, and still
 * returns the body's value as a success.  Server errors while committing or
 * rolling back are logged, and make the outcome a rollback; they are not
 * thrown.
 *
 * If @c body throws, the transaction is rolled back and the exception
 * propagates.  If the connection was terminated in the meantime, you get a
 * @ref connection_terminated instead.
 *
 * @param s Transaction strategy.  See @ref strategy.
 */
template<typename BODY>
auto transaction(connection &cx, BODY &&body, strategy s)
  -> outcome<std::decay_t<std::invoke_result_t<BODY &, transaction_handle &>>>
{
  using value_type =
    std::decay_t<std::invoke_result_t<BODY &, transaction_handle &>>;

  transaction_manager tm{cx, s};
  try
  {
    auto h{tm.handle()};
    if constexpr (std::is_void_v<value_type>)
    {
      std::invoke(body, h);
      if (tm.commit())
        return outcome<void>::success();
    }
    else
    {
      value_type value{std::invoke(body, h)};
      if (tm.commit())
        return outcome<value_type>::success(std::move(value));
    }
    return outcome<value_type>::rollback(std::string{implicit_rollback_reason});
  }
  catch (connection_terminated const &)
  {
    // Nothing left to roll back.
    throw;
  }
  catch (internal::rollback_request const &req)
  {
    if (not tm.is_target(req))
    {
      tm.abandon();
      throw;
    }
    tm.rollback();
    return outcome<value_type>::rollback(req.reason());
  }
  catch (...)
  {
    tm.abandon();
    throw;
  }
}


/// Run @c body in a transaction, using the connection's default strategy.
template<typename BODY>
auto transaction(connection &cx, BODY &&body)
{
  return transaction(cx, std::forward<BODY>(body), cx.options().transactions);
}
} // namespace pgtx
#endif
