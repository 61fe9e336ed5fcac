/* Definition of the pgtx::transaction_context class.
 *
 * pgtx::transaction_context holds the state of one transaction() call.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_TRANSACTION_CONTEXT
#define PGTX_H_TRANSACTION_CONTEXT

#include <memory>
#include <string>

#include "pgtx/compiler-public.hxx"
#include "pgtx/params.hxx"
#include "pgtx/result.hxx"
#include "pgtx/types.hxx"


namespace pgtx::internal::gate
{
class transaction_context_savepoint_frame;
} // namespace pgtx::internal::gate


namespace pgtx
{
/// State of one @ref transaction() call, while it runs.
/** A context lives on the stack of the @ref transaction() call that created
 * it.  It registers itself with its connection, so that the connection knows
 * which transaction it is working for.  Naive transactions may nest: a
 * context created while another is active becomes that one's child, and the
 * parent becomes current again when the child is destroyed.
 *
 * Once a command in the context fails, the context is "failed."  From then on
 * it refuses everything except rollback, without even bothering the server:
 * the server would refuse it anyway.
 */
class PGTX_LIBEXPORT transaction_context
{
public:
  /// Enter a new transaction context on @c cx.
  /** @throw usage_error if a strict transaction is requested while another
   * transaction is active, or a naive one while the connection is not inside
   * a transaction block.
   */
  transaction_context(connection &cx, strategy s);
  ~transaction_context() noexcept;

  transaction_context(transaction_context const &) = delete;
  transaction_context &operator=(transaction_context const &) = delete;

  /// Execute a command as part of this transaction.
  /** @throw in_failed_sql_transaction if the context has failed and the
   * command is anything other than a rollback or a savepoint release.  This
   * happens without contacting the server.
   */
  result exec(command_kind kind, std::string const &sql, params const &args);

  [[nodiscard]] connection &conn() const noexcept { return m_conn; }
  [[nodiscard]] strategy get_strategy() const noexcept { return m_strategy; }

  /// Enclosing context for a nested transaction; null for a top-level one.
  [[nodiscard]] transaction_context *parent() const noexcept
  {
    return m_parent;
  }

  [[nodiscard]] bool failed() const noexcept { return m_failed; }
  void mark_failed() noexcept { m_failed = true; }

  /// Has this transaction been committed or rolled back?
  [[nodiscard]] bool closed() const noexcept { return m_closed; }
  void close() noexcept { m_closed = true; }

  /// Generate a fresh savepoint name: "pgtx_savepoint_<n>".
  /** Nested contexts draw from their top-level ancestor's counter, so no two
   * names in one transaction block are alike.
   */
  [[nodiscard]] std::string next_savepoint_name();

  /// The query-level savepoint that is currently open, if any.
  [[nodiscard]] savepoint_frame *query_frame() const noexcept
  {
    return m_frame;
  }

  /// Shared slot holding a pointer to this context, or null once it's gone.
  /** Handles hold on to this, so they can tell when they have outlived their
   * transaction.
   */
  [[nodiscard]] std::shared_ptr<transaction_context *> const &
  slot() const noexcept
  {
    return m_slot;
  }

private:
  friend class internal::gate::transaction_context_savepoint_frame;
  void register_frame(savepoint_frame *frame);
  void unregister_frame(savepoint_frame *frame) noexcept;

  /// Check that a new context can start on @c cx, and return its parent.
  static transaction_context *enter(connection &cx, strategy s);

  [[noreturn]] void throw_failed(std::string const &sql) const;

  connection &m_conn;
  strategy const m_strategy;
  transaction_context *const m_parent;
  savepoint_frame *m_frame{nullptr};
  bool m_failed{false};
  bool m_closed{false};
  unsigned m_savepoint_counter{0};
  std::shared_ptr<transaction_context *> m_slot;
};
} // namespace pgtx
#endif
