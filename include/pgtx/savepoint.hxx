/* Savepoints: rolling back part of a transaction.
 *
 * pgtx::savepoint_frame and pgtx::savepoint_scope.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_SAVEPOINT
#define PGTX_H_SAVEPOINT

#include <string>
#include <string_view>

#include "pgtx/compiler-public.hxx"
#include "pgtx/params.hxx"
#include "pgtx/result.hxx"
#include "pgtx/types.hxx"


namespace pgtx
{
/// An open query-level savepoint inside a transaction.
/** Creating a frame sends `SAVEPOINT <name>`.  The frame ends when you
 * @ref release it, which sends `RELEASE SAVEPOINT <name>`.  To undo the work
 * done since the savepoint, call @ref rollback_to first.
 *
 * A frame occupies its context's single query-frame slot, so there can be
 * only one at a time.
 *
 * If a frame goes out of scope without being released, it rolls back to the
 * savepoint and releases it.  Errors are logged, not thrown.
 */
class PGTX_LIBEXPORT savepoint_frame
{
public:
  savepoint_frame(transaction_context &ctx, std::string name);
  ~savepoint_frame() noexcept;

  savepoint_frame(savepoint_frame const &) = delete;
  savepoint_frame &operator=(savepoint_frame const &) = delete;

  [[nodiscard]] std::string const &name() const noexcept { return m_name; }
  [[nodiscard]] bool released() const noexcept { return m_released; }

  /// Send `ROLLBACK TO SAVEPOINT <name>`.  The frame stays open.
  void rollback_to();

  /// Send `RELEASE SAVEPOINT <name>`, ending the frame.
  /** The frame ends even if this fails.  A failure leaves the transaction
   * aborted, so the context is marked failed.
   */
  void release();

private:
  void end() noexcept;

  transaction_context &m_context;
  std::string const m_name;
  bool m_released{false};
};


/// Runs a single query inside its own savepoint.
/** If the query fails, the savepoint is rolled back and the enclosing
 * transaction carries on as if the query had never happened.  The savepoint
 * is released either way.  You get back the query's result or its error,
 * unless releasing the savepoint fails.  In that case you get the release
 * error, and the enclosing transaction is failed.
 */
class PGTX_LIBEXPORT savepoint_scope
{
public:
  /// Name of the query-level savepoint.
  static constexpr std::string_view frame_name{"pgtx_query"};

  explicit savepoint_scope(transaction_context &ctx) noexcept : m_context{ctx}
  {}

  /// Execute @c sql inside a savepoint.
  /** If the context has already failed, no savepoint is set; this throws
   * @ref in_failed_sql_transaction straight away.
   */
  result exec(std::string const &sql, params const &args = {});

private:
  transaction_context &m_context;
};
} // namespace pgtx
#endif
