/* Client-side belief about the server's transaction status.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_STATUS_TRACKER
#define PGTX_H_STATUS_TRACKER

#include <string>

#include "pgtx/compiler-public.hxx"
#include "pgtx/types.hxx"


namespace pgtx
{
/// Outcome of checking our belief against the server's reported status.
struct PGTX_LIBEXPORT status_verdict
{
  bool ok{true};
  transaction_status expected{transaction_status::idle};
  transaction_status observed{transaction_status::idle};

  /// Description of a mismatch: "unexpected status: <observed>".
  [[nodiscard]] std::string message() const;
};


/// Tracks which transaction status the server should be in.
/** After every round trip, the connection tells the tracker what kind of
 * command it sent, whether it failed, and what status the server reported.
 * The tracker works out what the status should have been, and reports a
 * mismatch if the two disagree.  A mismatch means the client has lost track
 * of the server's state, and nothing sent on the connection can be trusted.
 *
 * A lenient tracker, as used on connections whose outer transactions are
 * managed by the caller, adopts whatever status the server reports after a
 * plain statement.  It still checks the commands pgtx issues itself.
 */
class PGTX_LIBEXPORT status_tracker
{
public:
  explicit status_tracker(bool lenient = false) noexcept :
          m_lenient{lenient}
  {}

  /// Status we currently expect the server to be in.
  [[nodiscard]] transaction_status believed() const noexcept
  {
    return m_believed;
  }

  [[nodiscard]] bool lenient() const noexcept { return m_lenient; }

  /// Status we expect after a command of the given kind.
  [[nodiscard]] transaction_status
  expect(command_kind kind, bool error) const noexcept;

  /// Record a completed round trip.
  /** On a match, the belief moves to the new status.  On a mismatch it is
   * left alone; the connection will not be used again anyway.
   */
  status_verdict
  update(command_kind kind, bool error, transaction_status observed) noexcept;

  /// Compare belief to server status without having sent a command.
  [[nodiscard]] status_verdict
  verify(transaction_status observed) const noexcept;

  /// Forget everything; back to idle.
  void reset() noexcept { m_believed = transaction_status::idle; }

private:
  transaction_status m_believed{transaction_status::idle};
  bool m_lenient;
};
} // namespace pgtx
#endif
