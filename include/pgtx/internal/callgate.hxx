#ifndef PGTX_H_CALLGATE
#define PGTX_H_CALLGATE

#include "pgtx/compiler-public.hxx"

namespace pgtx::internal
{
/// Base class for call gates.
/** A gate exposes a few private members of its home class to one or two
 * friend classes, and nothing else.  A transaction reaches a connection's
 * round-trip path through gate::connection_transaction; a savepoint frame
 * registers with its transaction context through
 * gate::transaction_context_savepoint_frame.
 *
 * The home class befriends the gate, and the gate befriends its clients.
 * Gate members are private and reach the home object through @c home().
 */
template<typename HOME> class PGTX_PRIVATE callgate
{
protected:
  using super = callgate<HOME>;
  using reference = HOME &;

  explicit callgate(reference x) : m_home(x) {}

  [[nodiscard]] reference home() const noexcept { return m_home; }

private:
  reference m_home;
};
} // namespace pgtx::internal

#endif
