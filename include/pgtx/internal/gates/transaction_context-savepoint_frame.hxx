#include <pgtx/internal/callgate.hxx>

#include "pgtx/transaction_context.hxx"

namespace pgtx::internal::gate
{
class PGTX_PRIVATE transaction_context_savepoint_frame
        : callgate<transaction_context>
{
  friend class pgtx::savepoint_frame;

  transaction_context_savepoint_frame(reference x) : super(x) {}

  void register_frame(savepoint_frame *frame) { home().register_frame(frame); }
  void unregister_frame(savepoint_frame *frame) noexcept
  {
    home().unregister_frame(frame);
  }
};
} // namespace pgtx::internal::gate
