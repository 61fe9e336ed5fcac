#include <pgtx/internal/callgate.hxx>

#include <string>

#include "pgtx/connection.hxx"

namespace pgtx::internal::gate
{
class PGTX_PRIVATE connection_transaction : callgate<connection>
{
  friend class pgtx::transaction_context;
  friend class pgtx::transaction_manager;

  connection_transaction(reference x) : super(x) {}

  result run(command_kind kind, std::string const &sql, params const &args)
  {
    return home().run(kind, sql, args);
  }

  void checkout() { home().checkout(); }
  void check_alive() { home().check_alive(); }

  void register_context(transaction_context *ctx)
  {
    home().register_context(ctx);
  }
  void unregister_context(transaction_context *ctx) noexcept
  {
    home().unregister_context(ctx);
  }
  transaction_context *current_context() const noexcept
  {
    return home().current_context();
  }
};
} // namespace pgtx::internal::gate
