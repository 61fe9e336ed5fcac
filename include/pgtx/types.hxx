/* Basic type aliases and forward declarations.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_TYPES
#define PGTX_H_TYPES

#include <string_view>

#include "pgtx/compiler-public.hxx"

namespace pgtx
{
/// The backend's transaction status, as reported after every round trip.
enum class transaction_status
{
  /// Not inside a transaction block.
  idle,
  /// Inside a healthy transaction block.
  in_transaction,
  /// Inside a failed transaction block; commands are rejected until rollback.
  failed,
};


/// How @ref transaction() delimits its work.
enum class strategy
{
  /// The library issues BEGIN, COMMIT, and ROLLBACK itself.
  strict,
  /// The caller opened a transaction already; we anchor on a savepoint.
  naive,
};


/// Category of a command, as far as transaction status is concerned.
/** Control commands issued by the library itself carry their own kind.  Any
 * SQL the caller passes in is a `statement`, regardless of its text.
 */
enum class command_kind
{
  begin,
  commit,
  rollback,
  savepoint,
  release,
  rollback_to,
  statement,
};


/// Name for a transaction status: "idle", "in_transaction", or "failed".
[[nodiscard]] PGTX_LIBEXPORT std::string_view
to_string(transaction_status) noexcept;

/// Name for a strategy: "strict" or "naive".
[[nodiscard]] PGTX_LIBEXPORT std::string_view to_string(strategy) noexcept;

/// Name for a command kind, e.g. "savepoint".
[[nodiscard]] PGTX_LIBEXPORT std::string_view to_string(command_kind) noexcept;


class backend;
class connection;
class error_classifier;
class params;
class result;
class savepoint_frame;
class savepoint_scope;
class status_tracker;
class transaction_context;
class transaction_handle;
class transaction_manager;
struct connection_options;
struct query_options;
} // namespace pgtx
#endif
