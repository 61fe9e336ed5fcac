/* Per-connection configuration.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_OPTIONS
#define PGTX_H_OPTIONS

#include <string>
#include <string_view>

#include "pgtx/compiler-public.hxx"
#include "pgtx/error_classifier.hxx"
#include "pgtx/types.hxx"


namespace pgtx
{
/// Options for a @ref connection.
/** You can fill these in directly, or parse them from a string in the manner
 * of a libpq connection string:
 *
 * ```
 * transactions=naive disconnect_on_error_codes=read_only_sql_transaction
 * ```
 *
 * Keys:
 * - `transactions`: `strict` (the default) or `naive`.
 * - `disconnect_on_error_codes`: comma-separated SQLSTATE codes or condition
 *   names.  See @ref disconnect_policy.
 */
struct PGTX_LIBEXPORT connection_options
{
  /// How @ref transaction() delimits its work by default.
  strategy transactions{strategy::strict};

  /// Server errors that should cause the connection to be dropped.
  disconnect_policy disconnect_on_error_codes;

  /// Parse whitespace-separated `key=value` pairs.
  /** @throw argument_error on unknown keys, or bad values.
   */
  [[nodiscard]] static connection_options parse(std::string_view text);

  /// Read options from the environment.
  /** Reads `PGTX_TRANSACTIONS` and `PGTX_DISCONNECT_ON_ERROR_CODES`, where
   * set.  Anything not set keeps its default.
   */
  [[nodiscard]] static connection_options from_env();

  /// Set one option by name, the same way @ref parse does.
  void set(std::string_view key, std::string_view value);
};


/// Parse a strategy name: "strict" or "naive".
[[nodiscard]] PGTX_LIBEXPORT strategy parse_strategy(std::string_view name);
} // namespace pgtx
#endif
