/* SQLSTATE error codes and their PostgreSQL condition names.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_SQLSTATE
#define PGTX_H_SQLSTATE

#include <string_view>

#include "pgtx/compiler-public.hxx"


/// SQLSTATE codes that pgtx itself needs to know about.
namespace pgtx::sqlstate
{
using namespace std::literals;

inline constexpr auto unique_violation{"23505"sv};
inline constexpr auto invalid_text_representation{"22P02"sv};
inline constexpr auto read_only_sql_transaction{"25006"sv};
inline constexpr auto no_active_sql_transaction{"25P01"sv};
inline constexpr auto in_failed_sql_transaction{"25P02"sv};
inline constexpr auto invalid_savepoint_specification{"3B001"sv};
inline constexpr auto syntax_error{"42601"sv};
inline constexpr auto undefined_table{"42P01"sv};


/// Is `text` shaped like a SQLSTATE code: five digits or uppercase letters?
[[nodiscard]] PGTX_LIBEXPORT bool is_code(std::string_view text) noexcept;

/// Look up the SQLSTATE code for a condition name, e.g. "unique_violation".
/** @return The code, or an empty view if the name is not one we know.
 */
[[nodiscard]] PGTX_LIBEXPORT std::string_view
code_for(std::string_view condition) noexcept;

/// Look up the condition name for a SQLSTATE code, e.g. "23505".
/** @return The name, or an empty view if the code is not one we know.
 */
[[nodiscard]] PGTX_LIBEXPORT std::string_view
name_for(std::string_view code) noexcept;
} // namespace pgtx::sqlstate
#endif
