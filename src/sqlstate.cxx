/** SQLSTATE codes and condition names.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include <array>
#include <cctype>
#include <utility>

#include "pgtx/sqlstate.hxx"


namespace
{
using namespace std::literals;

/// Condition names from Appendix A of the PostgreSQL documentation.
/** Not complete; these are the ones a disconnect policy is likely to name.
 */
constexpr std::array<std::pair<std::string_view, std::string_view>, 52>
  conditions{{
    {"successful_completion"sv, "00000"sv},
    {"connection_exception"sv, "08000"sv},
    {"connection_does_not_exist"sv, "08003"sv},
    {"connection_failure"sv, "08006"sv},
    {"protocol_violation"sv, "08P01"sv},
    {"feature_not_supported"sv, "0A000"sv},
    {"data_exception"sv, "22000"sv},
    {"string_data_right_truncation"sv, "22001"sv},
    {"numeric_value_out_of_range"sv, "22003"sv},
    {"null_value_not_allowed"sv, "22004"sv},
    {"invalid_datetime_format"sv, "22007"sv},
    {"division_by_zero"sv, "22012"sv},
    {"invalid_text_representation"sv, "22P02"sv},
    {"integrity_constraint_violation"sv, "23000"sv},
    {"restrict_violation"sv, "23001"sv},
    {"not_null_violation"sv, "23502"sv},
    {"foreign_key_violation"sv, "23503"sv},
    {"unique_violation"sv, "23505"sv},
    {"check_violation"sv, "23514"sv},
    {"exclusion_violation"sv, "23P01"sv},
    {"invalid_transaction_state"sv, "25000"sv},
    {"active_sql_transaction"sv, "25001"sv},
    {"branch_transaction_already_active"sv, "25002"sv},
    {"read_only_sql_transaction"sv, "25006"sv},
    {"no_active_sql_transaction"sv, "25P01"sv},
    {"in_failed_sql_transaction"sv, "25P02"sv},
    {"idle_in_transaction_session_timeout"sv, "25P03"sv},
    {"invalid_sql_statement_name"sv, "26000"sv},
    {"invalid_authorization_specification"sv, "28000"sv},
    {"invalid_password"sv, "28P01"sv},
    {"invalid_transaction_termination"sv, "2D000"sv},
    {"invalid_cursor_name"sv, "34000"sv},
    {"invalid_savepoint_specification"sv, "3B001"sv},
    {"transaction_rollback"sv, "40000"sv},
    {"serialization_failure"sv, "40001"sv},
    {"deadlock_detected"sv, "40P01"sv},
    {"syntax_error_or_access_rule_violation"sv, "42000"sv},
    {"insufficient_privilege"sv, "42501"sv},
    {"syntax_error"sv, "42601"sv},
    {"undefined_column"sv, "42703"sv},
    {"undefined_function"sv, "42883"sv},
    {"undefined_table"sv, "42P01"sv},
    {"duplicate_table"sv, "42P07"sv},
    {"too_many_connections"sv, "53300"sv},
    {"out_of_memory"sv, "53200"sv},
    {"disk_full"sv, "53100"sv},
    {"query_canceled"sv, "57014"sv},
    {"admin_shutdown"sv, "57P01"sv},
    {"crash_shutdown"sv, "57P02"sv},
    {"cannot_connect_now"sv, "57P03"sv},
    {"database_dropped"sv, "57P04"sv},
    {"internal_error"sv, "XX000"sv},
  }};
} // namespace


bool pgtx::sqlstate::is_code(std::string_view text) noexcept
{
  if (std::size(text) != 5)
    return false;
  for (char const c : text)
    if (not std::isdigit(static_cast<unsigned char>(c)) and
        not std::isupper(static_cast<unsigned char>(c)))
      return false;
  return true;
}


std::string_view pgtx::sqlstate::code_for(std::string_view condition) noexcept
{
  for (auto const &[name, code] : conditions)
    if (name == condition)
      return code;
  return {};
}


std::string_view pgtx::sqlstate::name_for(std::string_view code) noexcept
{
  for (auto const &[name, c] : conditions)
    if (c == code)
      return name;
  return {};
}
