/** Implementation of pgtx exception classes.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include <utility>

#include "pgtx/except.hxx"
#include "pgtx/internal/concat.hxx"


pgtx::failure::failure(std::string const &whatarg) :
        std::runtime_error{whatarg}
{}


pgtx::broken_connection::broken_connection() :
        failure{"Connection to database failed."}
{}


pgtx::broken_connection::broken_connection(std::string const &whatarg) :
        failure{whatarg}
{}


pgtx::connection_terminated::connection_terminated(std::string const &reason) :
        broken_connection{reason}, m_reason{reason}
{}


pgtx::protocol_violation::protocol_violation(std::string const &reason) :
        connection_terminated{reason}
{}


pgtx::sql_error::sql_error(
  std::string const &whatarg, std::string Q, char const sqlstate[]) :
        failure{whatarg},
        m_query{std::move(Q)},
        m_sqlstate{sqlstate ? sqlstate : ""}
{}


pgtx::sql_error::~sql_error() noexcept = default;


PGTX_PURE std::string const &pgtx::sql_error::query() const noexcept
{
  return m_query;
}


PGTX_PURE std::string const &pgtx::sql_error::sqlstate() const noexcept
{
  return m_sqlstate;
}


pgtx::internal_error::internal_error(std::string const &whatarg) :
        std::logic_error{internal::concat("pgtx internal error: ", whatarg)}
{}


pgtx::usage_error::usage_error(std::string const &whatarg) :
        std::logic_error{whatarg}
{}


pgtx::argument_error::argument_error(std::string const &whatarg) :
        invalid_argument{whatarg}
{}


pgtx::range_error::range_error(std::string const &whatarg) :
        out_of_range{whatarg}
{}


void PGTX_COLD pgtx::throw_sql_error(
  std::string const &Err, std::string const &Query,
  std::string const &sqlstate)
{
  // Try to establish more precise error type, and throw corresponding
  // type of exception.
  if (std::empty(sqlstate))
  {
    // No SQLSTATE at all.  Let's assume the connection is no longer usable.
    throw broken_connection{Err};
  }

  char const *const code{sqlstate.c_str()};
  switch (code[0])
  {
  case '0':
    switch (code[1])
    {
    case 'A': throw feature_not_supported{Err, Query, code};
    case '8': throw broken_connection{Err};
    case 'L':
    case 'P': throw insufficient_privilege{Err, Query, code};
    }
    break;
  case '2':
    switch (code[1])
    {
    case '2':
      if (sqlstate == "22P02")
        throw invalid_text_representation{Err, Query, code};
      throw data_exception{Err, Query, code};
    case '3':
      if (sqlstate == "23001")
        throw restrict_violation{Err, Query, code};
      if (sqlstate == "23502")
        throw not_null_violation{Err, Query, code};
      if (sqlstate == "23503")
        throw foreign_key_violation{Err, Query, code};
      if (sqlstate == "23505")
        throw unique_violation{Err, Query, code};
      if (sqlstate == "23514")
        throw check_violation{Err, Query, code};
      throw integrity_constraint_violation{Err, Query, code};
    case '5':
      if (sqlstate == "25006")
        throw read_only_sql_transaction{Err, Query, code};
      if (sqlstate == "25P01")
        throw no_active_sql_transaction{Err, Query, code};
      if (sqlstate == "25P02")
        throw in_failed_sql_transaction{Err, Query, code};
      throw invalid_transaction_state{Err, Query, code};
    }
    break;
  case '3':
    if (sqlstate == "3B000" or sqlstate == "3B001")
      throw invalid_savepoint_specification{Err, Query, code};
    break;
  case '4':
    switch (code[1])
    {
    case '0':
      if (sqlstate == "40000")
        throw transaction_rollback{Err, Query, code};
      if (sqlstate == "40001")
        throw serialization_failure{Err, Query, code};
      if (sqlstate == "40P01")
        throw deadlock_detected{Err, Query, code};
      break;
    case '2':
      if (sqlstate == "42501")
        throw insufficient_privilege{Err, Query, code};
      if (sqlstate == "42601")
        throw syntax_error{Err, Query, code};
      if (sqlstate == "42P01")
        throw undefined_table{Err, Query, code};
    }
    break;
  }

  // Unknown error code.
  throw sql_error{Err, Query, code};
}
