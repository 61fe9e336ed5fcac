/* Definition of pgtx exception classes.
 *
 * pgtx::sql_error, pgtx::broken_connection, pgtx::connection_terminated, ...
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_EXCEPT
#define PGTX_H_EXCEPT

#include <stdexcept>
#include <string>

#include "pgtx/compiler-public.hxx"


namespace pgtx
{
/**
 * @addtogroup exception Exception classes
 *
 * These exception classes follow, roughly, the two-level hierarchy defined by
 * the PostgreSQL SQLSTATE error codes (see Appendix A of the PostgreSQL
 * documentation corresponding to your server version).  This is not a complete
 * mapping though.  Codes that pgtx does not know about come out as a plain
 * @ref sql_error, with the SQLSTATE code still available.
 *
 * Two families matter most for transaction handling.  An @ref sql_error is an
 * ordinary, local failure of one command: the connection remains usable.  A
 * @ref connection_terminated means the connection is gone, for whatever
 * reason; every later attempt to use it sees the same termination reason.
 *
 * @see http://www.postgresql.org/docs/9.4/interactive/errcodes-appendix.html
 *
 * @{
 */

/// Run-time failure encountered by pgtx, similar to std::runtime_error.
struct PGTX_LIBEXPORT failure : std::runtime_error
{
  explicit failure(std::string const &);
};


/// Exception class for lost or failed backend connection.
/**
 * @warning When this happens on Unix-like systems, you may also get a SIGPIPE
 * signal.  That signal aborts the program by default, so if you wish to be
 * able to continue after a connection breaks, be sure to disarm this signal.
 */
struct PGTX_LIBEXPORT broken_connection : failure
{
  broken_connection();
  explicit broken_connection(std::string const &);
};


/// The connection has been terminated, and will not come back.
/** Termination is delivered to every party using the connection, each
 * seeing the identical @ref reason.  It may have been requested by pgtx
 * itself (a disconnect-classified server error, a transaction status
 * mismatch) or caused by the backend dropping the socket.
 */
class PGTX_LIBEXPORT connection_terminated : public broken_connection
{
public:
  explicit connection_terminated(std::string const &reason);

  /// Why the connection was terminated.
  [[nodiscard]] std::string const &reason() const noexcept { return m_reason; }

private:
  std::string m_reason;
};


/// The client's idea of the transaction status disagrees with the server's.
/** Once this happens, nothing more that was sent on the connection can be
 * trusted.  The connection is terminated; the error never shows up as an
 * ordinary @ref sql_error.
 */
struct PGTX_LIBEXPORT protocol_violation : connection_terminated
{
  explicit protocol_violation(std::string const &reason);
};


/// Exception class for failed queries.
/** Carries, in addition to an error message, the actual query that failed and
 * the SQLSTATE code the server reported for it.
 */
class PGTX_LIBEXPORT sql_error : public failure
{
  /// Query string.  Empty if unknown.
  std::string const m_query;
  /// SQLSTATE string describing the error type, if known; or empty string.
  std::string const m_sqlstate;

public:
  explicit sql_error(
    std::string const &whatarg = "", std::string Q = "",
    char const sqlstate[] = nullptr);
  virtual ~sql_error() noexcept override;

  /// The query whose execution triggered the exception
  [[nodiscard]] PGTX_PURE std::string const &query() const noexcept;

  /// SQLSTATE error code if known, or empty string otherwise.
  [[nodiscard]] PGTX_PURE std::string const &sqlstate() const noexcept;
};


/// Internal error in pgtx library
struct PGTX_LIBEXPORT internal_error : std::logic_error
{
  explicit internal_error(std::string const &);
};


/// Error in usage of pgtx library, similar to std::logic_error
struct PGTX_LIBEXPORT usage_error : std::logic_error
{
  explicit usage_error(std::string const &);
};


/// Invalid argument passed to pgtx, similar to std::invalid_argument
struct PGTX_LIBEXPORT argument_error : std::invalid_argument
{
  explicit argument_error(std::string const &);
};


/// Something is out of range, similar to std::out_of_range
struct PGTX_LIBEXPORT range_error : std::out_of_range
{
  explicit range_error(std::string const &);
};


/// Query returned an unexpected number of rows.
struct PGTX_LIBEXPORT unexpected_rows : public range_error
{
  explicit unexpected_rows(std::string const &msg) : range_error{msg} {}
};


/// Database feature not supported in current setup.
struct PGTX_LIBEXPORT feature_not_supported : sql_error
{
  explicit feature_not_supported(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          sql_error{err, Q, sqlstate}
  {}
};

/// Error in data provided to SQL statement.
struct PGTX_LIBEXPORT data_exception : sql_error
{
  explicit data_exception(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          sql_error{err, Q, sqlstate}
  {}
};

/// A parameter or literal could not be read as a value of its type.
struct PGTX_LIBEXPORT invalid_text_representation : data_exception
{
  explicit invalid_text_representation(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          data_exception{err, Q, sqlstate}
  {}
};

struct PGTX_LIBEXPORT integrity_constraint_violation : sql_error
{
  explicit integrity_constraint_violation(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          sql_error{err, Q, sqlstate}
  {}
};

struct PGTX_LIBEXPORT restrict_violation : integrity_constraint_violation
{
  explicit restrict_violation(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          integrity_constraint_violation{err, Q, sqlstate}
  {}
};

struct PGTX_LIBEXPORT not_null_violation : integrity_constraint_violation
{
  explicit not_null_violation(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          integrity_constraint_violation{err, Q, sqlstate}
  {}
};

struct PGTX_LIBEXPORT foreign_key_violation : integrity_constraint_violation
{
  explicit foreign_key_violation(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          integrity_constraint_violation{err, Q, sqlstate}
  {}
};

struct PGTX_LIBEXPORT unique_violation : integrity_constraint_violation
{
  explicit unique_violation(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          integrity_constraint_violation{err, Q, sqlstate}
  {}
};

struct PGTX_LIBEXPORT check_violation : integrity_constraint_violation
{
  explicit check_violation(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          integrity_constraint_violation{err, Q, sqlstate}
  {}
};

/// Command not allowed in the current transaction state (SQLSTATE class 25).
struct PGTX_LIBEXPORT invalid_transaction_state : sql_error
{
  explicit invalid_transaction_state(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          sql_error{err, Q, sqlstate}
  {}
};

/// Attempt to modify data in a read-only transaction.
struct PGTX_LIBEXPORT read_only_sql_transaction : invalid_transaction_state
{
  explicit read_only_sql_transaction(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          invalid_transaction_state{err, Q, sqlstate}
  {}
};

/// Command requires a transaction block, but none is open.
struct PGTX_LIBEXPORT no_active_sql_transaction : invalid_transaction_state
{
  explicit no_active_sql_transaction(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          invalid_transaction_state{err, Q, sqlstate}
  {}
};

/// The transaction has failed; commands are ignored until rollback.
/** pgtx also generates this error itself, without contacting the server, for
 * any command you attempt in a transaction that it knows to have failed.
 */
struct PGTX_LIBEXPORT in_failed_sql_transaction : invalid_transaction_state
{
  explicit in_failed_sql_transaction(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          invalid_transaction_state{err, Q, sqlstate}
  {}
};

/// Savepoint does not exist, or cannot be used in this way.
struct PGTX_LIBEXPORT invalid_savepoint_specification : sql_error
{
  explicit invalid_savepoint_specification(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          sql_error{err, Q, sqlstate}
  {}
};

/// The backend saw itself forced to roll back the ongoing transaction.
struct PGTX_LIBEXPORT transaction_rollback : sql_error
{
  explicit transaction_rollback(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          sql_error{err, Q, sqlstate}
  {}
};

/// Transaction failed to serialize.  Please retry it.
/** Can only happen at transaction isolation levels REPEATABLE READ and
 * SERIALIZABLE.
 */
struct PGTX_LIBEXPORT serialization_failure : transaction_rollback
{
  explicit serialization_failure(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          transaction_rollback{err, Q, sqlstate}
  {}
};

/// The ongoing transaction has deadlocked.  Retrying it may help.
struct PGTX_LIBEXPORT deadlock_detected : transaction_rollback
{
  explicit deadlock_detected(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          transaction_rollback{err, Q, sqlstate}
  {}
};

struct PGTX_LIBEXPORT syntax_error : sql_error
{
  explicit syntax_error(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          sql_error{err, Q, sqlstate}
  {}
};

struct PGTX_LIBEXPORT undefined_table : syntax_error
{
  explicit undefined_table(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          syntax_error{err, Q, sqlstate}
  {}
};

struct PGTX_LIBEXPORT insufficient_privilege : sql_error
{
  explicit insufficient_privilege(
    std::string const &err, std::string const &Q = "",
    char const sqlstate[] = nullptr) :
          sql_error{err, Q, sqlstate}
  {}
};


/// Throw the most specific @ref sql_error subclass for a SQLSTATE code.
/** An empty SQLSTATE means we have no idea what happened on the other end.
 * That gets reported as a @ref broken_connection.
 */
[[noreturn]] PGTX_LIBEXPORT void throw_sql_error(
  std::string const &err, std::string const &query,
  std::string const &sqlstate);

/**
 * @}
 */
} // namespace pgtx
#endif
