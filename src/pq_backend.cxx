/** Implementation of the pgtx::pq_backend class.
 *
 * pgtx::pq_backend talks to a real PostgreSQL server through libpq.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include <memory>
#include <new>
#include <vector>

extern "C"
{
#include <libpq-fe.h>
}

#include "pgtx/except.hxx"
#include "pgtx/internal/concat.hxx"
#include "pgtx/pq_backend.hxx"


extern "C"
{
void pgtx_notice_processor(void *backend, char const *msg)
{
  if (backend != nullptr and msg != nullptr)
    static_cast<pgtx::pq_backend *>(backend)->process_notice(msg);
}
}


namespace
{
/// Owning pointer to a libpq result.
using pq_result = std::unique_ptr<PGresult, void (*)(PGresult *)>;


void clear_result(PGresult *res) noexcept
{
  PQclear(res);
}


std::string error_field(PGresult const *res, int field)
{
  char const *const value{PQresultErrorField(res, field)};
  return (value == nullptr) ? std::string{} : std::string{value};
}


/// Copy a successful libpq result into a pgtx::result.
pgtx::result
make_result(PGresult const *res, std::string const &sql)
{
  auto const columns{PQnfields(res)}, rows{PQntuples(res)};
  std::vector<std::string> names;
  names.reserve(static_cast<std::size_t>(columns));
  for (int c{0}; c < columns; ++c) names.emplace_back(PQfname(res, c));

  std::vector<pgtx::result::row> data;
  data.reserve(static_cast<std::size_t>(rows));
  for (int r{0}; r < rows; ++r)
  {
    pgtx::result::row row;
    row.reserve(static_cast<std::size_t>(columns));
    for (int c{0}; c < columns; ++c)
      if (PQgetisnull(res, r, c))
        row.emplace_back();
      else
        row.emplace_back(
          std::string{PQgetvalue(res, r, c),
                      static_cast<std::size_t>(PQgetlength(res, r, c))});
    data.push_back(std::move(row));
  }
  return pgtx::result{sql, PQcmdStatus(const_cast<PGresult *>(res)),
                      std::move(names), std::move(data)};
}
} // namespace


pgtx::pq_backend::pq_backend(std::string const &conninfo) :
        m_conn{PQconnectdb(conninfo.c_str())}
{
  if (m_conn == nullptr)
    throw std::bad_alloc{};
  if (PQstatus(m_conn) != CONNECTION_OK)
  {
    std::string const msg{PQerrorMessage(m_conn)};
    close();
    throw broken_connection{msg};
  }
  PQsetNoticeProcessor(m_conn, pgtx_notice_processor, this);
}


pgtx::pq_backend::~pq_backend() noexcept
{
  close();
}


pgtx::reply
pgtx::pq_backend::execute(std::string const &sql, params const &args)
{
  if (m_conn == nullptr)
    throw broken_connection{"No connection to database."};

  PGresult *raw{nullptr};
  if (args.empty())
  {
    raw = PQexec(m_conn, sql.c_str());
  }
  else
  {
    auto const &values{args.values()};
    std::vector<char const *> pointers;
    pointers.reserve(std::size(values));
    for (auto const &value : values)
      pointers.push_back(value.has_value() ? value->c_str() : nullptr);
    raw = PQexecParams(
      m_conn, sql.c_str(), static_cast<int>(std::size(pointers)), nullptr,
      pointers.data(), nullptr, nullptr, 0);
  }

  if (raw == nullptr)
    throw broken_connection{err_msg()};
  pq_result const res{raw, clear_result};

  switch (PQresultStatus(res.get()))
  {
  case PGRES_EMPTY_QUERY:
  case PGRES_COMMAND_OK:
  case PGRES_TUPLES_OK: return reply{make_result(res.get(), sql), {}};

  case PGRES_BAD_RESPONSE:
  case PGRES_NONFATAL_ERROR:
  case PGRES_FATAL_ERROR: break;

  default:
    throw feature_not_supported{
      internal::concat("Unsupported result status for query: ", sql)};
  }

  server_error err;
  err.sqlstate = error_field(res.get(), PG_DIAG_SQLSTATE);
  if (std::empty(err.sqlstate) or PQstatus(m_conn) != CONNECTION_OK)
  {
    // No SQLSTATE at all.  Let's assume the connection is no longer usable.
    throw broken_connection{PQresultErrorMessage(res.get())};
  }
  err.severity = error_field(res.get(), PG_DIAG_SEVERITY);
  err.message = error_field(res.get(), PG_DIAG_MESSAGE_PRIMARY);
  err.detail = error_field(res.get(), PG_DIAG_MESSAGE_DETAIL);
  return reply{result{}, std::move(err)};
}


pgtx::transaction_status pgtx::pq_backend::current_status() const
{
  if (m_conn == nullptr)
    throw broken_connection{"No connection to database."};
  switch (PQtransactionStatus(m_conn))
  {
  case PQTRANS_IDLE: return transaction_status::idle;
  case PQTRANS_INTRANS: return transaction_status::in_transaction;
  case PQTRANS_INERROR: return transaction_status::failed;
  case PQTRANS_ACTIVE:
    throw internal_error{"Connection is still busy with a command."};
  case PQTRANS_UNKNOWN: break;
  }
  throw broken_connection{err_msg()};
}


void pgtx::pq_backend::request_termination(std::string const &reason) noexcept
{
  if (m_conn != nullptr)
    process_notice(internal::concat("Closing connection: ", reason, "\n"));
  close();
}


bool pgtx::pq_backend::is_open() const noexcept
{
  return (m_conn != nullptr) and (PQstatus(m_conn) == CONNECTION_OK);
}


char const *pgtx::pq_backend::err_msg() const noexcept
{
  return (m_conn == nullptr) ? "No connection to database" :
                               PQerrorMessage(m_conn);
}


void pgtx::pq_backend::close() noexcept
{
  // Just in case PQfinish() doesn't handle nullptr nicely.
  if (m_conn == nullptr)
    return;
  PQfinish(m_conn);
  m_conn = nullptr;
}
