/* Definition of the pgtx::pq_backend class.
 *
 * pgtx::pq_backend talks to a real PostgreSQL server through libpq.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_PQ_BACKEND
#define PGTX_H_PQ_BACKEND

#include <string>

#include "pgtx/backend.hxx"
#include "pgtx/compiler-public.hxx"
#include "pgtx/internal/libpq-forward.hxx"


extern "C"
{
/// Notice processor for libpq.  Forwards to the backend's notice handler.
void pgtx_notice_processor(void *, char const *);
}


namespace pgtx
{
/// A @ref backend built on libpq, the PostgreSQL C client library.
/** Connects in the constructor, using a libpq connection string, e.g.
 * `"host=localhost dbname=test"`.  Server notices and warnings go to the
 * notice handler.
 */
class PGTX_LIBEXPORT pq_backend final : public backend
{
public:
  /// Connect.  @throw broken_connection if this fails.
  explicit pq_backend(std::string const &conninfo);
  ~pq_backend() noexcept override;

  [[nodiscard]] reply
  execute(std::string const &sql, params const &args) override;
  [[nodiscard]] transaction_status current_status() const override;
  void request_termination(std::string const &reason) noexcept override;
  [[nodiscard]] bool is_open() const noexcept override;

  /// libpq's last error message for this connection.
  [[nodiscard]] char const *err_msg() const noexcept;

private:
  friend void ::pgtx_notice_processor(void *, char const *);

  void close() noexcept;

  internal::pq::PGconn *m_conn{nullptr};
};
} // namespace pgtx
#endif
