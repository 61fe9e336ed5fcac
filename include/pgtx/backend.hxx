/* Abstract interface to the wire-level end of a database connection.
 *
 * pgtx::backend is what pgtx::connection talks to.  It sends one command at a
 * time and reports what happened, including the server's transaction status.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_BACKEND
#define PGTX_H_BACKEND

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "pgtx/compiler-public.hxx"
#include "pgtx/params.hxx"
#include "pgtx/result.hxx"
#include "pgtx/types.hxx"


namespace pgtx
{
/// An error response from the server.
struct PGTX_LIBEXPORT server_error
{
  /// Five-character SQLSTATE code, e.g. "23505".
  std::string sqlstate;
  /// Severity, e.g. "ERROR" or "FATAL".
  std::string severity{"ERROR"};
  /// Primary, human-readable message.
  std::string message;
  /// Optional detail message.  Empty if the server sent none.
  std::string detail;

  /// Error text in the form "ERROR 23505 (unique_violation): <message>".
  /** The condition name is omitted if the code is not a known one.
   */
  [[nodiscard]] std::string text() const;
};


/// A backend's answer to one command: data, or an error, but not both.
struct PGTX_LIBEXPORT reply
{
  result data;
  std::optional<server_error> error;

  [[nodiscard]] bool ok() const noexcept { return not error.has_value(); }
};


/// Callback receiving a message for the log.  Messages end in a newline.
using notice_handler = std::function<void(std::string_view)>;


/// Collaborator interface: the wire end of one database connection.
/** A backend handles encoding, sockets, and authentication; pgtx handles
 * transactions on top of it.  It executes one command at a time.
 *
 * Implementations must report the transaction status the server gave in its
 * latest response.  They must never retry a command.
 */
class PGTX_LIBEXPORT PGTX_NOVTABLE backend
{
public:
  backend() = default;
  backend(backend const &) = delete;
  backend &operator=(backend const &) = delete;
  virtual ~backend() = 0;

  /// Send one command and wait for its response.
  /** A server-side error comes back in the reply.  If the connection is lost
   * or unusable, throws @ref broken_connection instead.
   */
  [[nodiscard]] virtual reply
  execute(std::string const &sql, params const &args) = 0;

  /// Transaction status from the server's latest response.
  /** @throw broken_connection if the status is unknown because the
   * connection is gone.
   */
  [[nodiscard]] virtual transaction_status current_status() const = 0;

  /// Drop the connection.  Fire and forget.
  virtual void request_termination(std::string const &reason) noexcept = 0;

  /// Is the connection still open, as far as the backend knows?
  [[nodiscard]] virtual bool is_open() const noexcept = 0;

  /// Set where messages from the backend and the server should go.
  void set_notice_handler(notice_handler handler)
  {
    m_notice_handler = std::move(handler);
  }

protected:
  /// Pass a message on to the notice handler, if any.  Never throws.
  void process_notice(std::string_view msg) const noexcept;

private:
  notice_handler m_notice_handler;
};
} // namespace pgtx
#endif
