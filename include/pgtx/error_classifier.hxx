/* Deciding which server errors are fatal to a connection.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_ERROR_CLASSIFIER
#define PGTX_H_ERROR_CLASSIFIER

#include <functional>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pgtx/compiler-public.hxx"


namespace pgtx
{
/// Set of SQLSTATE codes after which a connection should be dropped.
/** For example, after failing over a primary database to a standby, old
 * connections may still point at the server that is now read-only.  Every
 * write then fails with `read_only_sql_transaction`.  Disconnecting on that
 * error makes the connection get re-established against the new primary.
 *
 * Each entry may be a five-character SQLSTATE code, or a PostgreSQL condition
 * name such as "read_only_sql_transaction".  Unknown names are an
 * @ref argument_error.
 */
class PGTX_LIBEXPORT disconnect_policy
{
public:
  /// Empty policy: never disconnect because of an error.
  disconnect_policy() = default;
  disconnect_policy(std::initializer_list<std::string_view> codes);
  explicit disconnect_policy(std::vector<std::string> const &codes);

  /// Parse a comma-separated list of codes or condition names.
  [[nodiscard]] static disconnect_policy parse(std::string_view list);

  [[nodiscard]] bool contains(std::string_view sqlstate) const;
  [[nodiscard]] bool empty() const noexcept { return std::empty(m_codes); }

  /// The SQLSTATE codes, in ascending order.
  [[nodiscard]] std::set<std::string, std::less<>> const &
  codes() const noexcept
  {
    return m_codes;
  }

private:
  void add(std::string_view code_or_name);

  std::set<std::string, std::less<>> m_codes;
};


/// How a server error affects the connection it happened on.
enum class error_class
{
  /// Only the command (and any enclosing transaction) is affected.
  local,
  /// The connection must be terminated once the caller has seen the error.
  disconnect,
};


/// Sorts server errors into local and disconnect-worthy ones.
class PGTX_LIBEXPORT error_classifier
{
public:
  explicit error_classifier(disconnect_policy policy = {}) :
          m_policy{std::move(policy)}
  {}

  [[nodiscard]] error_class classify(std::string_view sqlstate) const;

  [[nodiscard]] disconnect_policy const &policy() const noexcept
  {
    return m_policy;
  }

private:
  disconnect_policy m_policy;
};
} // namespace pgtx
#endif
