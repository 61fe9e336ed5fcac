/* Helpers for parameterised statements.
 *
 * See @ref pgtx::params.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_PARAMS
#define PGTX_H_PARAMS

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "pgtx/compiler-public.hxx"


namespace pgtx
{
/// Build a parameter list for a parameterised statement.
/** Parameters go into the statement as `$1`, `$2`, and so on, in the order
 * in which you append them.  They are passed in text format; a null
 * parameter becomes an SQL null.
 *
 * Encoding values of other types is left to the caller: pass integers and
 * strings here, and cast in SQL where the server needs another type.
 */
class PGTX_LIBEXPORT params
{
public:
  using value_type = std::optional<std::string>;

  params() = default;

  /// Create a @c params pre-populated with args.  Feel free to add more
  /// later.
  template<typename... Args> params(Args &&...args)
  {
    reserve(sizeof...(args));
    (append(std::forward<Args>(args)), ...);
  }

  /// Pre-allocate room for at least @c n parameters.
  void reserve(std::size_t n) { m_params.reserve(n); }

  /// Get the number of parameters currently in this @c params.
  [[nodiscard]] std::size_t size() const noexcept { return std::size(m_params); }

  [[nodiscard]] bool empty() const noexcept { return std::empty(m_params); }

  /// Append a null value.
  void append() { m_params.emplace_back(); }

  /// Append a null value.
  void append(std::nullptr_t) { append(); }

  /// Append a non-null string parameter.
  void append(std::string_view value) { m_params.emplace_back(value); }

  /// Append a non-null string parameter.
  void append(std::string &&value) { m_params.emplace_back(std::move(value)); }

  /// Append a non-null string parameter.
  void append(std::string const &value) { m_params.emplace_back(value); }

  /// Append a non-null string parameter.
  void append(char const value[])
  {
    if (value == nullptr)
      append();
    else
      m_params.emplace_back(value);
  }

  /// Append a number, in its decimal text form.
  template<typename T>
  std::enable_if_t<std::is_arithmetic_v<T> and not std::is_same_v<T, bool>>
  append(T value)
  {
    m_params.emplace_back(std::to_string(value));
  }

  /// Append a boolean, as SQL "true" or "false".
  void append(bool value) { m_params.emplace_back(value ? "true" : "false"); }

  /// Append a parameter which may be null.
  template<typename T> void append(std::optional<T> const &value)
  {
    if (value.has_value())
      append(*value);
    else
      append();
  }

  /// The parameters, in order.  Null parameters are empty optionals.
  [[nodiscard]] std::vector<value_type> const &values() const noexcept
  {
    return m_params;
  }

private:
  std::vector<value_type> m_params;
};
} // namespace pgtx
#endif
