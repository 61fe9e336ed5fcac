/* Definitions for the pgtx::result class.
 *
 * pgtx::result represents the set of result rows from a database query.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_RESULT
#define PGTX_H_RESULT

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pgtx/compiler-public.hxx"


namespace pgtx
{
/// Result set containing data returned by a query or command.
/** All fields come back in PostgreSQL's text format.  A null field is an
 * empty @c std::optional.
 *
 * Unlike libpq's @c PGresult, this is a plain value type: it owns copies of
 * its data, and stays valid after the connection that produced it is gone.
 */
class PGTX_LIBEXPORT result
{
public:
  using size_type = std::size_t;
  using field = std::optional<std::string>;
  using row = std::vector<field>;

  result() = default;
  result(
    std::string query, std::string command_tag,
    std::vector<std::string> columns = {}, std::vector<row> rows = {});

  /// Number of rows.
  [[nodiscard]] size_type size() const noexcept { return std::size(m_rows); }
  [[nodiscard]] bool empty() const noexcept { return std::empty(m_rows); }

  /// Number of columns.
  [[nodiscard]] size_type columns() const noexcept
  {
    return std::size(m_columns);
  }

  /// Name of column number @c col.
  [[nodiscard]] std::string const &column_name(size_type col) const;

  /// Row number @c r.  Throws @ref range_error if out of range.
  [[nodiscard]] row const &at(size_type r) const;

  /// Field at row @c r, column @c col.
  [[nodiscard]] field const &at(size_type r, size_type col) const;

  [[nodiscard]] row const &operator[](size_type r) const noexcept
  {
    return m_rows[r];
  }

  [[nodiscard]] auto begin() const noexcept { return std::begin(m_rows); }
  [[nodiscard]] auto end() const noexcept { return std::end(m_rows); }

  /// Expect that result consists of exactly one row.
  /** @return The one row in the result.
   * @throw @ref unexpected_rows If the row count is not exactly 1.
   */
  row const &one_row() const;

  /// Expect that result consists of exactly 1 row and 1 column.
  /** @return The one field in the result.
   * @throw @ref unexpected_rows If the row count is not exactly 1.
   * @throw @ref usage_error If the column count is not exactly 1.
   */
  field const &one_field() const;

  /// Expect that result contains no rows.
  /** @throw @ref unexpected_rows If the query returned rows.
   */
  void no_rows() const;

  /// Command tag the server reported, e.g. "INSERT 0 1" or "SAVEPOINT".
  [[nodiscard]] std::string const &command_tag() const noexcept
  {
    return m_command_tag;
  }

  /// Number of rows affected, as reported in the command tag.
  /** Zero if the command tag carries no row count.
   */
  [[nodiscard]] size_type affected_rows() const noexcept;

  /// Query that produced this result, if available (empty string otherwise).
  [[nodiscard]] PGTX_PURE std::string const &query() const & noexcept
  {
    return m_query;
  }

private:
  std::string m_query;
  std::string m_command_tag;
  std::vector<std::string> m_columns;
  std::vector<row> m_rows;
};
} // namespace pgtx
#endif
