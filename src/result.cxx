/** Implementation of the pgtx::result class and support classes.
 *
 * pgtx::result represents the set of result rows from a database query.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include <cctype>
#include <utility>

#include "pgtx/except.hxx"
#include "pgtx/internal/concat.hxx"
#include "pgtx/result.hxx"


pgtx::result::result(
  std::string query, std::string command_tag,
  std::vector<std::string> columns, std::vector<row> rows) :
        m_query{std::move(query)},
        m_command_tag{std::move(command_tag)},
        m_columns{std::move(columns)},
        m_rows{std::move(rows)}
{}


std::string const &pgtx::result::column_name(size_type col) const
{
  if (col >= std::size(m_columns))
    throw range_error{internal::concat(
      "Invalid column number: ", col, " (have ", std::size(m_columns),
      " columns).")};
  return m_columns[col];
}


pgtx::result::row const &pgtx::result::at(size_type r) const
{
  if (r >= size())
    throw range_error{internal::concat(
      "Row number out of range: ", r, " (result has ", size(), " rows).")};
  return m_rows[r];
}


pgtx::result::field const &pgtx::result::at(size_type r, size_type col) const
{
  auto const &the_row{at(r)};
  if (col >= std::size(the_row))
    throw range_error{internal::concat(
      "Invalid column number: ", col, " (have ", std::size(the_row),
      " columns).")};
  return the_row[col];
}


pgtx::result::row const &pgtx::result::one_row() const
{
  auto const sz{size()};
  if (sz != 1)
  {
    if (std::empty(m_query))
      throw unexpected_rows{
        internal::concat("Expected 1 row from query, got ", sz, ".")};
    else
      throw unexpected_rows{internal::concat(
        "Expected 1 row from query '", m_query, "', got ", sz, ".")};
  }
  return m_rows.front();
}


pgtx::result::field const &pgtx::result::one_field() const
{
  if (columns() != 1)
    throw usage_error{internal::concat(
      "Expected 1 column from query '", m_query, "', got ", columns(), ".")};
  return one_row().front();
}


void pgtx::result::no_rows() const
{
  if (auto const sz{size()}; sz != 0)
    throw unexpected_rows{internal::concat(
      "Expected no rows from query '", m_query, "', got ", sz, ".")};
}


pgtx::result::size_type pgtx::result::affected_rows() const noexcept
{
  // The row count, if any, is the last word of the command tag.
  auto const space{m_command_tag.find_last_of(' ')};
  if (space == std::string::npos)
    return 0;
  size_type count{0};
  for (auto i{space + 1}; i < std::size(m_command_tag); ++i)
  {
    auto const c{m_command_tag[i]};
    if (not std::isdigit(static_cast<unsigned char>(c)))
      return 0;
    count = count * 10 + static_cast<size_type>(c - '0');
  }
  return count;
}
