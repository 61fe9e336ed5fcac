/** Implementation of the pgtx::error_classifier class.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include "pgtx/error_classifier.hxx"
#include "pgtx/except.hxx"
#include "pgtx/internal/concat.hxx"
#include "pgtx/sqlstate.hxx"


namespace
{
constexpr bool is_space(char c) noexcept
{
  return c == ' ' or c == '\t' or c == '\n' or c == '\r';
}


std::string_view trim(std::string_view text) noexcept
{
  while (not std::empty(text) and is_space(text.front()))
    text.remove_prefix(1);
  while (not std::empty(text) and is_space(text.back())) text.remove_suffix(1);
  return text;
}
} // namespace


pgtx::disconnect_policy::disconnect_policy(
  std::initializer_list<std::string_view> codes)
{
  for (auto const code : codes) add(code);
}


pgtx::disconnect_policy::disconnect_policy(
  std::vector<std::string> const &codes)
{
  for (auto const &code : codes) add(code);
}


pgtx::disconnect_policy pgtx::disconnect_policy::parse(std::string_view list)
{
  disconnect_policy policy;
  while (not std::empty(trim(list)))
  {
    auto const comma{list.find(',')};
    auto const item{trim(list.substr(0, comma))};
    if (std::empty(item))
      throw argument_error{internal::concat(
        "Empty entry in list of disconnect error codes: '", list, "'.")};
    policy.add(item);
    if (comma == std::string_view::npos)
      break;
    list.remove_prefix(comma + 1);
  }
  return policy;
}


void pgtx::disconnect_policy::add(std::string_view code_or_name)
{
  if (sqlstate::is_code(code_or_name))
  {
    m_codes.emplace(code_or_name);
    return;
  }
  auto const code{sqlstate::code_for(code_or_name)};
  if (std::empty(code))
    throw argument_error{internal::concat(
      "Unknown SQLSTATE condition name: '", code_or_name, "'.")};
  m_codes.emplace(code);
}


bool pgtx::disconnect_policy::contains(std::string_view sqlstate) const
{
  return m_codes.find(sqlstate) != std::end(m_codes);
}


pgtx::error_class
pgtx::error_classifier::classify(std::string_view sqlstate) const
{
  return m_policy.contains(sqlstate) ? error_class::disconnect :
                                       error_class::local;
}
