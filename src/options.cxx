/** Implementation of pgtx::connection_options.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgtx-source.hxx"

#include <cctype>
#include <cstdlib>

#include "pgtx/except.hxx"
#include "pgtx/internal/concat.hxx"
#include "pgtx/options.hxx"


namespace
{
bool is_space(char c) noexcept
{
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}


/// Read an environment variable.  Returns null if it is not set.
char const *get_env(char const var[]) noexcept
{
  return std::getenv(var);
}
} // namespace


pgtx::strategy pgtx::parse_strategy(std::string_view name)
{
  if (name == "strict")
    return strategy::strict;
  if (name == "naive")
    return strategy::naive;
  throw argument_error{internal::concat(
    "Unknown transaction strategy: '", name,
    "'.  Expected 'strict' or 'naive'.")};
}


void pgtx::connection_options::set(std::string_view key, std::string_view value)
{
  if (key == "transactions")
    transactions = parse_strategy(value);
  else if (key == "disconnect_on_error_codes")
    disconnect_on_error_codes = disconnect_policy::parse(value);
  else
    throw argument_error{
      internal::concat("Unknown connection option: '", key, "'.")};
}


pgtx::connection_options
pgtx::connection_options::parse(std::string_view text)
{
  connection_options opts;
  std::string_view::size_type here{0};
  auto const end{std::size(text)};
  while (here < end)
  {
    while (here < end and is_space(text[here])) ++here;
    if (here == end)
      break;

    auto stop{here};
    while (stop < end and not is_space(text[stop])) ++stop;
    auto const pair{text.substr(here, stop - here)};
    here = stop;

    auto const eq{pair.find('=')};
    if (eq == std::string_view::npos or eq == 0)
      throw argument_error{internal::concat(
        "Malformed connection option: '", pair, "'.  Expected key=value.")};
    opts.set(pair.substr(0, eq), pair.substr(eq + 1));
  }
  return opts;
}


pgtx::connection_options pgtx::connection_options::from_env()
{
  connection_options opts;
  if (auto const transactions{get_env("PGTX_TRANSACTIONS")};
      transactions != nullptr)
    opts.set("transactions", transactions);
  if (auto const codes{get_env("PGTX_DISCONNECT_ON_ERROR_CODES")};
      codes != nullptr)
    opts.set("disconnect_on_error_codes", codes);
  return opts;
}
