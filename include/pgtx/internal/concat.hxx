/* Efficient concatenation of message strings.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; other headers include it for you.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_CONCAT
#define PGTX_H_CONCAT

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace pgtx::internal
{
inline void append_piece(std::string &out, std::string_view piece)
{
  out.append(piece);
}


inline void append_piece(std::string &out, char piece)
{
  out.push_back(piece);
}


template<typename T>
inline std::enable_if_t<std::is_integral_v<T>>
append_piece(std::string &out, T piece)
{
  out.append(std::to_string(piece));
}


/// Efficiently combine a bunch of items into one big string.
/** Use this as an optimised version of string concatentation.  It takes just
 * about any type; it will represent each item as a string according to its
 * type, and then concatenate all of those strings.
 */
template<typename... T>
[[nodiscard]] inline std::string concat(T &&...item)
{
  std::string buf;
  (append_piece(buf, std::forward<T>(item)), ...);
  return buf;
}
} // namespace pgtx::internal
#endif
