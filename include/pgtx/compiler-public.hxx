/* Compiler deficiency workarounds for pgtx clients.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_COMPILER_PUBLIC
#define PGTX_H_COMPILER_PUBLIC

#if defined(_MSC_VER)
// Suppress vtables on abstract classes.
#  define PGTX_NOVTABLE __declspec(novtable)
#else
#  define PGTX_NOVTABLE /* novtable */
#endif

#if !defined(PGTX_LIBEXPORT)
#  define PGTX_LIBEXPORT /* libexport */
#endif

#if !defined(PGTX_PRIVATE)
#  define PGTX_PRIVATE /* private */
#endif


#if defined(__has_cpp_attribute)
#  if __has_cpp_attribute(gnu::pure)
/// Declare function "pure": no side effects, only reads globals and its args.
#    define PGTX_PURE [[gnu::pure]]
#  endif
#  if __has_cpp_attribute(gnu::cold)
/// Tell the compiler to optimise a function for size, not speed.
#    define PGTX_COLD [[gnu::cold]]
#  endif
#endif

#if !defined(PGTX_PURE)
#  define PGTX_PURE /* pure */
#endif
#if !defined(PGTX_COLD)
#  define PGTX_COLD /* cold */
#endif


#if defined(__GNUC__)
#  define PGTX_UNREACHABLE __builtin_unreachable()
#elif defined(_MSC_VER)
#  define PGTX_UNREACHABLE __assume(0)
#else
#  define PGTX_UNREACHABLE /* unreachable */
#endif

#endif
