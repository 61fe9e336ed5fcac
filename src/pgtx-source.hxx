/* Compiler settings for compiling pgtx itself.
 *
 * Include this header in every source file that goes into the pgtx library
 * binary, and nowhere else.
 *
 * To ensure this, include this file once, as the very first header, in each
 * compilation unit for the library.
 *
 * DO NOT INCLUDE THIS FILE when building client programs.
 *
 * Copyright (c) 2000-2024, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGTX_H_COMPILER_INTERNAL
#define PGTX_H_COMPILER_INTERNAL

#if defined(__GNUC__) && !defined(_WIN32)
#  define PGTX_LIBEXPORT __attribute__((visibility("default")))
#  define PGTX_PRIVATE __attribute__((visibility("hidden")))
#endif

#include "pgtx/compiler-public.hxx"
#endif
