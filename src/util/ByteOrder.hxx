// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_BYTE_ORDER_HXX
#define FPKIT_BYTE_ORDER_HXX

#include <cstdint>

#if defined(__i386__) || defined(__x86_64__) || defined(__ARMEL__)
/* well-known little-endian */
#  define IS_LITTLE_ENDIAN true
#elif defined(__MIPSEB__)
/* well-known big-endian */
#  define IS_LITTLE_ENDIAN false
#elif defined(__BYTE_ORDER__)
/* GCC-specific macros */
#  if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
#    define IS_LITTLE_ENDIAN true
#  else
#    define IS_LITTLE_ENDIAN false
#  endif
#else
/* generic compile-time check */
#  include <endian.h>
#  if __BYTE_ORDER == __LITTLE_ENDIAN
#    define IS_LITTLE_ENDIAN true
#  else
#    define IS_LITTLE_ENDIAN false
#  endif
#endif

constexpr bool
IsLittleEndian() noexcept
{
	return IS_LITTLE_ENDIAN;
}

/**
 * Load a signed 16 bit little-endian sample from two unaligned
 * bytes.
 */
constexpr int16_t
LoadLE16S(const uint8_t *src) noexcept
{
	return static_cast<int16_t>(uint16_t(src[0]) | (uint16_t(src[1]) << 8));
}

#endif
