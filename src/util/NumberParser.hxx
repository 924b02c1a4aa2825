// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_NUMBER_PARSER_HXX
#define FPKIT_NUMBER_PARSER_HXX

#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>

/**
 * Parse the whole string as an integer.  Returns std::nullopt on
 * garbage, trailing characters or overflow.
 */
template<std::integral T>
[[gnu::pure]]
std::optional<T>
ParseInteger(std::string_view src, int base=10) noexcept
{
	const char *const last = src.data() + src.size();

	T value;
	auto [ptr, ec] = std::from_chars(src.data(), last, value, base);
	if (ptr == last && ec == std::errc{})
		return value;
	else
		return std::nullopt;
}

#endif
