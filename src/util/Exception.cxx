// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "Exception.hxx"

#include <utility>

static constexpr bool
IsWhitespace(char ch) noexcept
{
	return (unsigned char)ch <= ' ';
}

/**
 * Append the given C string to a std::string, collapsing runs of
 * whitespace (including line breaks) into a single space and dropping
 * leading and trailing whitespace.
 */
static void
AppendSanitize(std::string &dest, const char *src) noexcept
{
	while (IsWhitespace(*src) && *src != 0)
		++src;

	bool space = false;
	while (char ch = *src++) {
		if (IsWhitespace(ch)) {
			space = true;
			continue;
		}

		if (space) {
			space = false;
			dest.push_back(' ');
		}

		dest.push_back(ch);
	}
}

template<typename T>
static void
AppendNestedMessage(std::string &result, T &&e,
		    const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(std::forward<T>(e));
	} catch (const std::exception &nested) {
		result += separator;
		AppendSanitize(result, nested.what());
		AppendNestedMessage(result, nested, fallback, separator);
	} catch (const std::nested_exception &ne) {
		AppendNestedMessage(result, ne, fallback, separator);
	} catch (...) {
		result += separator;
		result += fallback;
	}
}

std::string
GetFullMessage(const std::exception &e,
	       const char *fallback, const char *separator) noexcept
{
	std::string result;
	AppendSanitize(result, e.what());
	AppendNestedMessage(result, e, fallback, separator);
	return result;
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_exception(std::move(ep));
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (const std::nested_exception &ne) {
		return GetFullMessage(ne.nested_ptr(), fallback, separator);
	} catch (...) {
		return fallback;
	}
}
