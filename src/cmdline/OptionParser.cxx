// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "OptionParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <fmt/core.h>

#include <cassert>
#include <string_view>

#include <stdio.h>

static const char *
Shift(std::span<const char *const> &s) noexcept
{
	const char *value = s.front();
	s = s.subspan(1);
	return value;
}

inline const char *
OptionParser::CheckShiftValue(const char *s, const OptionDef &option)
{
	if (!option.HasValue())
		return nullptr;

	if (args.empty())
		throw FmtInvalidArgument("Value expected after {}", s);

	return Shift(args);
}

inline OptionParser::Result
OptionParser::IdentifyOption(const char *s)
{
	assert(s != nullptr);
	assert(*s == '-');

	if (s[1] == '-') {
		const std::string_view arg{s + 2};

		for (const auto &i : options) {
			const std::string_view name{i.GetLongOption()};
			if (!arg.starts_with(name))
				continue;

			const std::string_view rest = arg.substr(name.size());

			const char *value;
			if (rest.empty())
				value = CheckShiftValue(s, i);
			else if (rest.front() == '=' && i.HasValue())
				value = rest.data() + 1;
			else
				continue;

			return {int(&i - options.data()), value};
		}
	} else if (s[1] != 0 && s[2] == 0) {
		const char ch = s[1];
		for (const auto &i : options) {
			if (i.HasShortOption() && ch == i.GetShortOption()) {
				const char *value = CheckShiftValue(s, i);
				return {int(&i - options.data()), value};
			}
		}
	}

	throw FmtInvalidArgument("Unknown option: {}", s);
}

OptionParser::Result
OptionParser::Next()
{
	while (!args.empty()) {
		const char *arg = Shift(args);
		if (arg[0] == '-' && arg[1] != 0)
			return IdentifyOption(arg);

		*remaining_tail++ = arg;
	}

	return {-1, nullptr};
}

void
PrintOptionHelp(std::span<const OptionDef> options) noexcept
{
	for (const auto &i : options) {
		if (i.HasShortOption())
			fmt::print(stderr, "  -{}, ", i.GetShortOption());
		else
			fmt::print(stderr, "      ");

		fmt::print(stderr, "--{:<16} {}\n",
			   i.GetLongOption(), i.GetDescription());
	}
}
