// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "Algorithm.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <array>

using std::string_view_literals::operator""sv;

namespace Fingerprint {

static constexpr std::array algorithm_names{
	"test1", "test2", "test3", "test4", "test5",
};

static_assert(algorithm_names.size() == unsigned(Algorithm::TEST5) + 1);

const char *
ToString(Algorithm algorithm) noexcept
{
	if (!IsValid(algorithm))
		return "unknown";

	return algorithm_names[unsigned(algorithm)];
}

static constexpr bool
EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	if (a.size() != b.size())
		return false;

	for (std::size_t i = 0; i < a.size(); ++i) {
		char ch = a[i];
		if (ch >= 'A' && ch <= 'Z')
			ch += 'a' - 'A';
		if (ch != b[i])
			return false;
	}

	return true;
}

Algorithm
ParseAlgorithm(std::string_view src)
{
	if (EqualsIgnoreCase(src, "default"sv))
		return Algorithm::DEFAULT;

	for (std::size_t i = 0; i < algorithm_names.size(); ++i)
		if (EqualsIgnoreCase(src, algorithm_names[i]))
			return Algorithm(i);

	throw FmtInvalidArgument("Unknown fingerprint algorithm: \"{}\"", src);
}

} // namespace Fingerprint
