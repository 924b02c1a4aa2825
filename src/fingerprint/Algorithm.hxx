// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_FINGERPRINT_ALGORITHM_HXX
#define FPKIT_FINGERPRINT_ALGORITHM_HXX

#include <cstdint>
#include <optional>
#include <string_view>

namespace Fingerprint {

/**
 * Selects the fingerprinting variant.  The numeric values are the
 * algorithm tags stored in encoded fingerprints and must not be
 * changed.
 */
enum class Algorithm : uint8_t {
	TEST1 = 0,
	TEST2 = 1,
	TEST3 = 2,

	/**
	 * Like #TEST2, but the leading silence is removed before
	 * fingerprinting.
	 */
	TEST4 = 3,

	TEST5 = 4,

	DEFAULT = TEST2,
};

constexpr bool
IsValid(Algorithm algorithm) noexcept
{
	return unsigned(algorithm) <= unsigned(Algorithm::TEST5);
}

/**
 * Convert an algorithm tag found in an encoded fingerprint.  Returns
 * std::nullopt if the tag is not known.
 */
constexpr std::optional<Algorithm>
AlgorithmFromTag(int tag) noexcept
{
	if (tag < 0 || tag > int(Algorithm::TEST5))
		return std::nullopt;

	return Algorithm(tag);
}

constexpr int
ToTag(Algorithm algorithm) noexcept
{
	return int(algorithm);
}

/**
 * Returns the lower-case name ("test2"), or "unknown" for values
 * outside the enum.
 */
[[gnu::const]]
const char *
ToString(Algorithm algorithm) noexcept;

/**
 * Parse an algorithm name as returned by ToString(), ignoring case.
 * "default" is accepted as well.
 *
 * Throws std::invalid_argument on error.
 */
Algorithm
ParseAlgorithm(std::string_view src);

} // namespace Fingerprint

#endif
