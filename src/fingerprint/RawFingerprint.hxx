// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_FINGERPRINT_RAW_FINGERPRINT_HXX
#define FPKIT_FINGERPRINT_RAW_FINGERPRINT_HXX

#include "Algorithm.hxx"

#include <cstdint>
#include <vector>

namespace Fingerprint {

/**
 * The algorithm-internal representation of a fingerprint,
 * independent of any serialization.
 */
using RawFingerprint = std::vector<int32_t>;

struct DecodedFingerprint {
	RawFingerprint raw;
	Algorithm algorithm;

	bool operator==(const DecodedFingerprint &) const noexcept = default;
};

} // namespace Fingerprint

#endif
