// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "Error.hxx"

#include <utility> // for std::unreachable()

namespace Fingerprint {

const char *
ToString(FingerprintError::Kind kind) noexcept
{
	switch (kind) {
	case FingerprintError::Kind::INVALID_ARGUMENT:
		return "invalid argument";

	case FingerprintError::Kind::INVALID_STATE:
		return "invalid state";

	case FingerprintError::Kind::ENGINE:
		return "engine error";

	case FingerprintError::Kind::DECODE:
		return "decode error";

	case FingerprintError::Kind::ENCODE:
		return "encode error";
	}

	std::unreachable();
}

} // namespace Fingerprint
