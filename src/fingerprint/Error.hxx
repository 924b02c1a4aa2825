// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_FINGERPRINT_ERROR_HXX
#define FPKIT_FINGERPRINT_ERROR_HXX

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace Fingerprint {

/**
 * Thrown by #Session and the codec functions whenever an operation
 * cannot complete.
 */
class FingerprintError : public std::runtime_error {
public:
	enum class Kind {
		/**
		 * The caller passed malformed input, e.g. an odd
		 * number of PCM bytes.
		 */
		INVALID_ARGUMENT,

		/**
		 * The operation is not allowed in the current
		 * lifecycle state of the #Session.
		 */
		INVALID_STATE,

		/**
		 * The engine reported a failure during a stateful
		 * operation.
		 */
		ENGINE,

		/**
		 * The encoded fingerprint is malformed, truncated or
		 * uses an unknown algorithm tag.
		 */
		DECODE,

		/**
		 * The fingerprint cannot be encoded.
		 */
		ENCODE,
	};

private:
	Kind kind;

public:
	FingerprintError(Kind _kind, const char *_msg)
		:std::runtime_error(_msg), kind(_kind) {}

	FingerprintError(Kind _kind, const std::string &_msg)
		:std::runtime_error(_msg), kind(_kind) {}

	Kind GetKind() const noexcept {
		return kind;
	}
};

[[gnu::const]]
const char *
ToString(FingerprintError::Kind kind) noexcept;

template<typename... Args>
[[nodiscard]] [[gnu::cold]]
inline FingerprintError
FmtFingerprintError(FingerprintError::Kind kind,
		    fmt::format_string<Args...> format_str, Args&&... args)
{
	return FingerprintError(kind,
				fmt::format(format_str,
					    std::forward<Args>(args)...));
}

} // namespace Fingerprint

#endif
