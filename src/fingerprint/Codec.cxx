// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "Codec.hxx"
#include "Engine.hxx"
#include "Error.hxx"
#include "Domain.hxx"
#include "Log.hxx"

#include <utility>

namespace Fingerprint {

using Kind = FingerprintError::Kind;

DecodedFingerprint
DecodeFingerprint(Engine &engine, std::span<const std::byte> src,
		  bool base64)
{
	if (src.empty())
		throw FingerprintError(Kind::DECODE,
				       "Empty fingerprint");

	RawFingerprint raw;
	int tag = -1;
	if (!engine.DecodeFingerprint(src, base64, raw, tag))
		throw FmtFingerprintError(Kind::DECODE,
					  "Malformed {} fingerprint ({} bytes)",
					  base64 ? "base64" : "binary",
					  src.size());

	const auto algorithm = AlgorithmFromTag(tag);
	if (!algorithm)
		throw FmtFingerprintError(Kind::DECODE,
					  "Unrecognized fingerprint algorithm tag {}",
					  tag);

	FmtDebug(fingerprint_domain, "decoded {} fingerprint: {} items",
		 ToString(*algorithm), raw.size());

	return {std::move(raw), *algorithm};
}

std::string
EncodeFingerprint(Engine &engine, std::span<const int32_t> raw,
		  Algorithm algorithm, bool base64)
{
	if (!IsValid(algorithm))
		throw FmtFingerprintError(Kind::ENCODE,
					  "Invalid fingerprint algorithm: {}",
					  unsigned(algorithm));

	std::string result;
	if (!engine.EncodeFingerprint(raw, algorithm, base64, result))
		throw FmtFingerprintError(Kind::ENCODE,
					  "Failed to encode {} fingerprint with {} items",
					  ToString(algorithm), raw.size());

	return result;
}

uint32_t
HashFingerprint(Engine &engine, std::span<const int32_t> raw)
{
	uint32_t hash;
	if (!engine.HashFingerprint(raw, hash))
		throw FmtFingerprintError(Kind::ENGINE,
					  "Failed to hash fingerprint with {} items",
					  raw.size());

	return hash;
}

} // namespace Fingerprint
