// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_FINGERPRINT_CODEC_HXX
#define FPKIT_FINGERPRINT_CODEC_HXX

#include "Algorithm.hxx"
#include "RawFingerprint.hxx"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace Fingerprint {

class Engine;

/*
 * Conversion between the raw fingerprint and its serialized form.
 * These functions do not need a #Session and keep no state; they may
 * be called concurrently on independent inputs if the #Engine
 * permits this.
 */

/**
 * Parse an encoded fingerprint.
 *
 * Throws #FingerprintError (DECODE) if the data is malformed,
 * truncated or carries an unknown algorithm tag.
 *
 * @param base64 true if #src is the text form, false if it contains
 * the raw encoded bytes
 */
DecodedFingerprint
DecodeFingerprint(Engine &engine, std::span<const std::byte> src,
		  bool base64=true);

inline DecodedFingerprint
DecodeFingerprint(Engine &engine, std::string_view src, bool base64=true)
{
	return DecodeFingerprint(engine, std::as_bytes(std::span{src}),
				 base64);
}

/**
 * Serialize a raw fingerprint tagged with its algorithm.  The result
 * is a byte string which may contain null bytes unless #base64 is
 * set.
 *
 * Throws #FingerprintError (ENCODE) on error.
 */
std::string
EncodeFingerprint(Engine &engine, std::span<const int32_t> raw,
		  Algorithm algorithm, bool base64=true);

/**
 * Calculate the 32 bit similarity hash of a raw fingerprint.
 * Similar fingerprints have hashes with a small Hamming distance.
 *
 * Throws #FingerprintError (ENGINE) on error.
 */
uint32_t
HashFingerprint(Engine &engine, std::span<const int32_t> raw);

} // namespace Fingerprint

#endif
