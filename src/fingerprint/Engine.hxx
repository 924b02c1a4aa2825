// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_FINGERPRINT_ENGINE_HXX
#define FPKIT_FINGERPRINT_ENGINE_HXX

#include "Algorithm.hxx"
#include "RawFingerprint.hxx"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace Fingerprint {

/**
 * One instance of the native fingerprinting engine.  Destroying the
 * object releases the native instance.
 *
 * All methods return true on success and false if the engine
 * reported a failure; they do not throw, except for std::bad_alloc
 * while filling a result container.
 */
class EngineContext {
public:
	virtual ~EngineContext() noexcept = default;

	virtual bool Start(unsigned sample_rate, unsigned channels) noexcept = 0;

	/**
	 * @param samples interleaved signed 16 bit samples in host
	 * byte order; the engine does not keep a reference
	 */
	virtual bool Feed(std::span<const int16_t> samples) noexcept = 0;

	virtual bool Finish() noexcept = 0;

	/**
	 * Obtain the fingerprint of the finished stream in the
	 * engine's native text form.
	 */
	virtual bool GetFingerprint(std::string &result) = 0;

	virtual bool GetRawFingerprint(RawFingerprint &result) = 0;

	virtual bool GetHash(uint32_t &result) noexcept = 0;
};

/**
 * The capability interface of a fingerprinting engine.  The
 * #Session and the codec functions talk only to this interface.
 */
class Engine {
public:
	virtual ~Engine() noexcept = default;

	/**
	 * The largest number of samples which may be passed to
	 * EngineContext::Feed() in one call.
	 */
	virtual std::size_t GetMaxFeedSamples() const noexcept = 0;

	/**
	 * Allocate a new engine instance.  Throws std::bad_alloc if out
	 * of memory.
	 *
	 * @return the new instance or nullptr on failure
	 */
	virtual std::unique_ptr<EngineContext> NewContext(Algorithm algorithm) = 0;

	/**
	 * @param algorithm receives the algorithm tag found in the
	 * encoded data; it is not validated here
	 */
	virtual bool DecodeFingerprint(std::span<const std::byte> src,
				       bool base64,
				       RawFingerprint &result,
				       int &algorithm) = 0;

	virtual bool EncodeFingerprint(std::span<const int32_t> src,
				       Algorithm algorithm, bool base64,
				       std::string &result) = 0;

	virtual bool HashFingerprint(std::span<const int32_t> src,
				     uint32_t &result) noexcept = 0;

	/**
	 * A human-readable version string of the engine.
	 */
	[[gnu::pure]]
	virtual const char *GetVersion() const noexcept = 0;
};

} // namespace Fingerprint

#endif
