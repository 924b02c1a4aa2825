// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_FINGERPRINT_SESSION_HXX
#define FPKIT_FINGERPRINT_SESSION_HXX

#include "Algorithm.hxx"
#include "RawFingerprint.hxx"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace Fingerprint {

class Engine;
class EngineContext;

/**
 * Calculates the fingerprint of one PCM stream.  The session owns
 * exactly one engine instance and enforces the call sequence
 * Start(), Feed()..., Finish().
 *
 * All methods throw #FingerprintError on failure.  A failed call
 * does not change the state.
 *
 * This class is not thread-safe.
 */
class Session {
public:
	enum class State : uint8_t {
		/**
		 * The engine instance exists, but no audio
		 * parameters have been set yet.
		 */
		CREATED,

		/**
		 * Start() has succeeded; the session accepts PCM
		 * data.
		 */
		STARTED,

		/**
		 * Finish() has succeeded; the fingerprint is
		 * available.
		 */
		FINISHED,
	};

private:
	Engine &engine;

	std::unique_ptr<EngineContext> context;

	const Algorithm algorithm;

	State state = State::CREATED;

	unsigned sample_rate = 0, channels = 0;

	/**
	 * Has EngineContext::Finish() succeeded?  Finish() may fail
	 * after that (while retrieving the fingerprint) and be
	 * retried.
	 */
	bool engine_finished = false;

	/**
	 * Conversion buffer for big-endian hosts and unaligned
	 * input.  It grows to the largest such chunk and is released
	 * by Finish().
	 */
	std::vector<int16_t> sample_buffer;

public:
	/**
	 * Allocate an engine instance.
	 *
	 * @param _engine the engine; it must outlive this object
	 */
	explicit Session(Engine &_engine,
			 Algorithm _algorithm=Algorithm::DEFAULT);

	~Session() noexcept;

	Session(const Session &) = delete;
	Session &operator=(const Session &) = delete;

	State GetState() const noexcept {
		return state;
	}

	Algorithm GetAlgorithm() const noexcept {
		return algorithm;
	}

	/**
	 * The sample rate passed to Start(); 0 before that.
	 */
	unsigned GetSampleRate() const noexcept {
		return sample_rate;
	}

	unsigned GetChannels() const noexcept {
		return channels;
	}

	/**
	 * Configure the engine for the given audio parameters.  Only
	 * allowed in #State::CREATED; a second call is rejected.
	 */
	void Start(unsigned _sample_rate, unsigned _channels);

	/**
	 * Pass a chunk of 16 bit signed little-endian interleaved
	 * samples.  Consecutive chunks are concatenated in call
	 * order.  The chunk is not referenced after this method
	 * returns.
	 *
	 * A chunk with more samples than Engine::GetMaxFeedSamples()
	 * is rejected with #FingerprintError::Kind::INVALID_ARGUMENT.
	 * On any error, nothing of the chunk has reached the engine,
	 * so the same chunk may be passed again.
	 */
	void Feed(std::span<const std::byte> chunk);

	/**
	 * Signal the end of the stream and return the fingerprint in
	 * the engine's text form.
	 */
	std::string Finish();

	/**
	 * The fingerprint of the finished stream, without
	 * serialization.  Only allowed in #State::FINISHED.
	 */
	RawFingerprint GetRawFingerprint() const;

	/**
	 * The 32 bit similarity hash of the finished stream.  Only
	 * allowed in #State::FINISHED.
	 */
	uint32_t GetHash() const;

private:
	void CheckState(State expected, const char *operation) const;

	std::span<const int16_t> ImportSamples(std::span<const std::byte> chunk);
};

[[gnu::const]]
const char *
ToString(Session::State state) noexcept;

} // namespace Fingerprint

#endif
