// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "Session.hxx"
#include "Engine.hxx"
#include "Error.hxx"
#include "Domain.hxx"
#include "util/ByteOrder.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <cassert>
#include <utility> // for std::unreachable()

#include <string.h>

namespace Fingerprint {

using Kind = FingerprintError::Kind;

Session::Session(Engine &_engine, Algorithm _algorithm)
	:engine(_engine), algorithm(_algorithm)
{
	if (!IsValid(algorithm))
		throw FmtFingerprintError(Kind::INVALID_ARGUMENT,
					  "Invalid fingerprint algorithm: {}",
					  unsigned(algorithm));

	context = engine.NewContext(algorithm);
	if (context == nullptr)
		throw FmtFingerprintError(Kind::ENGINE,
					  "Failed to create {} engine instance",
					  ToString(algorithm));

	FmtDebug(fingerprint_domain, "created {} session",
		 ToString(algorithm));
}

Session::~Session() noexcept = default;

void
Session::CheckState(State expected, const char *operation) const
{
	if (state != expected)
		throw FmtFingerprintError(Kind::INVALID_STATE,
					  "{}() not allowed in state {}",
					  operation, ToString(state));
}

void
Session::Start(unsigned _sample_rate, unsigned _channels)
{
	CheckState(State::CREATED, "Start");

	if (_sample_rate == 0)
		throw FingerprintError(Kind::INVALID_ARGUMENT,
				       "Sample rate must be positive");

	if (_channels == 0)
		throw FingerprintError(Kind::INVALID_ARGUMENT,
				       "Channel count must be positive");

	if (!context->Start(_sample_rate, _channels))
		throw FmtFingerprintError(Kind::ENGINE,
					  "Engine rejected {} Hz, {} channel(s)",
					  _sample_rate, _channels);

	sample_rate = _sample_rate;
	channels = _channels;
	state = State::STARTED;

	FmtDebug(fingerprint_domain, "started: {} Hz, {} channel(s)",
		 sample_rate, channels);
}

inline std::span<const int16_t>
Session::ImportSamples(std::span<const std::byte> chunk)
{
	assert(chunk.size() % sizeof(int16_t) == 0);

	const std::size_t n = chunk.size() / sizeof(int16_t);

	if (IsLittleEndian() &&
	    reinterpret_cast<std::uintptr_t>(chunk.data()) % alignof(int16_t) == 0)
		/* the PCM is already in host byte order */
		return {reinterpret_cast<const int16_t *>(chunk.data()), n};

	if (sample_buffer.size() < n)
		sample_buffer.resize(n);

	if (IsLittleEndian()) {
		memcpy(sample_buffer.data(), chunk.data(), chunk.size());
	} else {
		const auto *src = reinterpret_cast<const uint8_t *>(chunk.data());
		for (std::size_t i = 0; i < n; ++i, src += 2)
			sample_buffer[i] = LoadLE16S(src);
	}

	return {sample_buffer.data(), n};
}

void
Session::Feed(std::span<const std::byte> chunk)
{
	CheckState(State::STARTED, "Feed");

	if (chunk.size() % sizeof(int16_t) != 0)
		throw FmtFingerprintError(Kind::INVALID_ARGUMENT,
					  "PCM chunk has odd length {}",
					  chunk.size());

	if (chunk.empty())
		return;

	/* the engine cannot take back samples, so a chunk is passed
	   in exactly one call or not at all */
	const std::size_t max_samples = engine.GetMaxFeedSamples();
	if (chunk.size() / sizeof(int16_t) > max_samples)
		throw FmtFingerprintError(Kind::INVALID_ARGUMENT,
					  "PCM chunk has {} samples, limit is {}",
					  chunk.size() / sizeof(int16_t),
					  max_samples);

	const auto samples = ImportSamples(chunk);
	if (!context->Feed(samples))
		throw FmtFingerprintError(Kind::ENGINE,
					  "Engine failed to process {} samples",
					  samples.size());
}

std::string
Session::Finish()
{
	CheckState(State::STARTED, "Finish");

	if (!engine_finished) {
		if (!context->Finish())
			throw FingerprintError(Kind::ENGINE,
					       "Engine failed to finish the fingerprint");

		/* a retry after a failed GetFingerprint() must not
		   finish the engine twice */
		engine_finished = true;
	}

	std::string result;
	if (!context->GetFingerprint(result))
		throw FingerprintError(Kind::ENGINE,
				       "Engine failed to return the fingerprint");

	state = State::FINISHED;

	/* no more PCM will be imported */
	sample_buffer = {};

	FmtDebug(fingerprint_domain, "finished: {}", result);
	return result;
}

RawFingerprint
Session::GetRawFingerprint() const
{
	CheckState(State::FINISHED, "GetRawFingerprint");

	RawFingerprint result;
	if (!context->GetRawFingerprint(result))
		throw FingerprintError(Kind::ENGINE,
				       "Engine failed to return the raw fingerprint");

	return result;
}

uint32_t
Session::GetHash() const
{
	CheckState(State::FINISHED, "GetHash");

	uint32_t hash;
	if (!context->GetHash(hash))
		throw FingerprintError(Kind::ENGINE,
				       "Engine failed to hash the fingerprint");

	return hash;
}

const char *
ToString(Session::State state) noexcept
{
	switch (state) {
	case Session::State::CREATED:
		return "created";

	case Session::State::STARTED:
		return "started";

	case Session::State::FINISHED:
		return "finished";
	}

	std::unreachable();
}

} // namespace Fingerprint
