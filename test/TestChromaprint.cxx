// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

/*
 * Tests which run the session and the codec against the real
 * libchromaprint.
 */

#include "lib/chromaprint/Init.hxx"
#include "fingerprint/Session.hxx"
#include "fingerprint/Codec.hxx"
#include "fingerprint/Error.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <vector>

using Fingerprint::Algorithm;
using Fingerprint::FingerprintError;
using Fingerprint::Session;
using Kind = FingerprintError::Kind;

class ChromaprintTest : public ::testing::Test {
protected:
	static std::optional<ScopeChromaprintInit> init;

	static void SetUpTestSuite() {
		init.emplace();
	}

	static void TearDownTestSuite() {
		init.reset();
	}

	static ChromaprintEngine &GetEngine() noexcept {
		return init->GetEngine();
	}
};

std::optional<ScopeChromaprintInit> ChromaprintTest::init;

/**
 * Generate stereo PCM: two tones which change every half second, so
 * the fingerprint is not trivial.
 */
static std::vector<std::byte>
GenerateTones(unsigned sample_rate, unsigned seconds)
{
	std::vector<std::byte> result;
	result.reserve(std::size_t(sample_rate) * seconds * 4);

	const unsigned n_frames = sample_rate * seconds;
	for (unsigned i = 0; i < n_frames; ++i) {
		const unsigned step = i / (sample_rate / 2);
		const double frequency = 220.0 * (1 + step % 7);
		const double t = double(i) / sample_rate;
		const auto left = int16_t(8000 * std::sin(2 * M_PI * frequency * t));
		const auto right = int16_t(6000 * std::sin(3 * M_PI * frequency * t));

		for (const int16_t sample : {left, right}) {
			const auto u = uint16_t(sample);
			result.push_back(std::byte(u & 0xff));
			result.push_back(std::byte(u >> 8));
		}
	}

	return result;
}

static std::string
FingerprintOf(Fingerprint::Engine &engine, std::span<const std::byte> pcm,
	      std::size_t chunk_size)
{
	Session session(engine);
	session.Start(44100, 2);

	while (!pcm.empty()) {
		const auto n = std::min(pcm.size(), chunk_size);
		session.Feed(pcm.first(n));
		pcm = pcm.subspan(n);
	}

	return session.Finish();
}

TEST_F(ChromaprintTest, Version)
{
	EXPECT_NE(GetEngine().GetVersion(), nullptr);
}

TEST_F(ChromaprintTest, Silence)
{
	const std::vector<std::byte> silence(44100 * 2 * 2 * 4);

	std::size_t length = 0;

	for (unsigned run = 0; run < 2; ++run) {
		Session session(GetEngine(), Algorithm::TEST2);
		session.Start(44100, 2);
		session.Feed(silence);

		const auto fingerprint = session.Finish();
		EXPECT_FALSE(fingerprint.empty());

		const auto decoded =
			Fingerprint::DecodeFingerprint(GetEngine(), fingerprint);
		EXPECT_EQ(decoded.algorithm, Algorithm::TEST2);
		EXPECT_EQ(decoded.raw, session.GetRawFingerprint());

		if (run == 0)
			length = decoded.raw.size();
		else
			EXPECT_EQ(decoded.raw.size(), length);
	}
}

TEST_F(ChromaprintTest, NothingFed)
{
	std::optional<std::string> first;

	for (unsigned run = 0; run < 2; ++run) {
		Session session(GetEngine());
		session.Start(44100, 2);

		try {
			const auto fingerprint = session.Finish();
			if (first)
				EXPECT_EQ(fingerprint, *first);
			else
				first = fingerprint;
		} catch (const FingerprintError &e) {
			EXPECT_EQ(e.GetKind(), Kind::ENGINE);
			EXPECT_EQ(session.GetState(), Session::State::STARTED);
		}
	}
}

TEST_F(ChromaprintTest, ConcatenationInvariance)
{
	const auto pcm = GenerateTones(44100, 6);

	const auto expected = FingerprintOf(GetEngine(), pcm, pcm.size());
	EXPECT_EQ(FingerprintOf(GetEngine(), pcm, 10), expected);
	EXPECT_EQ(FingerprintOf(GetEngine(), pcm, 4096), expected);
	EXPECT_EQ(FingerprintOf(GetEngine(), pcm, 12346), expected);
}

TEST_F(ChromaprintTest, OddChunk)
{
	const auto pcm = GenerateTones(44100, 6);
	const std::span<const std::byte> src{pcm};

	Session session(GetEngine());
	session.Start(44100, 2);

	try {
		session.Feed(src.first(1001));
		FAIL();
	} catch (const FingerprintError &e) {
		EXPECT_EQ(e.GetKind(), Kind::INVALID_ARGUMENT);
	}

	session.Feed(src);
	EXPECT_EQ(session.Finish(),
		  FingerprintOf(GetEngine(), pcm, pcm.size()));
}

TEST_F(ChromaprintTest, SessionResults)
{
	const auto pcm = GenerateTones(44100, 6);

	Session session(GetEngine(), Algorithm::TEST1);
	session.Start(44100, 2);
	session.Feed(pcm);
	const auto fingerprint = session.Finish();

	const auto raw = session.GetRawFingerprint();
	EXPECT_FALSE(raw.empty());

	const auto decoded =
		Fingerprint::DecodeFingerprint(GetEngine(), fingerprint);
	EXPECT_EQ(decoded.algorithm, Algorithm::TEST1);
	EXPECT_EQ(decoded.raw, raw);

	EXPECT_EQ(session.GetHash(),
		  Fingerprint::HashFingerprint(GetEngine(), raw));
}

TEST_F(ChromaprintTest, RoundTrip)
{
	const Fingerprint::RawFingerprint raw{
		0x12345678, -1, 0, 42, int32_t(0x80000000), 0x7fffffff,
		0x0f0f0f0f, 0x0f0f0f0f, -123456789,
	};

	for (const auto algorithm : {Algorithm::TEST1, Algorithm::TEST2,
				     Algorithm::TEST3, Algorithm::TEST4,
				     Algorithm::TEST5}) {
		for (const bool base64 : {true, false}) {
			const auto encoded =
				Fingerprint::EncodeFingerprint(GetEngine(), raw,
							       algorithm, base64);
			EXPECT_FALSE(encoded.empty());

			const auto decoded =
				Fingerprint::DecodeFingerprint(GetEngine(), encoded,
							       base64);
			EXPECT_EQ(decoded.raw, raw);
			EXPECT_EQ(decoded.algorithm, algorithm);
		}
	}
}

TEST_F(ChromaprintTest, TextFormIsUrlSafe)
{
	const auto pcm = GenerateTones(44100, 6);
	const auto fingerprint = FingerprintOf(GetEngine(), pcm, pcm.size());

	for (const char ch : fingerprint)
		EXPECT_TRUE((ch >= 'A' && ch <= 'Z') ||
			    (ch >= 'a' && ch <= 'z') ||
			    (ch >= '0' && ch <= '9') ||
			    ch == '-' || ch == '_') << ch;
}

TEST_F(ChromaprintTest, DecodeTruncated)
{
	const Fingerprint::RawFingerprint raw{1, 2, 3, 4, 5, 6, 7, 8};
	const auto binary = Fingerprint::EncodeFingerprint(GetEngine(), raw,
							   Algorithm::TEST2,
							   false);
	ASSERT_GT(binary.size(), 3u);

	try {
		Fingerprint::DecodeFingerprint(GetEngine(),
					       std::string_view{binary}.substr(0, 3),
					       false);
		FAIL();
	} catch (const FingerprintError &e) {
		EXPECT_EQ(e.GetKind(), Kind::DECODE);
	}
}

TEST_F(ChromaprintTest, DecodeUnknownAlgorithm)
{
	const Fingerprint::RawFingerprint raw{1, 2, 3};
	auto binary = Fingerprint::EncodeFingerprint(GetEngine(), raw,
						     Algorithm::TEST2, false);
	ASSERT_FALSE(binary.empty());

	/* the first byte is the algorithm tag */
	binary[0] = char(0x42);

	try {
		Fingerprint::DecodeFingerprint(GetEngine(), binary, false);
		FAIL();
	} catch (const FingerprintError &e) {
		EXPECT_EQ(e.GetKind(), Kind::DECODE);
	}
}
