// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "ChromaprintEngine.hxx"
#include "Domain.hxx"
#include "Log.hxx"

#include <chromaprint.h>

#include <climits>
#include <memory>
#include <utility>

/**
 * Releases buffers allocated by libchromaprint.
 */
struct ChromaprintDeleter {
	void operator()(void *p) const noexcept {
		chromaprint_dealloc(p);
	}
};

template<typename T>
using ChromaprintPtr = std::unique_ptr<T, ChromaprintDeleter>;

struct ChromaprintContextDeleter {
	void operator()(ChromaprintContext *ctx) const noexcept {
		chromaprint_free(ctx);
	}
};

using ChromaprintContextPtr =
	std::unique_ptr<ChromaprintContext, ChromaprintContextDeleter>;

static bool
Check(int result, const char *function) noexcept
{
	if (result == 1)
		return true;

	FmtDebug(chromaprint_domain, "{}() failed", function);
	return false;
}

/*
 * libchromaprint declares fingerprints as uint32_t arrays; int32_t
 * and uint32_t have the same object representation, so the items
 * are reinterpreted, not converted.
 */

static void
CopyRaw(Fingerprint::RawFingerprint &dest, const uint32_t *src, int size)
{
	const auto *items = reinterpret_cast<const int32_t *>(src);
	dest.assign(items, items + size);
}

static const uint32_t *
ToUnsigned(std::span<const int32_t> src) noexcept
{
	return reinterpret_cast<const uint32_t *>(src.data());
}

namespace {

class ChromaprintEngineContext final : public Fingerprint::EngineContext {
	const ChromaprintContextPtr ctx;

public:
	explicit ChromaprintEngineContext(ChromaprintContextPtr &&_ctx) noexcept
		:ctx(std::move(_ctx)) {}

	bool Start(unsigned sample_rate, unsigned channels) noexcept override {
		if (sample_rate > INT_MAX || channels > INT_MAX)
			return false;

		return Check(chromaprint_start(ctx.get(), sample_rate, channels),
			     "chromaprint_start");
	}

	bool Feed(std::span<const int16_t> samples) noexcept override {
		if (samples.size() > INT_MAX)
			return false;

		return Check(chromaprint_feed(ctx.get(), samples.data(),
					      samples.size()),
			     "chromaprint_feed");
	}

	bool Finish() noexcept override {
		return Check(chromaprint_finish(ctx.get()), "chromaprint_finish");
	}

	bool GetFingerprint(std::string &result) override {
		char *fingerprint;
		if (!Check(chromaprint_get_fingerprint(ctx.get(), &fingerprint),
			   "chromaprint_get_fingerprint"))
			return false;

		const ChromaprintPtr<char> holder(fingerprint);
		result = fingerprint;
		return true;
	}

	bool GetRawFingerprint(Fingerprint::RawFingerprint &result) override {
		uint32_t *fingerprint;
		int size;
		if (!Check(chromaprint_get_raw_fingerprint(ctx.get(), &fingerprint,
							   &size),
			   "chromaprint_get_raw_fingerprint"))
			return false;

		const ChromaprintPtr<uint32_t> holder(fingerprint);
		CopyRaw(result, fingerprint, size);
		return true;
	}

	bool GetHash(uint32_t &result) noexcept override {
		return Check(chromaprint_get_fingerprint_hash(ctx.get(), &result),
			     "chromaprint_get_fingerprint_hash");
	}
};

} // anonymous namespace

std::size_t
ChromaprintEngine::GetMaxFeedSamples() const noexcept
{
	return INT_MAX;
}

std::unique_ptr<Fingerprint::EngineContext>
ChromaprintEngine::NewContext(Fingerprint::Algorithm algorithm)
{
	ChromaprintContextPtr ctx{chromaprint_new(Fingerprint::ToTag(algorithm))};
	if (ctx == nullptr) {
		LogDebug(chromaprint_domain, "chromaprint_new() failed");
		return nullptr;
	}

	return std::make_unique<ChromaprintEngineContext>(std::move(ctx));
}

bool
ChromaprintEngine::DecodeFingerprint(std::span<const std::byte> src,
				     bool base64,
				     Fingerprint::RawFingerprint &result,
				     int &algorithm)
{
	if (src.size() > INT_MAX)
		return false;

	uint32_t *fingerprint = nullptr;
	int size = 0;
	const int status =
		chromaprint_decode_fingerprint(reinterpret_cast<const char *>(src.data()),
					       src.size(),
					       &fingerprint, &size,
					       &algorithm, base64);

	/* the buffer may have been allocated even if decoding
	   failed */
	const ChromaprintPtr<uint32_t> holder(fingerprint);
	if (!Check(status, "chromaprint_decode_fingerprint"))
		return false;

	CopyRaw(result, fingerprint, size);
	return true;
}

bool
ChromaprintEngine::EncodeFingerprint(std::span<const int32_t> src,
				     Fingerprint::Algorithm algorithm,
				     bool base64, std::string &result)
{
	if (src.size() > INT_MAX)
		return false;

	char *encoded = nullptr;
	int encoded_size = 0;
	const int status =
		chromaprint_encode_fingerprint(ToUnsigned(src), src.size(),
					       Fingerprint::ToTag(algorithm),
					       &encoded, &encoded_size,
					       base64);

	const ChromaprintPtr<char> holder(encoded);
	if (!Check(status, "chromaprint_encode_fingerprint") ||
	    encoded == nullptr)
		return false;

	result.assign(encoded, encoded_size);
	return true;
}

bool
ChromaprintEngine::HashFingerprint(std::span<const int32_t> src,
				   uint32_t &result) noexcept
{
	if (src.size() > INT_MAX)
		return false;

	return Check(chromaprint_hash_fingerprint(ToUnsigned(src),
						  src.size(), &result),
		     "chromaprint_hash_fingerprint");
}

const char *
ChromaprintEngine::GetVersion() const noexcept
{
	return chromaprint_get_version();
}
