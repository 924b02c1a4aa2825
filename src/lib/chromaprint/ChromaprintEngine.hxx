// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_CHROMAPRINT_ENGINE_HXX
#define FPKIT_CHROMAPRINT_ENGINE_HXX

#include "fingerprint/Engine.hxx"

/**
 * The #Fingerprint::Engine implementation backed by libchromaprint.
 * It has no state of its own; one instance may be shared by all
 * sessions.
 *
 * Call ScopeChromaprintInit before using it.
 */
class ChromaprintEngine final : public Fingerprint::Engine {
public:
	/* virtual methods from class Fingerprint::Engine */
	std::size_t GetMaxFeedSamples() const noexcept override;
	std::unique_ptr<Fingerprint::EngineContext> NewContext(Fingerprint::Algorithm algorithm) override;
	bool DecodeFingerprint(std::span<const std::byte> src, bool base64,
			       Fingerprint::RawFingerprint &result,
			       int &algorithm) override;
	bool EncodeFingerprint(std::span<const int32_t> src,
			       Fingerprint::Algorithm algorithm, bool base64,
			       std::string &result) override;
	bool HashFingerprint(std::span<const int32_t> src,
			     uint32_t &result) noexcept override;
	const char *GetVersion() const noexcept override;
};

#endif
