// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_CHROMAPRINT_INIT_HXX
#define FPKIT_CHROMAPRINT_INIT_HXX

#include "ChromaprintEngine.hxx"

/**
 * Verifies once per process that the libchromaprint found at runtime
 * is compatible with the headers this program was built against, and
 * provides the #ChromaprintEngine instance.
 *
 * Throws std::runtime_error if the library is unusable.
 */
class ScopeChromaprintInit {
	ChromaprintEngine engine;

public:
	ScopeChromaprintInit();

	ScopeChromaprintInit(const ScopeChromaprintInit &) = delete;
	ScopeChromaprintInit &operator=(const ScopeChromaprintInit &) = delete;

	ChromaprintEngine &GetEngine() noexcept {
		return engine;
	}
};

#endif
