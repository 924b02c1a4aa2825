// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_DOMAIN_HXX
#define FPKIT_DOMAIN_HXX

/**
 * Names the subsystem a log message comes from.  Instances are
 * compared by identity, so each subsystem declares exactly one
 * static instance.
 */
class Domain {
	const char *const name;

public:
	constexpr explicit Domain(const char *_name) noexcept
		:name(_name) {}

	Domain(const Domain &) = delete;
	Domain &operator=(const Domain &) = delete;

	constexpr const char *GetName() const noexcept {
		return name;
	}

	bool operator==(const Domain &other) const noexcept {
		return this == &other;
	}
};

#endif
