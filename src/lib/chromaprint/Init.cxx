// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "Init.hxx"
#include "Domain.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/NumberParser.hxx"
#include "Log.hxx"

#include <chromaprint.h>

#include <string_view>

/**
 * Extract the major version from a string like "1.5.1".
 */
static unsigned
ParseMajorVersion(std::string_view version)
{
	const auto dot = version.find('.');
	const auto major = ParseInteger<unsigned>(version.substr(0, dot));
	if (!major)
		throw FmtRuntimeError("Malformed libchromaprint version: \"{}\"",
				      version);

	return *major;
}

ScopeChromaprintInit::ScopeChromaprintInit()
{
	const char *version = engine.GetVersion();
	if (version == nullptr)
		throw std::runtime_error("libchromaprint did not report its version");

	const unsigned major = ParseMajorVersion(version);
	if (major != CHROMAPRINT_VERSION_MAJOR)
		throw FmtRuntimeError("libchromaprint {} is incompatible, need {}.x",
				      version, CHROMAPRINT_VERSION_MAJOR);

	FmtDebug(chromaprint_domain, "libchromaprint {}", version);
}
