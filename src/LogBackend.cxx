// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "util/Domain.hxx"

#include <fmt/core.h>

#include <stdio.h>

static LogLevel log_threshold = LogLevel::NOTICE;

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold = _threshold;
}

/**
 * Strip trailing whitespace (including the newline some library
 * messages end with).
 */
static std::string_view
chomp(std::string_view p) noexcept
{
	while (!p.empty() && (unsigned char)p.back() <= ' ')
		p.remove_suffix(1);
	return p;
}

static void
FileLog(const Domain &domain, std::string_view message) noexcept
{
	fmt::print(stderr, "{}: {}\n",
		   domain.GetName(),
		   chomp(message));
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < log_threshold)
		return;

	FileLog(domain, msg);
}
