// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_LOG_HXX
#define FPKIT_LOG_HXX

#include "LogLevel.hxx"

#include <fmt/core.h>

#include <exception>
#include <string_view>
#include <utility>

class Domain;

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept;

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
void
LogFmt(LogLevel level, const Domain &domain,
       const S &format_str, Args&&... args) noexcept
{
	return LogVFmt(level, domain, format_str,
		       fmt::make_format_args(args...));
}

template<typename S, typename... Args>
void
FmtDebug(const Domain &domain,
	 const S &format_str, Args&&... args) noexcept
{
	LogFmt(LogLevel::DEBUG, domain, format_str, args...);
}

/**
 * Log the exception and its nested chain in one line.
 */
void
Log(LogLevel level, const std::exception_ptr &ep) noexcept;

static inline void
LogDebug(const Domain &domain, const char *msg) noexcept
{
	Log(LogLevel::DEBUG, domain, msg);
}

inline void
LogError(const std::exception_ptr &ep) noexcept
{
	Log(LogLevel::ERROR, ep);
}

#endif
