// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_FMT_RUNTIME_ERROR_HXX
#define FPKIT_FMT_RUNTIME_ERROR_HXX

#include <fmt/core.h>

#include <stdexcept> // IWYU pragma: export
#include <utility>

template<typename... Args>
[[nodiscard]] [[gnu::cold]]
inline std::runtime_error
FmtRuntimeError(fmt::format_string<Args...> format_str, Args&&... args)
{
	return std::runtime_error(fmt::format(format_str,
					      std::forward<Args>(args)...));
}

template<typename... Args>
[[nodiscard]] [[gnu::cold]]
inline std::invalid_argument
FmtInvalidArgument(fmt::format_string<Args...> format_str, Args&&... args)
{
	return std::invalid_argument(fmt::format(format_str,
						 std::forward<Args>(args)...));
}

#endif
