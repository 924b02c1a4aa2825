// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_LOG_BACKEND_HXX
#define FPKIT_LOG_BACKEND_HXX

#include "LogLevel.hxx"

/**
 * Messages below this level are discarded.  The default is
 * #LogLevel::NOTICE.
 */
void
SetLogThreshold(LogLevel _threshold) noexcept;

#endif
