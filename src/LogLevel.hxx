// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The fpkit Project

#ifndef FPKIT_LOG_LEVEL_HXX
#define FPKIT_LOG_LEVEL_HXX

enum class LogLevel {
	/**
	 * Engine calls and session state transitions.
	 */
	DEBUG,

	/**
	 * Unimportant informational message.
	 */
	INFO,

	/**
	 * Interesting informational message.
	 */
	NOTICE,

	/**
	 * Warning: something may be wrong.
	 */
	WARNING,

	/**
	 * An error has occurred, an operation could not finish
	 * successfully.
	 */
	ERROR,
};

#endif
