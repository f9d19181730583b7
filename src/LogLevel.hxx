// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_LOG_LEVEL_HXX
#define NMC_LOG_LEVEL_HXX

enum class LogLevel {
	/**
	 * Debug message for developers.
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
