// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_LOG_INIT_HXX
#define NMC_LOG_INIT_HXX

#include "LogLevel.hxx"

struct ConfigData;

/**
 * Parse a log level name ("debug", "info", "notice", "warning",
 * "error").  Throws on error.
 */
LogLevel
ParseLogLevel(const char *value);

/**
 * Configure the log backend from the configuration file.
 *
 * Throws on error.
 *
 * @param verbose true if "--verbose" was given; it overrides the
 * configured level
 */
void
log_init(const ConfigData &config, bool verbose);

#endif
