// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_COMMAND_LINE_HXX
#define NMC_COMMAND_LINE_HXX

struct ConfigData;

struct CommandLineOptions {
	bool verbose = false;

	/**
	 * Only discover and print the media servers.
	 */
	bool list_only = false;
};

/**
 * Parse the command line, load the configuration file (if one was
 * given) and apply command line overrides to #config.
 *
 * Throws on error.
 */
void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config);

#endif
