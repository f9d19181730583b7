// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_CONFIG_FILE_HXX
#define NMC_CONFIG_FILE_HXX

#include <iosfwd>

struct ConfigData;

/**
 * Read configuration settings from a stream.  Each line has the
 * form `name "value"`; empty lines and lines starting with '#' are
 * ignored.
 *
 * Throws on error, with the name and the line number in the
 * message.
 *
 * @param name the name of the source, used in error messages
 */
void
ReadConfigFile(ConfigData &config_data, std::istream &is, const char *name);

/**
 * Throws on error.
 */
void
ReadConfigFile(ConfigData &config_data, const char *path);

#endif
