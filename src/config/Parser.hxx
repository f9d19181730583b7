// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_CONFIG_PARSER_HXX
#define NMC_CONFIG_PARSER_HXX

/**
 * Throws on error.
 */
bool
ParseBool(const char *value);

/**
 * Throws on error.
 */
long
ParseLong(const char *s);

/**
 * Throws on error.
 */
unsigned
ParseUnsigned(const char *s);

/**
 * Throws on error.
 */
unsigned
ParsePositive(const char *s);

#endif
