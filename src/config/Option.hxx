// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_CONFIG_OPTION_HXX
#define NMC_CONFIG_OPTION_HXX

enum class ConfigOption {
	DISCOVERY_TIMEOUT,
	SERVER_NAME,
	ROOT_CONTAINER,
	MAX_DEPTH,
	MAX_CONTAINERS,
	RESOLVE_THREADS,
	BROWSE_THREADS,
	PLAYLIST_DIR,
	LOG_LEVEL,
	LOG_TIMESTAMP,
	MAX
};

/**
 * @return #ConfigOption::MAX if not found
 */
[[gnu::pure]]
enum ConfigOption
ParseConfigOptionName(const char *name) noexcept;

#endif
