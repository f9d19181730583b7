// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "Templates.hxx"
#include "Option.hxx"
#include "util/StringAPI.hxx"

#include <iterator>

const ConfigTemplate config_param_templates[] = {
	{ "discovery_timeout" },
	{ "server_name" },
	{ "root_container" },
	{ "max_depth" },
	{ "max_containers" },
	{ "resolve_threads" },
	{ "browse_threads" },
	{ "playlist_directory" },
	{ "log_level" },
	{ "log_timestamp" },
};

static constexpr unsigned n_config_param_templates =
	std::size(config_param_templates);

static_assert(n_config_param_templates == unsigned(ConfigOption::MAX));

ConfigOption
ParseConfigOptionName(const char *name) noexcept
{
	for (unsigned i = 0; i < n_config_param_templates; ++i)
		if (StringIsEqual(config_param_templates[i].name, name))
			return ConfigOption(i);

	return ConfigOption::MAX;
}
