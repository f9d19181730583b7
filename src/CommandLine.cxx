// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "CommandLine.hxx"
#include "Log.hxx"
#include "config/Data.hxx"
#include "config/File.hxx"
#include "config/Option.hxx"
#include "config/Param.hxx"
#include "config/Parser.hxx"
#include "util/Domain.hxx"
#include "util/OptionDef.hxx"
#include "util/OptionParser.hxx"

#include <stdexcept>

#include <stdio.h>
#include <stdlib.h>

enum Option {
	OPTION_CONFIG,
	OPTION_VERBOSE,
	OPTION_SERVER,
	OPTION_DEPTH,
	OPTION_OUTPUT,
	OPTION_LIST,
	OPTION_VERSION,
	OPTION_HELP,
	OPTION_HELP2,
};

static constexpr OptionDef option_defs[] = {
	{"config", 'c', "FILE", "load settings from this file"},
	{"verbose", 'v', "verbose logging"},
	{"server", 's', "NAME", "connect to the server with this name"},
	{"depth", 'd', "N", "browse at most N container levels"},
	{"output", 'o', "DIR", "write playlists to this directory"},
	{"list", 'l', "only list the media servers"},
	{"version", 'V', "print version number"},
	{"help", 'h', "show help options"},
	{nullptr, '?', nullptr}, // hidden, standard alias for --help
};

static constexpr Domain cmdline_domain("cmdline");

[[noreturn]]
static void version()
{
	printf("NAS Media Catalog " NMC_VERSION "\n"
	       "This is free software; see the source for copying conditions.  There is NO\n"
	       "warranty; not even MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.\n");

	std::exit(EXIT_SUCCESS);
}

static void PrintOption(const OptionDef &opt)
{
	char long_option[32];
	if (opt.HasValue())
		snprintf(long_option, sizeof(long_option), "%s %s",
			 opt.GetLongOption(), opt.GetValueName());
	else
		snprintf(long_option, sizeof(long_option), "%s",
			 opt.GetLongOption());

	if (opt.HasShortOption())
		printf("  -%c, --%-14s%s\n",
		       opt.GetShortOption(),
		       long_option,
		       opt.GetDescription());
	else
		printf("  --%-18s%s\n",
		       long_option,
		       opt.GetDescription());
}

[[noreturn]]
static void help()
{
	printf("Usage:\n"
	       "  nmc [OPTION...]\n"
	       "\n"
	       "Discover UPnP/DLNA media servers and build M3U playlists.\n"
	       "\n"
	       "Options:\n");

	for (const auto &i : option_defs)
		if (i.HasDescription())
			PrintOption(i);

	std::exit(EXIT_SUCCESS);
}

void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config)
{
	const char *config_file = nullptr;
	const char *server = nullptr, *depth = nullptr, *output = nullptr;

	OptionParser parser(option_defs, argc, argv);
	while (auto o = parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_CONFIG:
			config_file = o.value;
			break;

		case OPTION_VERBOSE:
			options.verbose = true;
			break;

		case OPTION_SERVER:
			server = o.value;
			break;

		case OPTION_DEPTH:
			/* validate early for a better error message */
			(void)ParseUnsigned(o.value);
			depth = o.value;
			break;

		case OPTION_OUTPUT:
			output = o.value;
			break;

		case OPTION_LIST:
			options.list_only = true;
			break;

		case OPTION_VERSION:
			version();

		case OPTION_HELP:
		case OPTION_HELP2:
			help();
		}
	}

	if (!parser.GetRemaining().empty())
		throw std::runtime_error("too many arguments");

	if (config_file != nullptr)
		ReadConfigFile(config, config_file);
	else
		LogDebug(cmdline_domain, "No configuration file, using defaults");

	/* command line settings override the configuration file */

	if (server != nullptr)
		config.SetParam(ConfigOption::SERVER_NAME, ConfigParam{server});

	if (depth != nullptr)
		config.SetParam(ConfigOption::MAX_DEPTH, ConfigParam{depth});

	if (output != nullptr)
		config.SetParam(ConfigOption::PLAYLIST_DIR, ConfigParam{output});
}
