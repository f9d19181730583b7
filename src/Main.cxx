// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "CommandLine.hxx"
#include "LogInit.hxx"
#include "Log.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "lib/curl/Init.hxx"
#include "lib/curl/HttpClient.hxx"
#include "playlist/Composer.hxx"
#include "playlist/M3u.hxx"
#include "playlist/MediaFile.hxx"
#include "upnp/CatalogWalker.hxx"
#include "upnp/Discovery.hxx"
#include "upnp/Session.hxx"
#include "util/Domain.hxx"

#include <fmt/core.h>

#include <stdlib.h>

static constexpr Domain main_domain("main");

static constexpr unsigned DEFAULT_RESOLVE_THREADS = 4;
static constexpr unsigned DEFAULT_BROWSE_THREADS = 2;

static SsdpSearchParams
LoadSearchParams(const ConfigData &config)
{
	SsdpSearchParams params;

	unsigned timeout = config.GetPositive(ConfigOption::DISCOVERY_TIMEOUT,
					      SSDP_MAX_MX);
	if (timeout > SSDP_MAX_MX) {
		FmtWarning(main_domain,
			   "discovery_timeout {} is too large, using {}",
			   timeout, SSDP_MAX_MX);
		timeout = SSDP_MAX_MX;
	}

	params.timeout = std::chrono::seconds(timeout);
	return params;
}

static CatalogWalkParams
LoadWalkParams(const ConfigData &config)
{
	CatalogWalkParams params;
	params.root = config.GetString(ConfigOption::ROOT_CONTAINER, "0");
	params.max_depth = config.GetUnsigned(ConfigOption::MAX_DEPTH,
					      params.max_depth);
	params.max_containers = config.GetPositive(ConfigOption::MAX_CONTAINERS,
						   params.max_containers);
	params.threads = config.GetPositive(ConfigOption::BROWSE_THREADS,
					    DEFAULT_BROWSE_THREADS);
	return params;
}

static void
ListServers(const UpnpSession &session)
{
	for (const auto &i : session.GetServers())
		fmt::print("{}\t{}\t{}\n", i.name, i.udn, i.control_url);
}

static void
WritePlaylists(const char *directory,
	       const std::vector<PlaylistSpec> &playlists,
	       const std::vector<MediaFile> &files)
{
	for (const auto &i : playlists) {
		const auto path = WriteM3uFile(directory, i, files);
		FmtNotice(main_domain, "Wrote playlist \"{}\" to {}",
			  i.name, path);
	}
}

static int
MainConfigured(const CommandLineOptions &options, const ConfigData &config)
{
	const ScopeCurlInit curl_init;
	CurlHttpClient http;

	auto session =
		DiscoverMediaServers(http, LoadSearchParams(config),
				     config.GetPositive(ConfigOption::RESOLVE_THREADS,
							DEFAULT_RESOLVE_THREADS));

	if (options.list_only) {
		ListServers(session);
		return EXIT_SUCCESS;
	}

	std::string_view server_name =
		config.GetString(ConfigOption::SERVER_NAME, "");
	if (server_name.empty()) {
		if (const auto *preferred =
		    FindPreferredServer(session.GetServers()))
			server_name = preferred->name;
	}

	if (!session.Connect(server_name))
		return EXIT_FAILURE;

	const auto now = std::chrono::system_clock::now();
	const auto snapshot = session.Walk(http, LoadWalkParams(config));
	const auto files = MakeMediaFiles(snapshot, now);
	FmtNotice(main_domain, "Cataloged {} media files", files.size());

	const auto playlists = Compose(files, now);

	const char *directory = config.GetString(ConfigOption::PLAYLIST_DIR,
						 ".");
	WritePlaylists(directory, playlists.auto_playlists, files);
	WritePlaylists(directory, playlists.smart_playlists, files);

	return EXIT_SUCCESS;
}

static int
MainOrThrow(int argc, char *argv[])
{
	CommandLineOptions options;
	ConfigData config;

	ParseCommandLine(argc, argv, options, config);
	log_init(config, options.verbose);

	return MainConfigured(options, config);
}

int
main(int argc, char *argv[]) noexcept
try {
	return MainOrThrow(argc, argv);
} catch (...) {
	LogError(std::current_exception());
	return EXIT_FAILURE;
}
