// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "Session.hxx"
#include "CatalogWalker.hxx"
#include "ContentDirectoryService.hxx"
#include "DeviceResolver.hxx"
#include "Discovery.hxx"
#include "Domain.hxx"
#include "util/ASCII.hxx"
#include "Log.hxx"

#include <algorithm>
#include <stdexcept>

bool
UpnpSession::Connect(std::string_view name) noexcept
{
	if (servers.empty()) {
		LogError(upnp_domain, "No media servers discovered");
		return false;
	}

	if (name.empty()) {
		connected = 0;
	} else {
		const auto i = std::find_if(servers.begin(), servers.end(),
					    [name](const MediaServer &server){
						    return StringContainsCaseASCII(server.name, name);
					    });
		if (i == servers.end()) {
			FmtError(upnp_domain, "Media server \"{}\" not found", name);
			return false;
		}

		connected = std::size_t(i - servers.begin());
	}

	FmtInfo(upnp_domain, "Connected to media server: {}",
		servers[*connected].name);
	return true;
}

const MediaServer &
UpnpSession::GetConnected() const
{
	if (!connected)
		throw std::logic_error("Not connected to any media server");

	return servers[*connected];
}

std::optional<ServerInfo>
UpnpSession::GetServerInfo() const noexcept
{
	if (!connected)
		return std::nullopt;

	const auto &server = servers[*connected];
	return ServerInfo{
		server.name,
		server.udn,
		server.base_url,
		server.control_url,
		"UPnP/DLNA Media Server",
	};
}

std::vector<CatalogEntry>
UpnpSession::Browse(HttpClient &http, const std::string &container_id) const
{
	ContentDirectoryService service(http, GetConnected());
	return service.Browse(container_id);
}

CatalogSnapshot
UpnpSession::Walk(HttpClient &http, const CatalogWalkParams &params) const
{
	const auto &server = GetConnected();

	FmtInfo(catalog_domain,
		"Browsing media files from container \"{}\" (max depth: {})",
		params.root, params.max_depth);

	ContentDirectoryService service(http, server);
	return WalkCatalog(service, params);
}

UpnpSession
DiscoverMediaServers(HttpClient &http, const SsdpSearchParams &params,
		     unsigned resolve_threads)
{
	LogInfo(ssdp_domain, "Discovering UPnP media servers");

	const auto devices = SsdpSearch(params);
	auto servers = ResolveDevices(devices, http, resolve_threads);

	FmtInfo(upnp_domain, "Discovered {} media server(s)", servers.size());
	return UpnpSession(std::move(servers));
}

const MediaServer *
FindPreferredServer(std::span<const MediaServer> servers) noexcept
{
	for (const auto &i : servers) {
		if (StringContainsCaseASCII(i.name, "fritz") ||
		    StringContainsCaseASCII(i.name, "avm") ||
		    StringContainsCaseASCII(i.manufacturer, "avm")) {
			FmtInfo(upnp_domain, "Found Fritz Box media server: {}",
				i.name);
			return &i;
		}
	}

	if (servers.empty())
		return nullptr;

	FmtInfo(upnp_domain,
		"No Fritz Box found, using first available server: {}",
		servers.front().name);
	return &servers.front();
}
