// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_SESSION_HXX
#define NMC_UPNP_SESSION_HXX

#include "MediaServer.hxx"
#include "Object.hxx"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

class HttpClient;
struct SsdpSearchParams;
struct CatalogWalkParams;

struct ServerInfo {
	std::string name;
	std::string udn;
	std::string base_url;
	std::string control_url;
	std::string type;
};

/**
 * The state of one discovery-to-catalog cycle: the servers found by
 * discovery and the one we are connected to.
 */
class UpnpSession {
	std::vector<MediaServer> servers;

	/**
	 * Index into #servers.
	 */
	std::optional<std::size_t> connected;

public:
	UpnpSession() = default;

	explicit UpnpSession(std::vector<MediaServer> &&_servers) noexcept
		:servers(std::move(_servers)) {}

	const std::vector<MediaServer> &GetServers() const noexcept {
		return servers;
	}

	/**
	 * Connect to the first server whose name contains the given
	 * string (case-insensitive), or to the first server if the
	 * string is empty.  Failures are logged.
	 *
	 * @return true on success
	 */
	bool Connect(std::string_view name) noexcept;

	bool IsConnected() const noexcept {
		return connected.has_value();
	}

	/**
	 * Throws std::logic_error if not connected.
	 */
	const MediaServer &GetConnected() const;

	[[gnu::pure]]
	std::optional<ServerInfo> GetServerInfo() const noexcept;

	/**
	 * Browse one container of the connected server.
	 *
	 * Throws std::logic_error if not connected.
	 */
	std::vector<CatalogEntry> Browse(HttpClient &http,
					 const std::string &container_id) const;

	/**
	 * Walk the catalog of the connected server.
	 *
	 * Throws std::logic_error if not connected.
	 */
	CatalogSnapshot Walk(HttpClient &http,
			     const CatalogWalkParams &params) const;
};

/**
 * Run SSDP discovery and resolve all responding devices.
 *
 * Throws std::system_error if a worker thread cannot be created.
 */
UpnpSession
DiscoverMediaServers(HttpClient &http, const SsdpSearchParams &params,
		     unsigned resolve_threads);

/**
 * Pick the preferred server: the first one made by AVM (a
 * "FRITZ!Box", recognized by its name or manufacturer), else the
 * first one.
 *
 * @return nullptr if the list is empty
 */
const MediaServer *
FindPreferredServer(std::span<const MediaServer> servers) noexcept;

#endif
