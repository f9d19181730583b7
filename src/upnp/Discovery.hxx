// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_DISCOVERY_HXX
#define NMC_UPNP_DISCOVERY_HXX

#include "Ssdp.hxx"
#include "net/IPv4Address.hxx"

#include <chrono>
#include <string>
#include <vector>

struct SsdpSearchParams {
	/**
	 * Where the M-SEARCH request is sent to; usually the SSDP
	 * multicast group.
	 */
	IPv4Address destination{239, 255, 255, 250, SSDP_PORT};

	std::string search_target = MEDIA_SERVER_DEVICE_TYPE;

	/**
	 * How long to collect responses.  This is also sent as the
	 * "MX" header (clamped to 1..#SSDP_MAX_MX seconds).
	 */
	std::chrono::seconds timeout{SSDP_MAX_MX};
};

/**
 * Send one M-SEARCH request and collect the responses until the
 * timeout expires (wall clock, not number of responses).  Repeated
 * responses from the same device are collapsed.
 *
 * This function does not throw: socket errors are logged and result
 * in an empty (or partial) list.
 */
std::vector<DiscoveredDevice>
SsdpSearch(const SsdpSearchParams &params) noexcept;

#endif
