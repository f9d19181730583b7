// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_MEDIA_SERVER_HXX
#define NMC_UPNP_MEDIA_SERVER_HXX

#include "Ssdp.hxx"

#include <string>

/**
 * A resolved UPnP MediaServer which exposes a ContentDirectory
 * service.  Identified by its UDN.
 */
struct MediaServer {
	std::string name;

	std::string udn;

	/**
	 * The URL of the device description.
	 */
	std::string base_url;

	/**
	 * The absolute control URL of the ContentDirectory service.
	 */
	std::string control_url;

	std::string manufacturer;

	/**
	 * The SSDP response this server was found with.
	 */
	DiscoveredDevice device;
};

#endif
