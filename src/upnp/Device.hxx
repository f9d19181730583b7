// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_DEVICE_HXX
#define NMC_UPNP_DEVICE_HXX

#include <string>
#include <string_view>
#include <vector>

static constexpr const char *UPNP_DEVICE_NAMESPACE =
	"urn:schemas-upnp-org:device-1-0";

/**
 * Data holder for a UPnP service, parsed from the device
 * description.
 */
struct UPnPService {
	// e.g. urn:schemas-upnp-org:service:ContentDirectory:1
	std::string service_type;

	// e.g. /upnp/control/content_directory (may be relative)
	std::string control_url;
};

/**
 * Data holder for a UPnP device, parsed from the XML description
 * obtained during discovery.  Only the root device is considered;
 * embedded devices are ignored.
 */
struct UPnPDevice {
	// e.g. urn:schemas-upnp-org:device:MediaServer:1
	std::string device_type;

	// e.g. FRITZ!Box Media
	std::string friendly_name;

	// e.g. uuid:a7bdcd12-e6c1-4c7e-b588-3bbc959eda8d
	std::string udn;

	// e.g. AVM Berlin
	std::string manufacturer;

	std::vector<UPnPService> services;

	/**
	 * Parse a device description document.  A missing
	 * friendlyName becomes "Unknown Device".
	 *
	 * Throws on XML error or if there is no device element.
	 */
	void Parse(std::string_view description);

	[[gnu::pure]]
	bool IsMediaServer() const noexcept {
		return device_type.find("MediaServer") != std::string::npos;
	}

	/**
	 * Find the first service whose type contains the given
	 * string.
	 */
	[[gnu::pure]]
	const UPnPService *FindService(std::string_view type) const noexcept;
};

#endif
