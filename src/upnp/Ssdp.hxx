// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_SSDP_HXX
#define NMC_UPNP_SSDP_HXX

#include <optional>
#include <string>
#include <string_view>
#include <vector>

static constexpr const char *SSDP_MULTICAST_ADDRESS = "239.255.255.250";
static constexpr unsigned SSDP_PORT = 1900;

static constexpr const char *MEDIA_SERVER_DEVICE_TYPE =
	"urn:schemas-upnp-org:device:MediaServer:1";

/**
 * Upper bound for the "MX" header (maximum response delay in
 * seconds) and for the length of one discovery run.
 */
static constexpr unsigned SSDP_MAX_MX = 5;

/**
 * One device which answered an M-SEARCH request.  Lives only for the
 * duration of one discovery run.
 */
struct DiscoveredDevice {
	/**
	 * The URL of the device description ("LOCATION" header).
	 */
	std::string location;

	/**
	 * The "SERVER" header.
	 */
	std::string server;

	/**
	 * The search target ("ST" header).
	 */
	std::string search_target;

	/**
	 * The unique service name ("USN" header).
	 */
	std::string usn;

	bool operator==(const DiscoveredDevice &) const noexcept = default;
};

/**
 * Build the M-SEARCH request datagram.
 *
 * @param mx the "MX" header value in seconds
 */
[[gnu::pure]]
std::string
FormatMSearch(std::string_view search_target, unsigned mx) noexcept;

/**
 * Parse one SSDP response datagram.  Only "HTTP/1.1 200 OK"
 * responses with a "LOCATION" header are accepted.  Header names are
 * case-insensitive.
 *
 * @return the device or std::nullopt if the datagram is not usable
 */
[[gnu::pure]]
std::optional<DiscoveredDevice>
ParseSsdpResponse(std::string_view response) noexcept;

/**
 * Collects devices from SSDP responses, ignoring repeated responses
 * with the same (LOCATION, USN) pair.  Insertion order is preserved.
 */
class SsdpCollector {
	std::vector<DiscoveredDevice> devices;

public:
	/**
	 * @return true if the device was new
	 */
	bool Add(DiscoveredDevice &&device) noexcept;

	const std::vector<DiscoveredDevice> &GetDevices() const noexcept {
		return devices;
	}

	std::vector<DiscoveredDevice> Steal() noexcept {
		return std::move(devices);
	}
};

#endif
