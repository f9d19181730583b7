// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_DEVICE_RESOLVER_HXX
#define NMC_UPNP_DEVICE_RESOLVER_HXX

#include "MediaServer.hxx"

#include <chrono>
#include <optional>
#include <span>
#include <vector>

struct DiscoveredDevice;
class HttpClient;

static constexpr std::chrono::seconds DESCRIPTION_TIMEOUT{5};

/**
 * Fetch and parse the device description of a discovered device.
 *
 * @return the MediaServer, or std::nullopt if the device is not a
 * MediaServer, has no ContentDirectory service, or could not be
 * fetched/parsed (the latter two are logged)
 */
std::optional<MediaServer>
ResolveDevice(const DiscoveredDevice &device, HttpClient &http) noexcept;

/**
 * Resolve all devices with a bounded number of worker threads.  The
 * result keeps the order of the input; devices which fail to resolve
 * are omitted.
 *
 * Throws std::system_error if a worker thread cannot be created.
 *
 * @param n_threads the maximum number of concurrent requests
 */
std::vector<MediaServer>
ResolveDevices(std::span<const DiscoveredDevice> devices, HttpClient &http,
	       unsigned n_threads);

#endif
