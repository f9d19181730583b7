// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "DeviceResolver.hxx"
#include "Device.hxx"
#include "Domain.hxx"
#include "HttpClient.hxx"
#include "Ssdp.hxx"
#include "WorkQueue.hxx"
#include "lib/curl/HttpStatusError.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/UriUtil.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <algorithm>

static UPnPDevice
FetchDeviceDescription(const std::string &location, HttpClient &http)
{
	auto response = http.Get(location, DESCRIPTION_TIMEOUT);
	if (response.status != 200)
		throw HttpStatusError(response.status,
				      fmt::format("Got HTTP status {}",
						  response.status));

	UPnPDevice device;
	device.Parse(response.body);
	return device;
}

std::optional<MediaServer>
ResolveDevice(const DiscoveredDevice &discovered, HttpClient &http) noexcept
{
	if (discovered.location.empty())
		return std::nullopt;

	UPnPDevice device;

	try {
		device = FetchDeviceDescription(discovered.location, http);
	} catch (...) {
		FmtWarning(upnp_domain,
			   "Failed to fetch device description from {}: {}",
			   discovered.location, std::current_exception());
		return std::nullopt;
	}

	if (!device.IsMediaServer()) {
		FmtDebug(upnp_domain, "Ignoring {} device at {}",
			 device.device_type, discovered.location);
		return std::nullopt;
	}

	const auto *service = device.FindService("ContentDirectory");
	if (service == nullptr || service->control_url.empty()) {
		FmtWarning(upnp_domain, "No ContentDirectory service found for {}",
			   device.friendly_name);
		return std::nullopt;
	}

	auto control_url = uri_apply_relative(service->control_url,
					      discovered.location);

	MediaServer server;
	server.name = std::move(device.friendly_name);
	server.udn = std::move(device.udn);
	server.base_url = discovered.location;
	server.control_url = std::move(control_url);
	server.manufacturer = std::move(device.manufacturer);
	server.device = discovered;

	FmtInfo(upnp_domain, "Found media server: {}", server.name);
	return server;
}

std::vector<MediaServer>
ResolveDevices(std::span<const DiscoveredDevice> devices, HttpClient &http,
	       unsigned n_threads)
{
	std::vector<std::optional<MediaServer>> results(devices.size());

	n_threads = unsigned(std::min<std::size_t>(n_threads, devices.size()));
	if (n_threads <= 1) {
		for (std::size_t i = 0; i < devices.size(); ++i)
			results[i] = ResolveDevice(devices[i], http);
	} else {
		WorkQueue<std::size_t> queue("resolve");
		queue.Start(n_threads, [&](std::size_t i){
			results[i] = ResolveDevice(devices[i], http);
		});

		for (std::size_t i = 0; i < devices.size(); ++i)
			queue.Put(i);

		queue.WaitIdle();
	}

	std::vector<MediaServer> servers;
	for (auto &i : results)
		if (i)
			servers.emplace_back(std::move(*i));

	return servers;
}
