// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "Ssdp.hxx"
#include "util/ASCII.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <algorithm>

std::string
FormatMSearch(std::string_view search_target, unsigned mx) noexcept
{
	return fmt::format("M-SEARCH * HTTP/1.1\r\n"
			   "HOST: {}:{}\r\n"
			   "MAN: \"ssdp:discover\"\r\n"
			   "MX: {}\r\n"
			   "ST: {}\r\n"
			   "\r\n",
			   SSDP_MULTICAST_ADDRESS, SSDP_PORT,
			   mx, search_target);
}

/**
 * Split off the next line; accepts both CRLF and bare LF.
 */
static std::string_view
NextLine(std::string_view &src) noexcept
{
	const auto eol = src.find('\n');
	std::string_view line = src.substr(0, eol);
	src = eol == src.npos ? std::string_view{} : src.substr(eol + 1);

	if (!line.empty() && line.back() == '\r')
		line.remove_suffix(1);
	return line;
}

std::optional<DiscoveredDevice>
ParseSsdpResponse(std::string_view response) noexcept
{
	response = StripLeft(response);

	if (!NextLine(response).starts_with("HTTP/1.1 200 OK"))
		return std::nullopt;

	DiscoveredDevice device;
	bool have_location = false;

	while (!response.empty()) {
		const auto line = NextLine(response);
		const auto colon = line.find(':');
		if (colon == line.npos)
			continue;

		const auto name = ToLowerASCII(Strip(line.substr(0, colon)));
		const auto value = Strip(line.substr(colon + 1));

		if (name == "location") {
			device.location = value;
			have_location = true;
		} else if (name == "server")
			device.server = value;
		else if (name == "st")
			device.search_target = value;
		else if (name == "usn")
			device.usn = value;
	}

	if (!have_location)
		return std::nullopt;

	return device;
}

bool
SsdpCollector::Add(DiscoveredDevice &&device) noexcept
{
	const bool duplicate =
		std::any_of(devices.begin(), devices.end(),
			    [&device](const DiscoveredDevice &i){
				    return i.location == device.location &&
					    i.usn == device.usn;
			    });
	if (duplicate)
		return false;

	devices.push_back(std::move(device));
	return true;
}
