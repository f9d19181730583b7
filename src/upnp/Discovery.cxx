// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "Discovery.hxx"
#include "Domain.hxx"
#include "net/SocketError.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "Log.hxx"

#include <algorithm>
#include <array>
#include <span>

#include <sys/socket.h>
#include <netinet/in.h>

static UniqueSocketDescriptor
OpenSsdpSocket()
{
	UniqueSocketDescriptor fd;
	if (!fd.Create(AF_INET, SOCK_DGRAM, IPPROTO_UDP))
		throw MakeSocketError("Failed to create socket");

	/* replies are unicast to this socket; bind to an ephemeral
	   port on all interfaces */
	if (!fd.Bind(IPv4Address::Any(0)))
		throw MakeSocketError("Failed to bind socket");

	/* keep multicast on the local network */
	if (!fd.SetIntOption(IPPROTO_IP, IP_MULTICAST_TTL, 2))
		throw MakeSocketError("Failed to set IP_MULTICAST_TTL");

	return fd;
}

static void
SendMSearch(SocketDescriptor fd, const SsdpSearchParams &params)
{
	const unsigned mx = std::clamp<unsigned>(params.timeout.count(),
						 1, SSDP_MAX_MX);
	const auto request = FormatMSearch(params.search_target, mx);
	const auto src = std::as_bytes(std::span{request});

	const auto nbytes = fd.WriteTo(src, params.destination);
	if (nbytes < 0)
		throw MakeSocketError("Failed to send M-SEARCH");

	if (std::size_t(nbytes) != src.size())
		throw std::runtime_error("Short send of M-SEARCH");
}

/**
 * Receive one datagram and feed it into the collector.  Errors on
 * one datagram are logged and ignored.
 */
static void
ReceiveResponse(SocketDescriptor fd, SsdpCollector &collector) noexcept
{
	std::array<std::byte, 2048> buffer;
	IPv4Address sender;

	const auto nbytes = fd.ReadFrom(buffer, sender);
	if (nbytes < 0) {
		const auto code = GetSocketError();
		if (!IsSocketErrorReceiveWouldBlock(code) &&
		    !IsSocketErrorInterrupted(code))
			FmtDebug(ssdp_domain, "Failed to receive SSDP response: {}",
				 MakeSocketError(code, "recvfrom() failed").what());
		return;
	}

	const std::string_view response{(const char *)buffer.data(),
					std::size_t(nbytes)};

	auto device = ParseSsdpResponse(response);
	if (!device) {
		FmtDebug(ssdp_domain, "Ignoring SSDP datagram from {}",
			 sender.ToString());
		return;
	}

	const auto location = device->location;
	if (collector.Add(std::move(*device)))
		FmtDebug(ssdp_domain, "Found UPnP device at {}", location);
}

std::vector<DiscoveredDevice>
SsdpSearch(const SsdpSearchParams &params) noexcept
{
	using std::chrono::steady_clock;

	SsdpCollector collector;

	UniqueSocketDescriptor fd;

	try {
		fd = OpenSsdpSocket();
		SendMSearch(fd, params);
	} catch (...) {
		LogError(std::current_exception(), "SSDP discovery failed");
		return {};
	}

	const auto deadline = steady_clock::now() + params.timeout;

	while (true) {
		const auto now = steady_clock::now();
		if (now >= deadline)
			break;

		/* round up so we never spin on a sub-millisecond rest */
		const auto remaining =
			std::chrono::ceil<std::chrono::milliseconds>(deadline - now);

		const int result = fd.WaitReadable(remaining);
		if (result < 0) {
			const auto code = GetSocketError();
			if (IsSocketErrorInterrupted(code))
				continue;

			LogError(std::make_exception_ptr(MakeSocketError(code, "poll() failed")),
				 "SSDP discovery aborted");
			break;
		}

		if (result > 0)
			ReceiveResponse(fd, collector);
	}

	FmtDebug(ssdp_domain, "SSDP discovery found {} device(s)",
		 collector.GetDevices().size());

	return collector.Steal();
}
