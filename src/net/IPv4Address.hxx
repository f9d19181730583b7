// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef NMC_NET_IPV4_ADDRESS_HXX
#define NMC_NET_IPV4_ADDRESS_HXX

#include <cstdint>
#include <string>

#include <netinet/in.h>
#include <sys/socket.h>

/**
 * An OO wrapper for struct sockaddr_in.
 */
class IPv4Address {
	struct sockaddr_in address{};

public:
	IPv4Address() = default;

	explicit IPv4Address(const struct sockaddr_in &_address) noexcept
		:address(_address) {}

	IPv4Address(uint8_t a, uint8_t b, uint8_t c, uint8_t d,
		    uint16_t port) noexcept {
		address.sin_family = AF_INET;
		address.sin_port = htons(port);
		address.sin_addr.s_addr =
			htonl((uint32_t(a) << 24) | (uint32_t(b) << 16) |
			      (uint32_t(c) << 8) | uint32_t(d));
	}

	static IPv4Address Any(uint16_t port) noexcept {
		return {0, 0, 0, 0, port};
	}

	static IPv4Address Loopback(uint16_t port) noexcept {
		return {127, 0, 0, 1, port};
	}

	const struct sockaddr *GetAddress() const noexcept {
		return reinterpret_cast<const struct sockaddr *>(&address);
	}

	struct sockaddr *GetAddress() noexcept {
		return reinterpret_cast<struct sockaddr *>(&address);
	}

	static constexpr socklen_t GetSize() noexcept {
		return sizeof(struct sockaddr_in);
	}

	bool IsDefined() const noexcept {
		return address.sin_family == AF_INET;
	}

	uint16_t GetPort() const noexcept {
		return ntohs(address.sin_port);
	}

	/**
	 * Format as "a.b.c.d:port".
	 */
	[[gnu::pure]]
	std::string ToString() const noexcept;
};

#endif
