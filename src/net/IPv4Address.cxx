// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "IPv4Address.hxx"

#include <fmt/format.h>

std::string
IPv4Address::ToString() const noexcept
{
	const uint32_t x = ntohl(address.sin_addr.s_addr);
	return fmt::format("{}.{}.{}.{}:{}",
			   (x >> 24) & 0xff, (x >> 16) & 0xff,
			   (x >> 8) & 0xff, x & 0xff,
			   GetPort());
}
