// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef NMC_NET_SOCKET_ERROR_HXX
#define NMC_NET_SOCKET_ERROR_HXX

#include <cerrno>
#include <system_error>

typedef int socket_error_t;

[[gnu::pure]]
static inline socket_error_t
GetSocketError() noexcept
{
	return errno;
}

constexpr bool
IsSocketErrorReceiveWouldBlock(socket_error_t code) noexcept
{
	return code == EAGAIN || code == EWOULDBLOCK;
}

constexpr bool
IsSocketErrorInterrupted(socket_error_t code) noexcept
{
	return code == EINTR;
}

[[gnu::const]]
static inline std::system_error
MakeSocketError(socket_error_t code, const char *msg) noexcept
{
	return std::system_error(code, std::system_category(), msg);
}

[[gnu::pure]]
static inline std::system_error
MakeSocketError(const char *msg) noexcept
{
	return MakeSocketError(GetSocketError(), msg);
}

#endif
