// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef NMC_NET_SOCKET_DESCRIPTOR_HXX
#define NMC_NET_SOCKET_DESCRIPTOR_HXX

#include <chrono>
#include <cstddef>
#include <span>
#include <utility>

#include <sys/types.h>

class IPv4Address;

/**
 * An OO wrapper for a socket file descriptor.  This class does not
 * own the descriptor; see #UniqueSocketDescriptor.
 */
class SocketDescriptor {
protected:
	int fd = -1;

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:fd(_fd) {}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	constexpr int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	/**
	 * Create a socket.  On error, the previous descriptor is
	 * left untouched and false is returned (errno set).
	 */
	bool Create(int domain, int type, int protocol) noexcept;

	void Close() noexcept;

	bool SetOption(int level, int name,
		       const void *value, std::size_t size) const noexcept;

	bool SetIntOption(int level, int name,
			  const int &value) const noexcept {
		return SetOption(level, name, &value, sizeof(value));
	}

	bool SetReuseAddress(bool value=true) const noexcept;

	bool Bind(const IPv4Address &address) const noexcept;

	/**
	 * Determine the address this socket is bound to.
	 */
	IPv4Address GetLocalAddress() const noexcept;

	/**
	 * Wait until the socket becomes readable or the timeout
	 * expires.
	 *
	 * @return 1 if readable, 0 on timeout, -1 on error
	 */
	int WaitReadable(std::chrono::milliseconds timeout) const noexcept;

	/**
	 * Wrapper for recvfrom().
	 */
	ssize_t ReadFrom(std::span<std::byte> dest,
			 IPv4Address &address) const noexcept;

	/**
	 * Wrapper for sendto().
	 */
	ssize_t WriteTo(std::span<const std::byte> src,
			const IPv4Address &address) const noexcept;
};

#endif
