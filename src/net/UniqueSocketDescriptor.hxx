// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef NMC_NET_UNIQUE_SOCKET_DESCRIPTOR_HXX
#define NMC_NET_UNIQUE_SOCKET_DESCRIPTOR_HXX

#include "SocketDescriptor.hxx"

/**
 * Wrapper for a socket file descriptor which owns it and closes it
 * in the destructor.
 */
class UniqueSocketDescriptor : public SocketDescriptor {
public:
	UniqueSocketDescriptor() = default;

	explicit UniqueSocketDescriptor(SocketDescriptor _fd) noexcept
		:SocketDescriptor(_fd) {}

	UniqueSocketDescriptor(UniqueSocketDescriptor &&other) noexcept
		:SocketDescriptor(other.Steal()) {}

	~UniqueSocketDescriptor() noexcept {
		Close();
	}

	UniqueSocketDescriptor &operator=(UniqueSocketDescriptor &&src) noexcept {
		if (this != &src) {
			Close();
			fd = src.Steal();
		}

		return *this;
	}
};

#endif
