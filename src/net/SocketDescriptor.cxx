// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SocketDescriptor.hxx"
#include "IPv4Address.hxx"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

bool
SocketDescriptor::Create(int domain, int type, int protocol) noexcept
{
	type |= SOCK_CLOEXEC;

	int new_fd = socket(domain, type, protocol);
	if (new_fd < 0)
		return false;

	Close();
	fd = new_fd;
	return true;
}

void
SocketDescriptor::Close() noexcept
{
	if (IsDefined())
		::close(Steal());
}

bool
SocketDescriptor::SetOption(int level, int name,
			    const void *value, std::size_t size) const noexcept
{
	return setsockopt(fd, level, name, value, size) == 0;
}

bool
SocketDescriptor::SetReuseAddress(bool value) const noexcept
{
	return SetIntOption(SOL_SOCKET, SO_REUSEADDR, value);
}

bool
SocketDescriptor::Bind(const IPv4Address &address) const noexcept
{
	return bind(fd, address.GetAddress(), address.GetSize()) == 0;
}

IPv4Address
SocketDescriptor::GetLocalAddress() const noexcept
{
	IPv4Address address;
	socklen_t size = address.GetSize();
	if (getsockname(fd, address.GetAddress(), &size) < 0)
		return {};

	return address;
}

int
SocketDescriptor::WaitReadable(std::chrono::milliseconds timeout) const noexcept
{
	struct pollfd pfd{};
	pfd.fd = fd;
	pfd.events = POLLIN;

	return poll(&pfd, 1, int(timeout.count()));
}

ssize_t
SocketDescriptor::ReadFrom(std::span<std::byte> dest,
			   IPv4Address &address) const noexcept
{
	socklen_t size = address.GetSize();
	return recvfrom(fd, dest.data(), dest.size(), MSG_DONTWAIT,
			address.GetAddress(), &size);
}

ssize_t
SocketDescriptor::WriteTo(std::span<const std::byte> src,
			  const IPv4Address &address) const noexcept
{
	return sendto(fd, src.data(), src.size(), MSG_NOSIGNAL,
		      address.GetAddress(), address.GetSize());
}
