// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "SystemError.hxx"

#include <fmt/format.h>

#include <iterator> // for std::back_inserter()

std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	return MakeErrno(code, fmt::to_string(buffer).c_str());
}
