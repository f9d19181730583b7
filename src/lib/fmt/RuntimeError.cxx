// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "RuntimeError.hxx"

#include <fmt/format.h>

#include <iterator> // for std::back_inserter()

std::runtime_error
VFmtRuntimeError(fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	return std::runtime_error{std::string{buffer.data(), buffer.size()}};
}
