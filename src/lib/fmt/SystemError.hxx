// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef NMC_FMT_SYSTEM_ERROR_HXX
#define NMC_FMT_SYSTEM_ERROR_HXX

#include "system/Error.hxx" // IWYU pragma: export

#include <fmt/core.h>
#if FMT_VERSION >= 80000 && FMT_VERSION < 90000
#include <fmt/format.h>
#endif

[[nodiscard]] [[gnu::pure]]
std::system_error
VFmtErrno(int code, fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
auto
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
#if FMT_VERSION >= 90000
	return VFmtErrno(code, format_str,
			 fmt::make_format_args(args...));
#else
	return VFmtErrno(code, fmt::to_string_view(format_str),
			 fmt::make_args_checked<Args...>(format_str,
							 args...));
#endif
}

/**
 * Construct a std::system_error from the current errno value with a
 * formatted message.
 */
template<typename S, typename... Args>
[[nodiscard]]
auto
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	const int code = errno;
	return FmtErrno(code, format_str, args...);
}

#endif
