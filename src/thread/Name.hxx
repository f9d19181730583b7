// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_THREAD_NAME_HXX
#define NMC_THREAD_NAME_HXX

#include <fmt/core.h>

#ifdef __linux__
#  define HAVE_THREAD_NAME
#  include <pthread.h>
#endif

static inline void
SetThreadName(const char *name) noexcept
{
#ifdef HAVE_THREAD_NAME
	pthread_setname_np(pthread_self(), name);
#else
	(void)name;
#endif
}

/**
 * Set the name of the current thread from a format string.  The
 * kernel truncates names to 15 characters.
 */
template<typename... Args>
static inline void
FmtThreadName(fmt::format_string<Args...> format,
	      [[maybe_unused]] Args&&... args) noexcept
{
#ifdef HAVE_THREAD_NAME
	char buffer[16];
	const auto result = fmt::format_to_n(buffer, sizeof(buffer) - 1,
					     format,
					     std::forward<Args>(args)...);
	*result.out = 0;
	SetThreadName(buffer);
#else
	(void)format;
#endif
}

#endif
