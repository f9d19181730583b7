// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef EXCEPTION_HXX
#define EXCEPTION_HXX

#include <exception>
#include <string>

/**
 * Obtain the message of an exception and all exceptions nested inside
 * it, joined with the given separator.  Whitespace runs (e.g. line
 * breaks in libcurl or Expat messages) are collapsed to one space.
 */
[[gnu::pure]]
std::string
GetFullMessage(const std::exception &e,
	       const char *separator=": ") noexcept;

[[gnu::pure]]
std::string
GetFullMessage(std::exception_ptr ep,
	       const char *separator=": ") noexcept;

#endif
