// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef STRING_COMPARE_HXX
#define STRING_COMPARE_HXX

#include <string_view>

#include <string.h>

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringStartsWith(const char *haystack, std::string_view needle) noexcept
{
	return strncmp(haystack, needle.data(), needle.size()) == 0;
}

/**
 * Returns the portion of the string after a prefix.  If the string
 * does not begin with the specified prefix, this function returns
 * nullptr.
 */
[[gnu::pure]] [[gnu::nonnull]]
static inline const char *
StringAfterPrefix(const char *haystack, std::string_view needle) noexcept
{
	return StringStartsWith(haystack, needle)
		? haystack + needle.size()
		: nullptr;
}

/**
 * Remove the given prefix from the string view.
 *
 * @return true if the prefix was found and removed
 */
static inline bool
SkipPrefix(std::string_view &haystack, std::string_view needle) noexcept
{
	if (!haystack.starts_with(needle))
		return false;

	haystack.remove_prefix(needle.size());
	return true;
}

#endif
