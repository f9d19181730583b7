// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef ASCII_HXX
#define ASCII_HXX

#include "CharUtil.hxx"

#include <algorithm>
#include <string>
#include <string_view>

/**
 * Does the haystack contain the needle, comparing ASCII letters
 * case-insensitively?  An empty needle is always found.
 */
[[gnu::pure]]
static inline bool
StringContainsCaseASCII(std::string_view haystack,
			std::string_view needle) noexcept
{
	return std::search(haystack.begin(), haystack.end(),
			   needle.begin(), needle.end(),
			   [](char a, char b){
				   return ToLowerASCII(a) == ToLowerASCII(b);
			   }) != haystack.end() || needle.empty();
}

[[gnu::pure]]
static inline bool
StringEndsWithCaseASCII(std::string_view haystack,
			std::string_view needle) noexcept
{
	if (haystack.size() < needle.size())
		return false;

	haystack.remove_prefix(haystack.size() - needle.size());
	return std::equal(haystack.begin(), haystack.end(), needle.begin(),
			  [](char a, char b){
				  return ToLowerASCII(a) == ToLowerASCII(b);
			  });
}

/**
 * Return a copy of the string with all ASCII letters converted to
 * lower case.
 */
[[gnu::pure]]
static inline std::string
ToLowerASCII(std::string_view src) noexcept
{
	std::string result{src};
	std::transform(result.begin(), result.end(), result.begin(),
		       [](char ch){ return ToLowerASCII(ch); });
	return result;
}

[[gnu::pure]]
static inline std::string
ToUpperASCII(std::string_view src) noexcept
{
	std::string result{src};
	std::transform(result.begin(), result.end(), result.begin(),
		       [](char ch){ return ToUpperASCII(ch); });
	return result;
}

#endif
