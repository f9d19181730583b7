// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <algorithm>

const char *
StripLeft(const char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;

	return p;
}

std::string_view
StripLeft(std::string_view s) noexcept
{
	auto i = std::find_if_not(s.begin(), s.end(),
				  [](char ch){ return IsWhitespaceOrNull(ch); });
	s.remove_prefix(std::distance(s.begin(), i));
	return s;
}

std::string_view
StripRight(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceOrNull(s.back()))
		s.remove_suffix(1);

	return s;
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
