// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "UriUtil.hxx"
#include "ASCII.hxx"
#include "CharUtil.hxx"

#include <vector>

static constexpr bool
IsValidSchemeStart(char ch) noexcept
{
	return IsLowerAlphaASCII(ch) || IsUpperAlphaASCII(ch);
}

static constexpr bool
IsValidSchemeChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '+' || ch == '.' ||
		ch == '-';
}

bool
uri_has_scheme(std::string_view uri) noexcept
{
	const auto colon = uri.find("://");
	if (colon == uri.npos || colon == 0 || !IsValidSchemeStart(uri.front()))
		return false;

	for (const char ch : uri.substr(0, colon))
		if (!IsValidSchemeChar(ch))
			return false;

	return true;
}

std::string_view
uri_get_path(std::string_view uri) noexcept
{
	if (!uri_has_scheme(uri))
		return uri;

	const auto authority = uri.find("://") + 3;
	const auto slash = uri.find('/', authority);
	if (slash == uri.npos)
		return {};

	return uri.substr(slash);
}

std::string_view
uri_get_last_segment(std::string_view uri) noexcept
{
	if (const auto end = uri.find_first_of("?#"); end != uri.npos)
		uri = uri.substr(0, end);

	if (const auto slash = uri.rfind('/'); slash != uri.npos)
		uri.remove_prefix(slash + 1);

	return uri;
}

std::string
uri_get_suffix_lower(std::string_view name) noexcept
{
	const auto dot = name.rfind('.');
	if (dot == name.npos || dot + 1 == name.size())
		return {};

	return ToLowerASCII(name.substr(dot + 1));
}

/**
 * Remove "." and ".." segments from an absolute path.  A ".." at the
 * root is dropped.
 */
static std::string
RemoveDotSegments(std::string_view path) noexcept
{
	std::vector<std::string_view> segments;
	bool trailing_slash = false;

	if (!path.empty() && path.front() == '/')
		path.remove_prefix(1);

	while (true) {
		const auto slash = path.find('/');
		const bool last = slash == path.npos;
		const auto segment = path.substr(0, slash);

		if (segment == ".") {
			trailing_slash = last;
		} else if (segment == "..") {
			if (!segments.empty())
				segments.pop_back();
			trailing_slash = last;
		} else {
			segments.push_back(segment);
			trailing_slash = false;
		}

		if (last)
			break;

		path.remove_prefix(slash + 1);
	}

	std::string result{"/"};
	for (std::size_t i = 0; i < segments.size(); ++i) {
		if (i > 0)
			result.push_back('/');
		result.append(segments[i]);
	}

	if (trailing_slash && !segments.empty())
		result.push_back('/');

	return result;
}

std::string
uri_apply_relative(std::string_view relative_uri,
		   std::string_view base_uri) noexcept
{
	if (relative_uri.empty())
		return std::string{base_uri};

	if (uri_has_scheme(relative_uri))
		return std::string{relative_uri};

	if (relative_uri.starts_with("//")) {
		/* network-path reference: only the scheme is inherited */
		const auto colon = base_uri.find("://");
		if (colon == base_uri.npos)
			return std::string{relative_uri};

		std::string result{base_uri.substr(0, colon + 1)};
		result.append(relative_uri);
		return result;
	}

	if (relative_uri.front() == '#') {
		std::string result{base_uri.substr(0, base_uri.find('#'))};
		result.append(relative_uri);
		return result;
	}

	auto base_path = uri_get_path(base_uri);
	/* everything up to (excluding) the path */
	const std::string_view origin = base_path.data() != nullptr
		? base_uri.substr(0, base_path.data() - base_uri.data())
		: base_uri;

	/* strip query string and fragment from the base */
	if (const auto end = base_path.find_first_of("?#"); end != base_path.npos)
		base_path = base_path.substr(0, end);

	if (relative_uri.front() == '?') {
		std::string result{origin};
		result.append(base_path);
		result.append(relative_uri);
		return result;
	}

	/* the query string and fragment of the reference are kept as-is */
	std::string_view tail{};
	if (const auto end = relative_uri.find_first_of("?#"); end != relative_uri.npos) {
		tail = relative_uri.substr(end);
		relative_uri = relative_uri.substr(0, end);
	}

	std::string merged;
	if (!relative_uri.empty() && relative_uri.front() == '/') {
		merged = relative_uri;
	} else {
		/* replace the file name of the base path */
		if (const auto slash = base_path.rfind('/'); slash != base_path.npos)
			merged = base_path.substr(0, slash + 1);
		else
			merged = "/";
		merged.append(relative_uri);
	}

	std::string result{origin};
	result.append(RemoveDotSegments(merged));
	result.append(tail);
	return result;
}
