// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef NMC_UTIL_URI_UTIL_HXX
#define NMC_UTIL_URI_UTIL_HXX

#include <string>
#include <string_view>

/**
 * Does the URI begin with a scheme like "http://"?
 */
[[gnu::pure]]
bool
uri_has_scheme(std::string_view uri) noexcept;

/**
 * Returns the path part of an absolute URI ("/a/b?c" of
 * "http://host:80/a/b?c").  Returns an empty string view with
 * nullptr data if the URI has a scheme but no path; a URI without a
 * scheme is returned as-is.
 */
[[gnu::pure]]
std::string_view
uri_get_path(std::string_view uri) noexcept;

/**
 * Returns the last path segment of the URI, without query string
 * and fragment.
 */
[[gnu::pure]]
std::string_view
uri_get_last_segment(std::string_view uri) noexcept;

/**
 * Returns the lower-case suffix of the given file name (without the
 * dot), or an empty string if there is none.
 */
[[gnu::pure]]
std::string
uri_get_suffix_lower(std::string_view name) noexcept;

/**
 * Resolve a (possibly relative) URI reference against an absolute
 * base URI following RFC 3986 section 5.2.  Surplus ".." segments
 * which would climb above the root are dropped.
 */
[[gnu::pure]]
std::string
uri_apply_relative(std::string_view relative_uri,
		   std::string_view base_uri) noexcept;

#endif
