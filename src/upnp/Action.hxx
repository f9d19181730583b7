// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_ACTION_HXX
#define NMC_UPNP_ACTION_HXX

#include <string>
#include <string_view>
#include <vector>

static constexpr const char *CONTENT_DIRECTORY_SERVICE_TYPE =
	"urn:schemas-upnp-org:service:ContentDirectory:1";

/**
 * The number of entries requested by one Browse call.  Containers
 * with more direct children are not paginated.
 */
static constexpr unsigned BROWSE_REQUESTED_COUNT = 1000;

/**
 * Build the SOAP envelope of a ContentDirectory "Browse" action with
 * BrowseFlag=BrowseDirectChildren and Filter=*.
 */
[[gnu::pure]]
std::string
FormatBrowseRequest(std::string_view object_id,
		    unsigned starting_index=0,
		    unsigned requested_count=BROWSE_REQUESTED_COUNT) noexcept;

/**
 * The HTTP request headers of a SOAP action ("Content-Type" and
 * "SOAPAction").
 */
[[gnu::pure]]
std::vector<std::string>
MakeSoapHeaders(std::string_view service_type,
		std::string_view action) noexcept;

/**
 * Escape the XML special characters in the given string.
 */
[[gnu::pure]]
std::string
XmlEscape(std::string_view src) noexcept;

#endif
