// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_DIRECTORY_HXX
#define NMC_UPNP_DIRECTORY_HXX

#include "Object.hxx"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

static constexpr const char *DIDL_LITE_NAMESPACE =
	"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/";
static constexpr const char *DC_NAMESPACE =
	"http://purl.org/dc/elements/1.1/";
static constexpr const char *UPNP_METADATA_NAMESPACE =
	"urn:schemas-upnp-org:metadata-1-0/upnp/";
static constexpr const char *SOAP_ENVELOPE_NAMESPACE =
	"http://schemas.xmlsoap.org/soap/envelope/";

/**
 * Is this MIME type in the list of playable audio/video types?
 */
[[gnu::pure]]
bool
IsSupportedMimeType(std::string_view mime_type) noexcept;

/**
 * Extract the MIME type from a DIDL-Lite "protocolInfo" attribute
 * (the third colon-separated field, e.g. "video/mp4" from
 * "http-get:*:video/mp4:*").  Returns an empty string if there is no
 * third field.
 */
[[gnu::pure]]
std::string_view
ParseProtocolInfoMimeType(std::string_view protocol_info) noexcept;

/**
 * Parse a DIDL-Lite document.  Containers are returned before items,
 * each in document order.  Items without a resource URL or with an
 * unsupported MIME type are omitted.
 *
 * Throws on XML error.
 */
std::vector<CatalogEntry>
ParseDidlLite(std::string_view didl);

/**
 * The decoded output arguments of a Browse response.
 */
struct BrowseResponse {
	/**
	 * The DIDL-Lite document (already unescaped).
	 */
	std::string result;

	std::optional<unsigned> number_returned;
	std::optional<unsigned> total_matches;
};

/**
 * Thrown by ParseBrowseResponse() if the response is a SOAP fault.
 */
class SoapFault final : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Parse the SOAP envelope of a Browse response.
 *
 * Throws #SoapFault if the body contains a Fault element, and other
 * exceptions on XML error.
 */
BrowseResponse
ParseBrowseResponse(std::string_view soap);

#endif
