// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_CONTENT_DIRECTORY_SERVICE_HXX
#define NMC_UPNP_CONTENT_DIRECTORY_SERVICE_HXX

#include "ContentBrowser.hxx"

#include <chrono>

struct MediaServer;
class HttpClient;

static constexpr std::chrono::seconds BROWSE_TIMEOUT{10};

/**
 * Browses the ContentDirectory service of one #MediaServer with SOAP
 * requests.  Only the first #BROWSE_REQUESTED_COUNT children of a
 * container are returned; a truncated result is logged.
 */
class ContentDirectoryService final : public ContentBrowser {
	HttpClient &http;

	const std::string control_url;

	const std::string server_name;

public:
	ContentDirectoryService(HttpClient &_http,
				const MediaServer &server) noexcept;

	const std::string &GetControlURL() const noexcept {
		return control_url;
	}

	/* virtual methods from class ContentBrowser */
	std::vector<CatalogEntry> Browse(const std::string &container_id) noexcept override;

private:
	/**
	 * Throws on error.
	 */
	std::vector<CatalogEntry> DoBrowse(const std::string &container_id);
};

#endif
