// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "ContentDirectoryService.hxx"
#include "Action.hxx"
#include "Directory.hxx"
#include "Domain.hxx"
#include "HttpClient.hxx"
#include "MediaServer.hxx"
#include "lib/curl/HttpStatusError.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "Log.hxx"

#include <fmt/format.h>

ContentDirectoryService::ContentDirectoryService(HttpClient &_http,
						 const MediaServer &server) noexcept
	:http(_http), control_url(server.control_url),
	 server_name(server.name)
{
}

std::vector<CatalogEntry>
ContentDirectoryService::DoBrowse(const std::string &container_id)
{
	const auto body = FormatBrowseRequest(container_id);
	const auto headers = MakeSoapHeaders(CONTENT_DIRECTORY_SERVICE_TYPE,
					     "Browse");

	const auto response = http.Post(control_url, body, headers,
					BROWSE_TIMEOUT);
	if (response.status != 200)
		throw HttpStatusError(response.status,
				      fmt::format("SOAP request failed with status {}",
						  response.status));

	const auto browse = ParseBrowseResponse(response.body);

	if (browse.total_matches && browse.number_returned &&
	    *browse.total_matches > *browse.number_returned)
		FmtWarning(content_directory_domain,
			   "Container \"{}\" on {} has {} children, only {} were listed",
			   container_id, server_name,
			   *browse.total_matches, *browse.number_returned);

	if (browse.result.empty())
		return {};

	auto entries = ParseDidlLite(browse.result);

	FmtDebug(content_directory_domain, "Parsed {} entries from container \"{}\"",
		 entries.size(), container_id);

	return entries;
}

std::vector<CatalogEntry>
ContentDirectoryService::Browse(const std::string &container_id) noexcept
{
	try {
		return DoBrowse(container_id);
	} catch (const SoapFault &e) {
		FmtWarning(content_directory_domain, "Browse of \"{}\" failed: {}",
			   container_id, e.what());
	} catch (...) {
		FmtWarning(content_directory_domain, "Browse of \"{}\" failed: {}",
			   container_id, std::current_exception());
	}

	return {};
}
