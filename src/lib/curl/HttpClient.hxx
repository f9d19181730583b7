// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_CURL_HTTP_CLIENT_HXX
#define NMC_CURL_HTTP_CLIENT_HXX

#include "upnp/HttpClient.hxx"

/**
 * #HttpClient implementation using blocking libcurl "easy" handles.
 * Each request uses its own handle, so one instance may be used by
 * several threads at once.  libcurl must have been initialized with
 * #ScopeCurlInit.
 */
class CurlHttpClient final : public HttpClient {
public:
	HttpResponse Get(const std::string &url,
			 std::chrono::milliseconds timeout) override;

	HttpResponse Post(const std::string &url,
			  std::string_view body,
			  std::span<const std::string> headers,
			  std::chrono::milliseconds timeout) override;
};

#endif
