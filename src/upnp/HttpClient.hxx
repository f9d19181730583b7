// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_HTTP_CLIENT_HXX
#define NMC_UPNP_HTTP_CLIENT_HXX

#include <chrono>
#include <span>
#include <string>
#include <string_view>

struct HttpResponse {
	unsigned status = 0;
	std::string body;
};

/**
 * The HTTP operations needed by the UPnP client: fetching device
 * descriptions and posting SOAP requests.  Implementations throw on
 * transport errors; any HTTP status is returned to the caller.
 */
class HttpClient {
public:
	virtual ~HttpClient() noexcept = default;

	virtual HttpResponse Get(const std::string &url,
				 std::chrono::milliseconds timeout) = 0;

	/**
	 * @param headers request headers formatted as "Name: value"
	 */
	virtual HttpResponse Post(const std::string &url,
				  std::string_view body,
				  std::span<const std::string> headers,
				  std::chrono::milliseconds timeout) = 0;
};

#endif
