// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "HttpClient.hxx"
#include "Easy.hxx"
#include "Slist.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

static constexpr Domain curl_domain("curl");

static constexpr const char *USER_AGENT = "nmc/" NMC_VERSION " UPnP/1.0";

static std::size_t
WriteFunction(char *ptr, std::size_t size, std::size_t nmemb,
	      void *userdata) noexcept
{
	auto &body = *(std::string *)userdata;
	size *= nmemb;
	body.append(ptr, size);
	return size;
}

static void
Setup(CurlEasy &easy, const std::string &url, HttpResponse &response,
      std::chrono::milliseconds timeout)
{
	easy.SetURL(url.c_str());
	easy.SetUserAgent(USER_AGENT);
	easy.SetNoSignal();
	easy.SetFollowLocation();
	easy.SetTimeout(timeout);
	easy.SetConnectTimeout(timeout);
	easy.SetWriteFunction(WriteFunction, &response.body);
}

HttpResponse
CurlHttpClient::Get(const std::string &url,
		    std::chrono::milliseconds timeout)
{
	FmtDebug(curl_domain, "GET {}", url);

	HttpResponse response;
	CurlEasy easy;
	Setup(easy, url, response, timeout);
	easy.Perform();

	response.status = unsigned(easy.GetResponseCode());
	return response;
}

HttpResponse
CurlHttpClient::Post(const std::string &url, std::string_view body,
		     std::span<const std::string> headers,
		     std::chrono::milliseconds timeout)
{
	FmtDebug(curl_domain, "POST {}", url);

	HttpResponse response;
	CurlEasy easy;
	Setup(easy, url, response, timeout);

	CurlSlist request_headers;
	for (const auto &i : headers)
		request_headers.Append(i.c_str());
	/* suppress "Expect: 100-continue" */
	request_headers.Append("Expect:");
	easy.SetRequestHeaders(request_headers.Get());

	easy.SetPost(body);
	easy.Perform();

	response.status = unsigned(easy.GetResponseCode());
	return response;
}
