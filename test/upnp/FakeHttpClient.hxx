// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_TEST_FAKE_HTTP_CLIENT_HXX
#define NMC_TEST_FAKE_HTTP_CLIENT_HXX

#include "upnp/HttpClient.hxx"
#include "thread/Mutex.hxx"

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * An #HttpClient which serves canned responses.  GET requests are
 * looked up by URL; POST requests by URL and the "ObjectID" in the
 * SOAP body.  Unknown URLs throw, like a connection failure would.
 */
class FakeHttpClient final : public HttpClient {
	mutable Mutex mutex;

	std::map<std::string, HttpResponse> get_responses;

	/**
	 * Key is the object id.
	 */
	std::map<std::string, HttpResponse> post_responses;

public:
	std::vector<std::string> requested_urls;
	std::vector<std::string> posted_bodies;
	std::vector<std::string> last_headers;

	void AddGet(std::string url, unsigned status, std::string body) {
		get_responses[std::move(url)] = {status, std::move(body)};
	}

	void AddBrowse(std::string object_id, unsigned status,
		       std::string body) {
		post_responses[std::move(object_id)] = {status, std::move(body)};
	}

	HttpResponse Get(const std::string &url,
			 std::chrono::milliseconds) override {
		const std::scoped_lock lock{mutex};
		requested_urls.push_back(url);

		const auto i = get_responses.find(url);
		if (i == get_responses.end())
			throw std::runtime_error("Connection refused");
		return i->second;
	}

	HttpResponse Post(const std::string &url, std::string_view body,
			  std::span<const std::string> headers,
			  std::chrono::milliseconds) override {
		const std::scoped_lock lock{mutex};
		requested_urls.push_back(url);
		posted_bodies.emplace_back(body);
		last_headers.assign(headers.begin(), headers.end());

		const auto id = ExtractObjectId(body);
		const auto i = post_responses.find(id);
		if (i == post_responses.end())
			throw std::runtime_error("Connection refused");
		return i->second;
	}

private:
	static std::string ExtractObjectId(std::string_view body) {
		static constexpr std::string_view begin = "<ObjectID>";
		const auto start = body.find(begin);
		if (start == body.npos)
			return {};

		const auto end = body.find("</ObjectID>", start);
		return std::string{body.substr(start + begin.size(),
					       end - start - begin.size())};
	}
};

#endif
