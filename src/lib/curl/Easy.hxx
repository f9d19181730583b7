// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_CURL_EASY_HXX
#define NMC_CURL_EASY_HXX

#include "Error.hxx"

#include <curl/curl.h>

#include <chrono>
#include <cstddef>
#include <new>
#include <string_view>
#include <utility>

/**
 * An OO wrapper for a "CURL*" (a libCURL "easy" handle).
 */
class CurlEasy {
	CURL *handle = nullptr;

public:
	/**
	 * Allocate a new CURL*.
	 *
	 * Throws std::bad_alloc on out-of-memory.
	 */
	CurlEasy()
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::bad_alloc();
	}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw CurlError(code);
	}

	void SetURL(const char *value) {
		SetOption(CURLOPT_URL, value);
	}

	void SetRequestHeaders(struct curl_slist *headers) {
		SetOption(CURLOPT_HTTPHEADER, headers);
	}

	void SetUserAgent(const char *value) {
		SetOption(CURLOPT_USERAGENT, value);
	}

	void SetNoSignal(bool value=true) {
		SetOption(CURLOPT_NOSIGNAL, (long)value);
	}

	void SetFollowLocation(bool value=true) {
		SetOption(CURLOPT_FOLLOWLOCATION, (long)value);
	}

	void SetTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_TIMEOUT_MS, (long)timeout.count());
	}

	void SetConnectTimeout(std::chrono::milliseconds timeout) {
		SetOption(CURLOPT_CONNECTTIMEOUT_MS, (long)timeout.count());
	}

	/**
	 * Configure a POST request with the given body.  The data is
	 * copied by libcurl.
	 */
	void SetPost(std::string_view body) {
		SetOption(CURLOPT_POSTFIELDSIZE, (long)body.size());
		SetOption(CURLOPT_COPYPOSTFIELDS, body.data());
	}

	void SetWriteFunction(std::size_t (*function)(char *, std::size_t,
						      std::size_t, void *),
			      void *userdata) {
		SetOption(CURLOPT_WRITEFUNCTION, function);
		SetOption(CURLOPT_WRITEDATA, userdata);
	}

	/**
	 * Throws #CurlError on error.
	 */
	void Perform() {
		CURLcode code = curl_easy_perform(handle);
		if (code != CURLE_OK)
			throw CurlError(code);
	}

	[[gnu::pure]]
	long GetResponseCode() const noexcept {
		long value;
		return curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE,
					 &value) == CURLE_OK
			? value
			: -1;
	}
};

#endif
