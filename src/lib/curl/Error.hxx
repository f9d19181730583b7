// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_CURL_ERROR_HXX
#define NMC_CURL_ERROR_HXX

#include <curl/curl.h>

#include <stdexcept>

/**
 * Thrown when a libcurl call fails.
 */
class CurlError final : public std::runtime_error {
	CURLcode code;

public:
	CurlError(CURLcode _code, const char *msg)
		:std::runtime_error(msg), code(_code) {}

	explicit CurlError(CURLcode _code)
		:CurlError(_code, curl_easy_strerror(_code)) {}

	CURLcode GetCode() const noexcept {
		return code;
	}
};

#endif
