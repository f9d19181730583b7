// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_CURL_HTTP_STATUS_ERROR_HXX
#define NMC_CURL_HTTP_STATUS_ERROR_HXX

#include <stdexcept>
#include <string>

/**
 * Thrown when the HTTP server responded with an unexpected status.
 */
class HttpStatusError final : public std::runtime_error {
	unsigned status;

public:
	HttpStatusError(unsigned _status, const std::string &msg)
		:std::runtime_error(msg), status(_status) {}

	unsigned GetStatus() const noexcept {
		return status;
	}
};

#endif
