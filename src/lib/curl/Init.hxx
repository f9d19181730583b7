// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_CURL_INIT_HXX
#define NMC_CURL_INIT_HXX

/**
 * Initialize libcurl globally for the lifetime of this object.
 * Construct it in main() before any other thread is started.
 */
class ScopeCurlInit {
public:
	/**
	 * Throws #CurlError on error.
	 */
	ScopeCurlInit();
	~ScopeCurlInit() noexcept;

	ScopeCurlInit(const ScopeCurlInit &) = delete;
	ScopeCurlInit &operator=(const ScopeCurlInit &) = delete;
};

#endif
