// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "Init.hxx"
#include "Error.hxx"

ScopeCurlInit::ScopeCurlInit()
{
	CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
	if (code != CURLE_OK)
		throw CurlError(code, "CURL initialization failed");
}

ScopeCurlInit::~ScopeCurlInit() noexcept
{
	curl_global_cleanup();
}
