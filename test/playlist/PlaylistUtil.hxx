// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_TEST_PLAYLIST_UTIL_HXX
#define NMC_TEST_PLAYLIST_UTIL_HXX

#include "playlist/MediaFile.hxx"

#include <string>

/**
 * Construct a UPnP #MediaFile with the given name and resource URL.
 */
static inline MediaFile
MakeFile(std::string name, std::string url,
	 const char *mime_type="video/mp4", uint64_t size=0,
	 std::string directory={})
{
	UPnPMediaItem item;
	item.id = name;
	item.title = std::move(name);
	item.mime_type = mime_type;
	item.resource_url = std::move(url);
	item.size = size;
	if (!directory.empty())
		item.container_path.emplace_back(std::move(directory));

	return MakeMediaFile(item, std::chrono::system_clock::now());
}

#endif
