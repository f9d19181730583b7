// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_PLAYLIST_M3U_HXX
#define NMC_PLAYLIST_M3U_HXX

#include <span>
#include <string>
#include <string_view>
#include <vector>

struct MediaFile;
struct PlaylistSpec;

/**
 * Make a title safe for an "#EXTINF" line: line breaks become
 * spaces and separators VLC would misinterpret are replaced.  Never
 * returns an empty string.
 */
[[gnu::pure]]
std::string
SanitizeTitle(std::string_view title) noexcept;

/**
 * Returns the file name without directory and suffix.
 */
[[gnu::pure]]
std::string_view
GetFileStem(std::string_view name) noexcept;

/**
 * Render an extended M3U playlist.  Paths of the #PlaylistSpec
 * which have no matching #MediaFile are skipped.
 */
[[gnu::pure]]
std::string
GenerateM3u(const PlaylistSpec &spec,
	    std::span<const MediaFile> files) noexcept;

struct M3uEntry {
	std::string title;
	std::string url;
};

/**
 * Parse the entries of an (extended) M3U playlist.  A URL without a
 * preceding "#EXTINF" line gets an empty title.
 */
[[gnu::pure]]
std::vector<M3uEntry>
ParseM3u(std::string_view text) noexcept;

/**
 * Convert a playlist name to a file name ending with ".m3u".
 */
[[gnu::pure]]
std::string
MakePlaylistFileName(std::string_view name) noexcept;

/**
 * Write the playlist to a file in the given directory.
 *
 * Throws std::system_error on error.
 *
 * @return the path of the new file
 */
std::string
WriteM3uFile(std::string_view directory, const PlaylistSpec &spec,
	     std::span<const MediaFile> files);

#endif
