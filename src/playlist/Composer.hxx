// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_PLAYLIST_COMPOSER_HXX
#define NMC_PLAYLIST_COMPOSER_HXX

#include "PlaylistSpec.hxx"

#include <chrono>
#include <span>
#include <string_view>
#include <vector>

struct MediaFile;
class CompatibilityPolicy;

/**
 * Returns the directory grouping key of a file, or an empty string
 * if it does not belong to a directory group.  UPnP files are
 * grouped by the first container below the walk root; backslash
 * (SMB) paths by their fourth component.
 */
[[gnu::pure]]
std::string_view
GetDirectoryKey(const MediaFile &file) noexcept;

/**
 * Returns the lower-case file name suffix used to match the audio and
 * video collections: from the file name, falling back to the last
 * segment of the path.
 */
[[gnu::pure]]
std::string
GetMediaSuffix(const MediaFile &file) noexcept;

/**
 * One playlist per file type and one per directory; groups with
 * only one member are omitted.
 */
std::vector<PlaylistSpec>
ComposeAuto(std::span<const MediaFile> files) noexcept;

/**
 * The heuristic playlists; empty ones are omitted.
 *
 * @param now the composition time
 */
std::vector<PlaylistSpec>
ComposeSmart(std::span<const MediaFile> files,
	     std::chrono::system_clock::time_point now,
	     const CompatibilityPolicy &policy) noexcept;

/**
 * Compose all playlists with the #DefaultCompatibilityPolicy.
 */
ComposedPlaylists
Compose(std::span<const MediaFile> files,
	std::chrono::system_clock::time_point now) noexcept;

#endif
