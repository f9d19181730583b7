// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_PLAYLIST_SPEC_HXX
#define NMC_PLAYLIST_SPEC_HXX

#include <string>
#include <vector>

/**
 * A playlist definition: an ordered list of file paths (see
 * #MediaFile::path) with a name and a description.
 */
struct PlaylistSpec {
	std::string name;
	std::string description;
	std::vector<std::string> file_paths;
};

struct ComposedPlaylists {
	/**
	 * Grouped by file type and directory.
	 */
	std::vector<PlaylistSpec> auto_playlists;

	/**
	 * Heuristic selections ("Recently Added", ...).
	 */
	std::vector<PlaylistSpec> smart_playlists;
};

#endif
