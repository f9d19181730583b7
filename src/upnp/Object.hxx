// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_OBJECT_HXX
#define NMC_UPNP_OBJECT_HXX

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * A DIDL-Lite "container" element.
 */
struct UPnPContainer {
	std::string id;
	std::string title;

	// e.g. object.container.storageFolder
	std::string upnp_class;
};

/**
 * A playable DIDL-Lite "item" element with a supported MIME type.
 */
struct UPnPMediaItem {
	std::string id;
	std::string title;
	std::string mime_type;
	std::string resource_url;

	std::optional<uint64_t> size;

	// e.g. "0:42:17.000"
	std::optional<std::string> duration;

	/**
	 * The titles of the containers below the walk root under
	 * which this item was found, outermost first.  Filled in by
	 * the catalog walker.
	 */
	std::vector<std::string> container_path;
};

using CatalogEntry = std::variant<UPnPContainer, UPnPMediaItem>;

/**
 * The flat ordered list of media items produced by one catalog
 * walk.  Not deduplicated.
 */
using CatalogSnapshot = std::vector<UPnPMediaItem>;

#endif
