// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_CONTENT_BROWSER_HXX
#define NMC_UPNP_CONTENT_BROWSER_HXX

#include "Object.hxx"

#include <string>
#include <vector>

/**
 * Lists the direct children of a container.  This is the seam
 * between the catalog walker and the ContentDirectory protocol.
 */
class ContentBrowser {
public:
	virtual ~ContentBrowser() noexcept = default;

	/**
	 * Browse the direct children of the given container.  Errors
	 * are logged and yield an empty list; this method does not
	 * throw.  Implementations used with a multi-threaded walk
	 * must be thread-safe.
	 */
	virtual std::vector<CatalogEntry> Browse(const std::string &container_id) noexcept = 0;
};

#endif
