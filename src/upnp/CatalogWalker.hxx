// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_CATALOG_WALKER_HXX
#define NMC_UPNP_CATALOG_WALKER_HXX

#include "Object.hxx"

#include <string>

class ContentBrowser;

struct CatalogWalkParams {
	/**
	 * The container to start at; "0" is the UPnP root.
	 */
	std::string root = "0";

	/**
	 * The number of container levels to browse.  1 browses only
	 * the root; 0 browses nothing.
	 */
	unsigned max_depth = 5;

	/**
	 * Stop browsing after this many containers.
	 */
	unsigned max_containers = 10000;

	/**
	 * The number of concurrent Browse calls per level.  Values
	 * above 1 require a thread-safe #ContentBrowser.
	 */
	unsigned threads = 1;
};

/**
 * Walk the container tree breadth-first, one level at a time, and
 * collect all media items.  The result is in depth-first pre-order:
 * a container's own items come before the items of its
 * subcontainers, and siblings are visited in server order.  A
 * container which fails to browse contributes nothing; the rest of
 * the walk continues.
 *
 * Throws std::system_error if a worker thread cannot be created.
 */
CatalogSnapshot
WalkCatalog(ContentBrowser &browser, const CatalogWalkParams &params);

#endif
