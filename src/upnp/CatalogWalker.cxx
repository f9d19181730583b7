// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "CatalogWalker.hxx"
#include "ContentBrowser.hxx"
#include "Domain.hxx"
#include "WorkQueue.hxx"
#include "Log.hxx"

#include <algorithm>
#include <iterator>
#include <memory>
#include <vector>

namespace {

/**
 * One container in the walk tree.
 */
struct WalkNode {
	std::string id;

	/**
	 * Container titles from below the root down to this node.
	 */
	std::vector<std::string> path;

	unsigned depth;

	std::vector<UPnPMediaItem> items;

	/**
	 * Indices of the child nodes in #CatalogWalk::nodes.
	 */
	std::vector<std::size_t> children;
};

class CatalogWalk {
	ContentBrowser &browser;
	const CatalogWalkParams &params;

	std::vector<WalkNode> nodes;

	std::unique_ptr<WorkQueue<std::size_t>> queue;

	/**
	 * Browse results of the current level, indexed like the
	 * level's node list.
	 */
	std::vector<std::vector<CatalogEntry>> results;
	std::vector<std::string> level_ids;

	unsigned n_scheduled = 0;
	bool limit_reached = false;

public:
	CatalogWalk(ContentBrowser &_browser,
		    const CatalogWalkParams &_params) noexcept
		:browser(_browser), params(_params) {}

	CatalogSnapshot Run();

private:
	void BrowseLevel(const std::vector<std::size_t> &level);

	void AddChild(std::size_t parent, UPnPContainer &&container,
		      std::vector<std::size_t> &next_level);

	void ProcessEntries(std::size_t node, std::vector<CatalogEntry> &&entries,
			    std::vector<std::size_t> &next_level);

	CatalogSnapshot Flatten() noexcept;
};

void
CatalogWalk::BrowseLevel(const std::vector<std::size_t> &level)
{
	level_ids.clear();
	for (const std::size_t i : level)
		level_ids.push_back(nodes[i].id);

	results.clear();
	results.resize(level.size());

	if (queue == nullptr || level.size() <= 1) {
		for (std::size_t i = 0; i < level_ids.size(); ++i)
			results[i] = browser.Browse(level_ids[i]);
		return;
	}

	for (std::size_t i = 0; i < level_ids.size(); ++i)
		queue->Put(i);

	queue->WaitIdle();
}

inline void
CatalogWalk::AddChild(std::size_t parent, UPnPContainer &&container,
		      std::vector<std::size_t> &next_level)
{
	if (container.id.empty())
		return;

	if (nodes[parent].depth + 1 >= params.max_depth)
		return;

	if (n_scheduled >= params.max_containers) {
		if (!limit_reached) {
			FmtWarning(catalog_domain,
				   "Container limit of {} reached, the catalog is incomplete",
				   params.max_containers);
			limit_reached = true;
		}

		return;
	}

	WalkNode child;
	child.id = std::move(container.id);
	child.path = nodes[parent].path;
	child.path.emplace_back(std::move(container.title));
	child.depth = nodes[parent].depth + 1;

	const std::size_t index = nodes.size();
	nodes.emplace_back(std::move(child));
	nodes[parent].children.push_back(index);
	next_level.push_back(index);
	++n_scheduled;
}

inline void
CatalogWalk::ProcessEntries(std::size_t node, std::vector<CatalogEntry> &&entries,
			    std::vector<std::size_t> &next_level)
{
	for (auto &entry : entries) {
		if (auto *item = std::get_if<UPnPMediaItem>(&entry)) {
			item->container_path = nodes[node].path;
			nodes[node].items.emplace_back(std::move(*item));
		} else
			AddChild(node, std::get<UPnPContainer>(std::move(entry)),
				 next_level);
	}
}

CatalogSnapshot
CatalogWalk::Flatten() noexcept
{
	CatalogSnapshot snapshot;

	std::vector<std::size_t> stack{0};
	while (!stack.empty()) {
		const std::size_t i = stack.back();
		stack.pop_back();

		auto &node = nodes[i];
		std::move(node.items.begin(), node.items.end(),
			  std::back_inserter(snapshot));

		/* push in reverse so the first child is visited
		   first */
		stack.insert(stack.end(), node.children.rbegin(),
			     node.children.rend());
	}

	return snapshot;
}

CatalogSnapshot
CatalogWalk::Run()
{
	if (params.max_depth == 0 || params.max_containers == 0)
		return {};

	if (params.threads > 1) {
		queue = std::make_unique<WorkQueue<std::size_t>>("browse");
		queue->Start(params.threads, [this](std::size_t i){
			results[i] = browser.Browse(level_ids[i]);
		});
	}

	nodes.emplace_back(WalkNode{params.root, {}, 0, {}, {}});
	n_scheduled = 1;

	std::vector<std::size_t> level{0};
	while (!level.empty()) {
		FmtDebug(catalog_domain, "Browsing {} container(s) at depth {}",
			 level.size(), nodes[level.front()].depth);

		BrowseLevel(level);

		std::vector<std::size_t> next_level;
		for (std::size_t i = 0; i < level.size(); ++i)
			ProcessEntries(level[i], std::move(results[i]),
				       next_level);

		level = std::move(next_level);
	}

	queue.reset();

	auto snapshot = Flatten();
	FmtInfo(catalog_domain, "Found {} media files in {} container(s)",
		snapshot.size(), n_scheduled);
	return snapshot;
}

} // namespace

CatalogSnapshot
WalkCatalog(ContentBrowser &browser, const CatalogWalkParams &params)
{
	CatalogWalk walk(browser, params);
	return walk.Run();
}
