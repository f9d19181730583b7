// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_PLAYLIST_COMPATIBILITY_POLICY_HXX
#define NMC_PLAYLIST_COMPATIBILITY_POLICY_HXX

#include <cstddef>
#include <span>
#include <vector>

struct MediaFile;

/**
 * Information about the whole candidate set which the per-file
 * score may depend on.
 */
struct ScoringContext {
	/**
	 * The arithmetic mean of #MediaFile::path lengths over all
	 * video files.
	 */
	double mean_path_length = 0;

	[[gnu::pure]]
	static ScoringContext Make(std::span<const MediaFile> files) noexcept;
};

/**
 * Rates how likely a video file plays back reliably in a UPnP/DLNA
 * client.  Higher is better.
 */
class CompatibilityPolicy {
public:
	virtual ~CompatibilityPolicy() noexcept = default;

	virtual int Score(const MediaFile &file,
			  const ScoringContext &context) const noexcept = 0;
};

/**
 * Empirically tuned weights: DLNA profile markers in the path,
 * container format, hidden (macOS "._") files, path length, special
 * characters and non-ASCII names.
 */
class DefaultCompatibilityPolicy final : public CompatibilityPolicy {
public:
	int Score(const MediaFile &file,
		  const ScoringContext &context) const noexcept override;
};

static constexpr int COMPATIBILITY_THRESHOLD = 3;
static constexpr std::size_t COMPATIBILITY_LIMIT = 20;

/**
 * Score all video files, drop those below the threshold and return
 * the best ones, highest score first.  Files with equal scores keep
 * their relative order.
 */
std::vector<const MediaFile *>
SelectCompatible(std::span<const MediaFile> files,
		 const CompatibilityPolicy &policy,
		 int threshold=COMPATIBILITY_THRESHOLD,
		 std::size_t limit=COMPATIBILITY_LIMIT) noexcept;

#endif
