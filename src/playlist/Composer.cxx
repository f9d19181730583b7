// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "Composer.hxx"
#include "CompatibilityPolicy.hxx"
#include "MediaFile.hxx"
#include "Domain.hxx"
#include "util/ASCII.hxx"
#include "util/UriUtil.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string>

using std::string_view_literals::operator""sv;

static constexpr std::chrono::hours RECENT_AGE{30 * 24};
static constexpr uint64_t LARGE_FILE_SIZE = 100 * 1024 * 1024;

static constexpr std::string_view audio_suffixes[] = {
	"mp3"sv, "flac"sv, "wav"sv, "aac"sv, "ogg"sv, "wma"sv, "m4a"sv,
};

static constexpr std::string_view video_suffixes[] = {
	"mp4"sv, "avi"sv, "mkv"sv, "mov"sv, "wmv"sv, "flv"sv, "webm"sv, "m4v"sv,
};

std::string_view
GetDirectoryKey(const MediaFile &file) noexcept
{
	const std::string_view path = file.path;
	if (!file.IsUpnp() || path.find('\\') != path.npos) {
		/* legacy SMB rule: the fourth backslash-separated
		   component of a path with more than three */
		std::size_t n = 0;
		std::string_view rest = path, key;
		while (true) {
			const auto i = rest.find('\\');
			const auto segment = rest.substr(0, i);
			if (n == 3)
				key = segment;
			++n;

			if (i == rest.npos)
				break;
			rest = rest.substr(i + 1);
		}

		return n > 3 ? key : std::string_view{};
	}

	return file.directory;
}

std::string
GetMediaSuffix(const MediaFile &file) noexcept
{
	auto suffix = uri_get_suffix_lower(file.name);
	if (suffix.empty())
		suffix = uri_get_suffix_lower(uri_get_last_segment(file.path));
	return suffix;
}

[[gnu::pure]]
static bool
Contains(std::span<const std::string_view> haystack,
	 std::string_view needle) noexcept
{
	return std::find(haystack.begin(), haystack.end(),
			 needle) != haystack.end();
}

/**
 * An insertion-ordered group of files.
 */
struct FileGroup {
	std::string key;
	std::vector<std::string> paths;
};

static void
AddToGroup(std::vector<FileGroup> &groups, std::string_view key,
	   const std::string &path) noexcept
{
	auto i = std::find_if(groups.begin(), groups.end(),
			      [key](const FileGroup &g){
				      return g.key == key;
			      });
	if (i == groups.end()) {
		groups.push_back({std::string{key}, {}});
		i = std::prev(groups.end());
	}

	i->paths.push_back(path);
}

std::vector<PlaylistSpec>
ComposeAuto(std::span<const MediaFile> files) noexcept
{
	std::vector<FileGroup> by_type, by_directory;

	for (const auto &file : files) {
		AddToGroup(by_type, ToString(file.file_type), file.path);

		const auto directory = GetDirectoryKey(file);
		if (!directory.empty())
			AddToGroup(by_directory, directory, file.path);
	}

	std::vector<PlaylistSpec> result;

	for (auto &g : by_type) {
		if (g.paths.size() <= 1)
			continue;

		result.push_back({
			fmt::format("All {} Files", ToUpperASCII(g.key)),
			fmt::format("Auto-generated playlist for all {} files",
				    g.key),
			std::move(g.paths),
		});
	}

	for (auto &g : by_directory) {
		if (g.paths.size() <= 1)
			continue;

		result.push_back({
			fmt::format("Directory: {}", g.key),
			fmt::format("Auto-generated playlist for directory '{}'",
				    g.key),
			std::move(g.paths),
		});
	}

	return result;
}

template<typename P>
static void
AddSmart(std::vector<PlaylistSpec> &dest, std::span<const MediaFile> files,
	 const char *name, const char *description, P &&predicate) noexcept
{
	PlaylistSpec spec{name, description, {}};
	for (const auto &file : files)
		if (predicate(file))
			spec.file_paths.push_back(file.path);

	if (spec.file_paths.empty()) {
		FmtDebug(playlist_domain, "Skipping empty playlist \"{}\"",
			 name);
		return;
	}

	dest.emplace_back(std::move(spec));
}

std::vector<PlaylistSpec>
ComposeSmart(std::span<const MediaFile> files,
	     std::chrono::system_clock::time_point now,
	     const CompatibilityPolicy &policy) noexcept
{
	std::vector<PlaylistSpec> result;

	const auto recent = now - RECENT_AGE;
	AddSmart(result, files, "Recently Added",
		 "Files added in the last 30 days",
		 [recent](const MediaFile &f){
			 return f.modified_time > recent;
		 });

	AddSmart(result, files, "Large Files", "Files larger than 100MB",
		 [](const MediaFile &f){
			 return f.size > LARGE_FILE_SIZE;
		 });

	AddSmart(result, files, "Audio Collection", "All audio files",
		 [](const MediaFile &f){
			 return Contains(audio_suffixes, GetMediaSuffix(f));
		 });

	AddSmart(result, files, "Video Collection", "All video files",
		 [](const MediaFile &f){
			 return Contains(video_suffixes, GetMediaSuffix(f));
		 });

	const auto compatible = SelectCompatible(files, policy);
	if (!compatible.empty()) {
		PlaylistSpec spec{
			"UPnP Compatible Videos",
			"Video files optimized for reliable UPnP/DLNA playback in VLC",
			{},
		};

		for (const auto *file : compatible)
			spec.file_paths.push_back(file->path);

		result.emplace_back(std::move(spec));
	}

	return result;
}

ComposedPlaylists
Compose(std::span<const MediaFile> files,
	std::chrono::system_clock::time_point now) noexcept
{
	const DefaultCompatibilityPolicy policy;

	ComposedPlaylists result{
		ComposeAuto(files),
		ComposeSmart(files, now, policy),
	};

	FmtInfo(playlist_domain,
		"Composed {} auto and {} smart playlists from {} files",
		result.auto_playlists.size(), result.smart_playlists.size(),
		files.size());

	return result;
}
