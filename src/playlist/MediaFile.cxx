// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "MediaFile.hxx"
#include "Domain.hxx"
#include "util/UriUtil.hxx"
#include "Log.hxx"

#include <unordered_set>

const char *
ToString(FileType type) noexcept
{
	switch (type) {
	case FileType::VIDEO:
		return "video";

	case FileType::AUDIO:
		return "audio";

	case FileType::UNKNOWN:
		break;
	}

	return "unknown";
}

FileType
FileTypeFromMimeType(std::string_view mime_type) noexcept
{
	if (mime_type.starts_with("video/"))
		return FileType::VIDEO;
	else if (mime_type.starts_with("audio/"))
		return FileType::AUDIO;
	else
		return FileType::UNKNOWN;
}

MediaFile
MakeMediaFile(const UPnPMediaItem &item,
	      std::chrono::system_clock::time_point now) noexcept
{
	MediaFile file;
	file.path = item.resource_url;
	file.name = item.title;
	file.size = item.size.value_or(0);
	file.modified_time = now;
	file.file_type = FileTypeFromMimeType(item.mime_type);

	if (!item.container_path.empty())
		file.directory = item.container_path.front();

	file.source = UpnpSource{
		item.id,
		item.mime_type,
		item.duration,
		item.resource_url,
	};

	return file;
}

[[gnu::pure]]
static FileType
FileTypeFromSuffix(std::string_view name) noexcept
{
	static constexpr std::string_view video[] = {
		"mp4", "avi", "mkv", "mov", "wmv", "flv", "webm", "m4v",
	};
	static constexpr std::string_view audio[] = {
		"mp3", "flac", "wav", "aac", "ogg", "wma", "m4a",
	};

	const auto suffix = uri_get_suffix_lower(name);

	for (const auto i : video)
		if (suffix == i)
			return FileType::VIDEO;

	for (const auto i : audio)
		if (suffix == i)
			return FileType::AUDIO;

	return FileType::UNKNOWN;
}

MediaFile
MakeSmbMediaFile(std::string_view unc_path, uint64_t size,
		 std::chrono::system_clock::time_point modified_time,
		 std::string_view share_name) noexcept
{
	MediaFile file;
	file.path = unc_path;

	const auto backslash = unc_path.rfind('\\');
	file.name = backslash == unc_path.npos
		? unc_path
		: unc_path.substr(backslash + 1);

	file.size = size;
	file.modified_time = modified_time;
	file.file_type = FileTypeFromSuffix(file.name);
	file.source = SmbSource{std::string{share_name}};
	return file;
}

std::vector<MediaFile>
MakeMediaFiles(const CatalogSnapshot &snapshot,
	       std::chrono::system_clock::time_point now) noexcept
{
	std::vector<MediaFile> files;
	files.reserve(snapshot.size());

	std::unordered_set<std::string_view> seen;
	std::size_t n_duplicates = 0;

	for (const auto &item : snapshot) {
		if (!seen.emplace(item.resource_url).second) {
			FmtDebug(playlist_domain, "Skipping duplicate file {}",
				 item.resource_url);
			++n_duplicates;
			continue;
		}

		files.emplace_back(MakeMediaFile(item, now));
	}

	if (n_duplicates > 0)
		FmtInfo(playlist_domain, "Skipped {} duplicate file(s)",
			n_duplicates);

	return files;
}
