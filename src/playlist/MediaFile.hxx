// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_PLAYLIST_MEDIA_FILE_HXX
#define NMC_PLAYLIST_MEDIA_FILE_HXX

#include "upnp/Object.hxx"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

enum class FileType {
	VIDEO,
	AUDIO,
	UNKNOWN,
};

/**
 * Returns "video", "audio" or "unknown".
 */
[[gnu::const]]
const char *
ToString(FileType type) noexcept;

/**
 * Classify by MIME type: "video/..." and "audio/...".
 */
[[gnu::pure]]
FileType
FileTypeFromMimeType(std::string_view mime_type) noexcept;

/**
 * A file found on a UPnP MediaServer.
 */
struct UpnpSource {
	std::string object_id;
	std::string mime_type;
	std::optional<std::string> duration;
	std::string url;
};

/**
 * A file found on an SMB share.
 */
struct SmbSource {
	std::string share_name;
};

using MediaSource = std::variant<UpnpSource, SmbSource>;

/**
 * A cataloged media file as handed to the playlist composer and the
 * M3U writer.
 */
struct MediaFile {
	/**
	 * The unique path; for UPnP files, this is the resource URL,
	 * for SMB files a UNC path.
	 */
	std::string path;

	/**
	 * The display name (UPnP title or SMB file name).
	 */
	std::string name;

	uint64_t size = 0;

	/**
	 * When the file was modified; for UPnP files, when it was
	 * cataloged.
	 */
	std::chrono::system_clock::time_point modified_time;

	FileType file_type = FileType::UNKNOWN;

	/**
	 * The first container title below the catalog root, or empty
	 * if the file was found directly in the root.
	 */
	std::string directory;

	MediaSource source;

	bool IsUpnp() const noexcept {
		return std::holds_alternative<UpnpSource>(source);
	}
};

/**
 * Convert one catalog item.
 *
 * @param now the catalog timestamp, used as modification time
 */
MediaFile
MakeMediaFile(const UPnPMediaItem &item,
	      std::chrono::system_clock::time_point now) noexcept;

/**
 * Construct a record for a file on an SMB share.  The file type is
 * derived from the file name suffix.
 */
MediaFile
MakeSmbMediaFile(std::string_view unc_path, uint64_t size,
		 std::chrono::system_clock::time_point modified_time,
		 std::string_view share_name) noexcept;

/**
 * Convert a catalog snapshot.  Items with an already seen resource
 * URL are dropped (the first occurrence wins), and each drop is
 * logged.
 */
std::vector<MediaFile>
MakeMediaFiles(const CatalogSnapshot &snapshot,
	       std::chrono::system_clock::time_point now) noexcept;

#endif
