// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "playlist/MediaFile.hxx"

#include <gtest/gtest.h>

TEST(MediaFile, FileType)
{
	EXPECT_EQ(FileTypeFromMimeType("video/mp4"), FileType::VIDEO);
	EXPECT_EQ(FileTypeFromMimeType("video/x-matroska"), FileType::VIDEO);
	EXPECT_EQ(FileTypeFromMimeType("audio/flac"), FileType::AUDIO);
	EXPECT_EQ(FileTypeFromMimeType("image/jpeg"), FileType::UNKNOWN);
	EXPECT_EQ(FileTypeFromMimeType(""), FileType::UNKNOWN);

	EXPECT_STREQ(ToString(FileType::VIDEO), "video");
	EXPECT_STREQ(ToString(FileType::AUDIO), "audio");
	EXPECT_STREQ(ToString(FileType::UNKNOWN), "unknown");
}

TEST(MediaFile, FromCatalog)
{
	const auto now = std::chrono::system_clock::now();

	UPnPMediaItem item;
	item.id = "v1";
	item.title = "Holiday.mp4";
	item.mime_type = "video/mp4";
	item.resource_url = "http://nas/v1.mp4";
	item.size = 1234;
	item.duration = "0:01:00";
	item.container_path = {"Videos", "2023"};

	const auto file = MakeMediaFile(item, now);
	EXPECT_EQ(file.path, "http://nas/v1.mp4");
	EXPECT_EQ(file.name, "Holiday.mp4");
	EXPECT_EQ(file.size, 1234u);
	EXPECT_EQ(file.modified_time, now);
	EXPECT_EQ(file.file_type, FileType::VIDEO);
	EXPECT_EQ(file.directory, "Videos");
	ASSERT_TRUE(file.IsUpnp());

	const auto &source = std::get<UpnpSource>(file.source);
	EXPECT_EQ(source.object_id, "v1");
	EXPECT_EQ(source.mime_type, "video/mp4");
	EXPECT_EQ(source.duration, "0:01:00");
	EXPECT_EQ(source.url, "http://nas/v1.mp4");

	item.size.reset();
	EXPECT_EQ(MakeMediaFile(item, now).size, 0u);
}

TEST(MediaFile, Smb)
{
	const auto mtime = std::chrono::system_clock::now();
	const auto file = MakeSmbMediaFile("\\\\nas\\media\\Music\\Song.FLAC",
					   42, mtime, "media");

	EXPECT_EQ(file.name, "Song.FLAC");
	EXPECT_EQ(file.file_type, FileType::AUDIO);
	EXPECT_FALSE(file.IsUpnp());
	EXPECT_EQ(std::get<SmbSource>(file.source).share_name, "media");
}

TEST(MediaFile, Dedupe)
{
	CatalogSnapshot snapshot;
	for (const char *id : {"a", "b", "a2", "c", "b2"}) {
		UPnPMediaItem item;
		item.id = id;
		item.title = id;
		item.mime_type = "video/mp4";
		/* "a2" and "b2" repeat the URLs of "a" and "b" */
		item.resource_url = std::string{"http://nas/"} + id[0];
		snapshot.emplace_back(std::move(item));
	}

	const auto files = MakeMediaFiles(snapshot,
					  std::chrono::system_clock::now());
	ASSERT_EQ(files.size(), 3u);
	EXPECT_EQ(files[0].name, "a");
	EXPECT_EQ(files[1].name, "b");
	EXPECT_EQ(files[2].name, "c");
}
