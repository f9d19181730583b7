// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "PlaylistUtil.hxx"
#include "playlist/Composer.hxx"
#include "playlist/CompatibilityPolicy.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static std::vector<std::string>
GetNames(const std::vector<PlaylistSpec> &playlists)
{
	std::vector<std::string> names;
	for (const auto &i : playlists)
		names.push_back(i.name);
	return names;
}

static const PlaylistSpec *
FindPlaylist(const std::vector<PlaylistSpec> &playlists,
	     std::string_view name) noexcept
{
	for (const auto &i : playlists)
		if (i.name == name)
			return &i;
	return nullptr;
}

TEST(Composer, DirectoryKey)
{
	EXPECT_EQ(GetDirectoryKey(MakeFile("a.mp4", "http://nas/a.mp4",
					   "video/mp4", 0, "Movies")),
		  "Movies"sv);
	EXPECT_EQ(GetDirectoryKey(MakeFile("a.mp4", "http://nas/a/b/c/d.mp4")),
		  ""sv);

	const auto now = std::chrono::system_clock::now();
	EXPECT_EQ(GetDirectoryKey(MakeSmbMediaFile("\\\\nas\\media\\Music\\a.mp3",
						   0, now, "media")),
		  "media"sv);
	EXPECT_EQ(GetDirectoryKey(MakeSmbMediaFile("\\\\nas", 0, now, "")),
		  ""sv);
}

TEST(Composer, MediaSuffix)
{
	EXPECT_EQ(GetMediaSuffix(MakeFile("Song.FLAC", "http://nas/1")), "flac");
	EXPECT_EQ(GetMediaSuffix(MakeFile("Track 1", "http://nas/t1.mp3?sid=2")),
		  "mp3");
	EXPECT_EQ(GetMediaSuffix(MakeFile("Track 1", "http://nas/t1")), "");
}

TEST(Composer, Auto)
{
	const std::vector<MediaFile> files{
		MakeFile("v1.mp4", "http://nas/v1", "video/mp4", 0, "Movies"),
		MakeFile("a1.mp3", "http://nas/a1", "audio/mpeg", 0, "Music"),
		MakeFile("v2.mp4", "http://nas/v2", "video/mp4", 0, "Movies"),
		MakeFile("v3.mp4", "http://nas/v3", "video/mp4"),
		MakeFile("a2.mp3", "http://nas/a2", "audio/mpeg", 0, "Music"),
		MakeFile("x1.bin", "http://nas/x1", "application/octet-stream",
			 0, "Misc"),
	};

	const auto playlists = ComposeAuto(files);
	EXPECT_EQ(GetNames(playlists),
		  (std::vector<std::string>{
			  "All VIDEO Files",
			  "All AUDIO Files",
			  "Directory: Movies",
			  "Directory: Music",
		  }));

	EXPECT_EQ(playlists[0].description,
		  "Auto-generated playlist for all video files");
	EXPECT_EQ(playlists[0].file_paths,
		  (std::vector<std::string>{"http://nas/v1", "http://nas/v2", "http://nas/v3"}));

	EXPECT_EQ(playlists[2].description,
		  "Auto-generated playlist for directory 'Movies'");
	EXPECT_EQ(playlists[2].file_paths,
		  (std::vector<std::string>{"http://nas/v1", "http://nas/v2"}));
}

TEST(Composer, AutoSingleMembers)
{
	const std::vector<MediaFile> files{
		MakeFile("v1.mp4", "http://nas/v1", "video/mp4", 0, "Movies"),
		MakeFile("a1.mp3", "http://nas/a1", "audio/mpeg", 0, "Music"),
	};

	EXPECT_TRUE(ComposeAuto(files).empty());
	EXPECT_TRUE(ComposeAuto({}).empty());
}

TEST(Composer, Smart)
{
	const auto now = std::chrono::system_clock::now();

	std::vector<MediaFile> files{
		MakeFile("Holiday.mp4", "http://nas/1", "video/mp4",
			 100 * 1024 * 1024 + 1),
		MakeFile("Show.MKV", "http://nas/2", "video/x-matroska",
			 100 * 1024 * 1024),
		MakeFile("Song.flac", "http://nas/3", "audio/flac"),
		MakeFile("Track", "http://nas/4.m4a", "audio/mp4"),
		MakeFile("Old.avi", "http://nas/5", "video/avi"),
	};

	files[4].modified_time = now - std::chrono::hours(31 * 24);

	const DefaultCompatibilityPolicy policy;
	const auto playlists = ComposeSmart(files, now, policy);

	EXPECT_EQ(GetNames(playlists),
		  (std::vector<std::string>{
			  "Recently Added",
			  "Large Files",
			  "Audio Collection",
			  "Video Collection",
			  "UPnP Compatible Videos",
		  }));

	const auto *recent = FindPlaylist(playlists, "Recently Added");
	ASSERT_NE(recent, nullptr);
	EXPECT_EQ(recent->description, "Files added in the last 30 days");
	EXPECT_EQ(recent->file_paths.size(), 4u);

	const auto *large = FindPlaylist(playlists, "Large Files");
	ASSERT_NE(large, nullptr);
	EXPECT_EQ(large->description, "Files larger than 100MB");
	EXPECT_EQ(large->file_paths, std::vector<std::string>{"http://nas/1"});

	const auto *audio = FindPlaylist(playlists, "Audio Collection");
	ASSERT_NE(audio, nullptr);
	EXPECT_EQ(audio->file_paths,
		  (std::vector<std::string>{"http://nas/3", "http://nas/4.m4a"}));

	const auto *video = FindPlaylist(playlists, "Video Collection");
	ASSERT_NE(video, nullptr);
	EXPECT_EQ(video->file_paths,
		  (std::vector<std::string>{"http://nas/1", "http://nas/2", "http://nas/5"}));

	const auto *compatible = FindPlaylist(playlists, "UPnP Compatible Videos");
	ASSERT_NE(compatible, nullptr);
	EXPECT_EQ(compatible->description,
		  "Video files optimized for reliable UPnP/DLNA playback in VLC");
	/* mp4 before mkv before avi */
	EXPECT_EQ(compatible->file_paths,
		  (std::vector<std::string>{"http://nas/1", "http://nas/2", "http://nas/5"}));
}

TEST(Composer, SmartOmitsEmpty)
{
	const auto now = std::chrono::system_clock::now();

	std::vector<MediaFile> files{
		MakeFile("Song.flac", "http://nas/3", "audio/flac"),
	};
	files[0].modified_time = now - std::chrono::hours(60 * 24);

	const DefaultCompatibilityPolicy policy;
	EXPECT_EQ(GetNames(ComposeSmart(files, now, policy)),
		  std::vector<std::string>{"Audio Collection"});
}

TEST(Composer, Compose)
{
	const std::vector<MediaFile> files{
		MakeFile("a.mp4", "http://nas/a"),
		MakeFile("b.mp4", "http://nas/b"),
	};

	const auto result = Compose(files, std::chrono::system_clock::now());
	EXPECT_EQ(GetNames(result.auto_playlists),
		  std::vector<std::string>{"All VIDEO Files"});
	EXPECT_EQ(GetNames(result.smart_playlists),
		  (std::vector<std::string>{
			  "Recently Added",
			  "Video Collection",
			  "UPnP Compatible Videos",
		  }));
}
