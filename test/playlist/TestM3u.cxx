// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "PlaylistUtil.hxx"
#include "playlist/M3u.hxx"
#include "playlist/PlaylistSpec.hxx"
#include "upnp/Directory.hxx"
#include "system/Error.hxx"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <system_error>
#include <variant>

using std::string_view_literals::operator""sv;

TEST(M3u, SanitizeTitle)
{
	EXPECT_EQ(SanitizeTitle("Artist - Title, Part 1: The #1"),
		  "Artist • Title; Part 1. The No.1");
	EXPECT_EQ(SanitizeTitle("  padded  "), "padded");
	EXPECT_EQ(SanitizeTitle("a-b"), "a-b");
	EXPECT_EQ(SanitizeTitle(""), "Unknown Title");
	EXPECT_EQ(SanitizeTitle("   "), "Unknown Title");
}

TEST(M3u, FileStem)
{
	EXPECT_EQ(GetFileStem("Holiday.mp4"), "Holiday"sv);
	EXPECT_EQ(GetFileStem("a.b.mkv"), "a.b"sv);
	EXPECT_EQ(GetFileStem(".hidden"), ".hidden"sv);
	EXPECT_EQ(GetFileStem("AC/DC - Thunder.mp3"), "DC - Thunder"sv);
	EXPECT_EQ(GetFileStem("Track 1"), "Track 1"sv);
}

static std::vector<MediaFile>
MakeFiles()
{
	return {
		MakeFile("Holiday.mp4", "http://nas/1.mp4"),
		MakeFile("Artist - Song: Live.mp4", "http://nas/2.mp4"),
		MakeFile("", "http://nas/3.mp4"),
	};
}

TEST(M3u, Generate)
{
	const auto files = MakeFiles();
	const PlaylistSpec spec{
		"Videos",
		"All video files",
		{"http://nas/2.mp4", "http://nas/missing.mp4", "http://nas/1.mp4"},
	};

	EXPECT_EQ(GenerateM3u(spec, files),
		  "#EXTM3U\n"
		  "#PLAYLIST:Videos\n"
		  "# All video files\n"
		  "\n"
		  "#EXTINF:-1,Artist • Song. Live\n"
		  "http://nas/2.mp4\n"
		  "\n"
		  "#EXTINF:-1,Holiday\n"
		  "http://nas/1.mp4\n");
}

TEST(M3u, GenerateWithoutDescription)
{
	const auto files = MakeFiles();
	const PlaylistSpec spec{"Empty", "", {}};

	EXPECT_EQ(GenerateM3u(spec, files),
		  "#EXTM3U\n"
		  "#PLAYLIST:Empty\n");
}

TEST(M3u, RoundTrip)
{
	const auto files = MakeFiles();
	const PlaylistSpec spec{
		"Mix",
		"Some files",
		{"http://nas/3.mp4", "http://nas/1.mp4", "http://nas/2.mp4"},
	};

	const auto entries = ParseM3u(GenerateM3u(spec, files));
	ASSERT_EQ(entries.size(), 3u);

	std::vector<std::string> urls;
	for (const auto &i : entries)
		urls.push_back(i.url);
	EXPECT_EQ(urls, spec.file_paths);

	EXPECT_EQ(entries[0].title, "Unknown Title");
	EXPECT_EQ(entries[1].title, "Holiday");
}

TEST(M3u, LineBreaksInTitles)
{
	EXPECT_EQ(SanitizeTitle("Part 1\r\nPart 2"), "Part 1  Part 2");

	const auto entries = ParseDidlLite(R"(<DIDL-Lite xmlns="urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/"
 xmlns:dc="http://purl.org/dc/elements/1.1/">
<item id="v1" parentID="1">
  <dc:title>Part 1&#10;Part 2.mp4</dc:title>
  <res protocolInfo="http-get:*:video/mp4:*">http://nas/1.mp4</res>
</item>
</DIDL-Lite>)");
	ASSERT_EQ(entries.size(), 1u);

	const std::vector<MediaFile> files{
		MakeMediaFile(std::get<UPnPMediaItem>(entries.front()),
			      std::chrono::system_clock::now()),
	};
	ASSERT_EQ(files.front().name, "Part 1\nPart 2.mp4");

	const PlaylistSpec spec{
		"Directory: Season\n1",
		"Auto-generated playlist for directory 'Season\r\n1'",
		{"http://nas/1.mp4"},
	};

	const auto m3u = GenerateM3u(spec, files);
	EXPECT_NE(m3u.find("#PLAYLIST:Directory: Season 1\n"), m3u.npos);
	EXPECT_NE(m3u.find("# Auto-generated playlist for directory 'Season  1'\n"),
		  m3u.npos);

	const auto parsed = ParseM3u(m3u);
	ASSERT_EQ(parsed.size(), 1u);
	EXPECT_EQ(parsed.front().url, "http://nas/1.mp4");
	EXPECT_EQ(parsed.front().title, "Part 1 Part 2");
}

TEST(M3u, Parse)
{
	const auto entries = ParseM3u("#EXTM3U\r\n"
				      "#EXTINF:123,Artist, Title\r\n"
				      "http://a/1\r\n"
				      "# comment\n"
				      "http://a/2\n"
				      "#EXTINF:-1\n"
				      "http://a/3");
	ASSERT_EQ(entries.size(), 3u);
	EXPECT_EQ(entries[0].title, "Artist, Title");
	EXPECT_EQ(entries[0].url, "http://a/1");
	EXPECT_EQ(entries[1].title, "");
	EXPECT_EQ(entries[1].url, "http://a/2");
	EXPECT_EQ(entries[2].title, "");
	EXPECT_EQ(entries[2].url, "http://a/3");

	EXPECT_TRUE(ParseM3u("").empty());
}

TEST(M3u, FileName)
{
	EXPECT_EQ(MakePlaylistFileName("All VIDEO Files"), "All VIDEO Files.m3u");
	EXPECT_EQ(MakePlaylistFileName("Directory: Movies/2023"),
		  "Directory Movies2023.m3u");
	EXPECT_EQ(MakePlaylistFileName("my_list-1 !"), "my_list-1.m3u");
	EXPECT_EQ(MakePlaylistFileName("???"), "playlist.m3u");
}

TEST(M3u, WriteFile)
{
	const auto files = MakeFiles();
	const PlaylistSpec spec{"Test: Write", "", {"http://nas/1.mp4"}};

	const auto path = WriteM3uFile(testing::TempDir(), spec, files);
	EXPECT_TRUE(path.ends_with("/Test Write.m3u"));

	std::ifstream is(path);
	ASSERT_TRUE(is);
	std::stringstream contents;
	contents << is.rdbuf();
	EXPECT_EQ(contents.str(), GenerateM3u(spec, files));

	try {
		WriteM3uFile("/nonexistent/directory", spec, files);
		FAIL() << "exception expected";
	} catch (const std::system_error &e) {
		EXPECT_TRUE(IsErrno(e, ENOENT)) << e.what();
	}
}
