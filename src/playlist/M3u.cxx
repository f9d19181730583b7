// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "M3u.hxx"
#include "MediaFile.hxx"
#include "PlaylistSpec.hxx"
#include "Domain.hxx"
#include "util/CharUtil.hxx"
#include "util/StringCompare.hxx"
#include "util/StringStrip.hxx"
#include "lib/fmt/SystemError.hxx"
#include "Log.hxx"

#include <fmt/ranges.h>

#include <unordered_map>

#include <fcntl.h>
#include <unistd.h>

static void
ReplaceAll(std::string &s, std::string_view from, std::string_view to) noexcept
{
	for (std::size_t i = s.find(from); i != s.npos;
	     i = s.find(from, i + to.size()))
		s.replace(i, from.size(), to);
}

/**
 * Replace line breaks with spaces so the text fits on one M3U line.
 */
static std::string
SingleLine(std::string_view text) noexcept
{
	std::string result{text};
	for (auto &ch : result)
		if (ch == '\r' || ch == '\n')
			ch = ' ';
	return result;
}

std::string
SanitizeTitle(std::string_view title) noexcept
{
	std::string result = SingleLine(title);
	ReplaceAll(result, " - ", " • ");
	ReplaceAll(result, ",", ";");
	ReplaceAll(result, ":", ".");
	ReplaceAll(result, "#", "No.");

	const auto stripped = Strip(std::string_view{result});
	if (stripped.empty())
		return "Unknown Title";

	return std::string{stripped};
}

std::string_view
GetFileStem(std::string_view name) noexcept
{
	if (const auto slash = name.rfind('/'); slash != name.npos)
		name = name.substr(slash + 1);

	/* a leading dot does not start a suffix */
	if (const auto dot = name.rfind('.');
	    dot != name.npos && dot > 0)
		name = name.substr(0, dot);

	return name;
}

std::string
GenerateM3u(const PlaylistSpec &spec,
	    std::span<const MediaFile> files) noexcept
{
	std::unordered_map<std::string_view, const MediaFile *> by_path;
	for (const auto &i : files)
		by_path.emplace(i.path, &i);

	std::vector<std::string> lines;
	lines.emplace_back("#EXTM3U");
	lines.emplace_back(fmt::format("#PLAYLIST:{}", SingleLine(spec.name)));
	if (!spec.description.empty())
		lines.emplace_back(fmt::format("# {}",
					       SingleLine(spec.description)));
	lines.emplace_back();

	for (const auto &path : spec.file_paths) {
		const auto i = by_path.find(path);
		if (i == by_path.end())
			continue;

		const auto &file = *i->second;
		lines.emplace_back(fmt::format("#EXTINF:-1,{}",
					       SanitizeTitle(GetFileStem(file.name))));
		lines.emplace_back(file.path);
		lines.emplace_back();
	}

	return fmt::format("{}", fmt::join(lines, "\n"));
}

std::vector<M3uEntry>
ParseM3u(std::string_view text) noexcept
{
	std::vector<M3uEntry> entries;
	std::string title;

	while (!text.empty()) {
		const auto newline = text.find('\n');
		auto line = Strip(text.substr(0, newline));
		text = newline == text.npos
			? std::string_view{}
			: text.substr(newline + 1);

		if (line.empty())
			continue;

		if (SkipPrefix(line, "#EXTINF:")) {
			const auto comma = line.find(',');
			title = comma == line.npos
				? std::string{}
				: std::string{line.substr(comma + 1)};
			continue;
		}

		if (line.front() == '#')
			continue;

		entries.push_back({std::move(title), std::string{line}});
		title.clear();
	}

	return entries;
}

std::string
MakePlaylistFileName(std::string_view name) noexcept
{
	std::string result;
	for (const char ch : name)
		if (IsAlphaNumericASCII(ch) || ch == ' ' ||
		    ch == '-' || ch == '_')
			result.push_back(ch);

	while (!result.empty() && result.back() == ' ')
		result.pop_back();

	if (result.empty())
		result = "playlist";

	result.append(".m3u");
	return result;
}

std::string
WriteM3uFile(std::string_view directory, const PlaylistSpec &spec,
	     std::span<const MediaFile> files)
{
	std::string path{directory};
	if (!path.empty() && path.back() != '/')
		path.push_back('/');
	path.append(MakePlaylistFileName(spec.name));

	const auto contents = GenerateM3u(spec, files);

	const int fd = open(path.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC,
			    0666);
	if (fd < 0)
		throw FmtErrno("Failed to create {}", path);

	std::string_view rest{contents};
	while (!rest.empty()) {
		const auto nbytes = write(fd, rest.data(), rest.size());
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			const int code = errno;
			close(fd);
			throw FmtErrno(code, "Failed to write {}", path);
		}

		rest.remove_prefix(nbytes);
	}

	if (close(fd) < 0)
		throw FmtErrno("Failed to write {}", path);

	FmtDebug(playlist_domain, "Wrote {} ({} entries)",
		 path, spec.file_paths.size());
	return path;
}
