// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "File.hxx"
#include "Data.hxx"
#include "Param.hxx"
#include "Templates.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <sstream>
#include <string>

#include <fcntl.h>
#include <unistd.h>

static constexpr char CONF_COMMENT = '#';

static constexpr Domain config_file_domain("config_file");

static constexpr bool
IsWordChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '_';
}

/**
 * Read the option name at the beginning of the line.
 */
static std::string_view
NextWord(std::string_view &line)
{
	std::size_t i = 0;
	while (i < line.size() && IsWordChar(line[i]))
		++i;

	if (i == 0)
		throw std::runtime_error("Letter expected");

	if (i < line.size() && !IsWhitespaceOrNull(line[i]))
		throw std::runtime_error("Invalid word character");

	auto word = line.substr(0, i);
	line = StripLeft(line.substr(i));
	return word;
}

/**
 * Read a quoted string (with backslash escapes) or an unquoted
 * word.
 */
static std::string
NextString(std::string_view &line)
{
	if (line.empty() || line.front() == CONF_COMMENT)
		throw std::runtime_error("Value missing");

	std::string value;

	if (line.front() != '"') {
		std::size_t i = 0;
		while (i < line.size() && !IsWhitespaceOrNull(line[i]))
			++i;

		value = line.substr(0, i);
		line = StripLeft(line.substr(i));
		return value;
	}

	line.remove_prefix(1);

	while (true) {
		if (line.empty())
			throw std::runtime_error("Missing closing '\"'");

		char ch = line.front();
		line.remove_prefix(1);

		if (ch == '"')
			break;

		if (ch == '\\') {
			if (line.empty())
				throw std::runtime_error("Missing closing '\"'");
			ch = line.front();
			line.remove_prefix(1);
		}

		value.push_back(ch);
	}

	if (!line.empty() && !IsWhitespaceOrNull(line.front()))
		throw std::runtime_error("Space expected after closing '\"'");

	line = StripLeft(line);
	return value;
}

static void
ReadConfigParam(ConfigData &config_data, std::string_view line,
		unsigned line_number)
{
	const std::string name{NextWord(line)};

	const ConfigOption o = ParseConfigOptionName(name.c_str());
	if (o == ConfigOption::MAX)
		throw FmtRuntimeError("unrecognized parameter: {}", name);

	const ConfigTemplate &option = config_param_templates[unsigned(o)];
	if (option.deprecated)
		FmtWarning(config_file_domain,
			   "config parameter \"{}\" on line {} is deprecated",
			   name, line_number);

	auto value = NextString(line);
	if (!line.empty() && line.front() != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after value");

	if (!option.repeatable)
		/* if the option is not repeatable, override the old
		   value by removing it first */
		config_data.GetParamList(o).clear();

	config_data.AddParam(o, ConfigParam(std::move(value), int(line_number)));
}

void
ReadConfigFile(ConfigData &config_data, std::istream &is, const char *name)
{
	unsigned line_number = 0;

	try {
		std::string buffer;
		while (std::getline(is, buffer)) {
			++line_number;

			const auto line = Strip(std::string_view{buffer});
			if (line.empty() || line.front() == CONF_COMMENT)
				continue;

			ReadConfigParam(config_data, line, line_number);
		}
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in {} line {}",
						       name, line_number));
	}
}

void
ReadConfigFile(ConfigData &config_data, const char *path)
{
	FmtDebug(config_file_domain, "loading file {}", path);

	const int fd = open(path, O_RDONLY|O_CLOEXEC);
	if (fd < 0)
		throw FmtErrno("Failed to open {}", path);

	std::string contents;
	char buffer[4096];
	while (true) {
		const auto nbytes = read(fd, buffer, sizeof(buffer));
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			const int code = errno;
			close(fd);
			throw FmtErrno(code, "Failed to read {}", path);
		}

		if (nbytes == 0)
			break;

		contents.append(buffer, nbytes);
	}

	close(fd);

	std::istringstream file(contents);
	ReadConfigFile(config_data, file, path);
}
