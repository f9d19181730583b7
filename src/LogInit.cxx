// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "LogInit.hxx"
#include "LogBackend.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringAPI.hxx"

LogLevel
ParseLogLevel(const char *value)
{
	if (StringIsEqual(value, "debug"))
		return LogLevel::DEBUG;
	else if (StringIsEqual(value, "info"))
		return LogLevel::INFO;
	else if (StringIsEqual(value, "notice") ||
		 StringIsEqual(value, "default"))
		return LogLevel::NOTICE;
	else if (StringIsEqual(value, "warning"))
		return LogLevel::WARNING;
	else if (StringIsEqual(value, "error"))
		return LogLevel::ERROR;
	else
		throw FmtRuntimeError("unknown log level \"{}\"", value);
}

void
log_init(const ConfigData &config, bool verbose)
{
	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
	else
		SetLogThreshold(config.With(ConfigOption::LOG_LEVEL,
					    [](const char *s){
			return s != nullptr
				? ParseLogLevel(s)
				: LogLevel::NOTICE;
		}));

	if (config.GetBool(ConfigOption::LOG_TIMESTAMP, false))
		EnableLogTimestamp();
}
