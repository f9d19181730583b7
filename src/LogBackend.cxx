// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>
#include <mutex>

#include <stdio.h>

using std::string_view_literals::operator""sv;

static LogLevel log_threshold = LogLevel::NOTICE;

static bool enable_timestamp;

/**
 * Serializes output from the resolver and browser worker threads.
 */
static std::mutex log_mutex;

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold = _threshold;
}

void
EnableLogTimestamp() noexcept
{
	enable_timestamp = true;
}

static std::string
log_date() noexcept
{
	const time_t t = time(nullptr);
	struct tm tm;
	if (localtime_r(&t, &tm) == nullptr)
		return {};

	return fmt::format("{:%FT%T} "sv, tm);
}

static void
FileLog(const Domain &domain, std::string_view message) noexcept
{
	const std::string date = enable_timestamp ? log_date() : std::string{};

	const std::scoped_lock lock{log_mutex};
	fmt::print(stderr, "{}{}: {}\n",
		   date, domain.GetName(), StripRight(message));
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < log_threshold)
		return;

	FileLog(domain, msg);
}
