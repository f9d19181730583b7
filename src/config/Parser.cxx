// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringAPI.hxx"

#include <cerrno>
#include <climits>
#include <cstdlib>

bool
ParseBool(const char *value)
{
	static const char *const t[] = { "yes", "true", "1" };
	static const char *const f[] = { "no", "false", "0" };

	for (const char *i : t)
		if (StringIsEqualIgnoreCase(value, i))
			return true;

	for (const char *i : f)
		if (StringIsEqualIgnoreCase(value, i))
			return false;

	throw FmtRuntimeError(R"(Not a valid boolean ("yes" or "no"): "{}")", value);
}

long
ParseLong(const char *s)
{
	char *endptr;
	errno = 0;
	long value = strtol(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
		throw std::runtime_error("Failed to parse number");

	if (errno == ERANGE)
		throw std::runtime_error("Number is out of range");

	return value;
}

unsigned
ParseUnsigned(const char *s)
{
	auto value = ParseLong(s);
	if (value < 0)
		throw std::runtime_error("Value must not be negative");

	if (value > long(UINT_MAX))
		throw std::runtime_error("Value too large");

	return (unsigned)value;
}

unsigned
ParsePositive(const char *s)
{
	auto value = ParseUnsigned(s);
	if (value == 0)
		throw std::runtime_error("Value must be positive");

	return value;
}
