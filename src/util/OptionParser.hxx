// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_UTIL_OPTIONPARSER_HXX
#define NMC_UTIL_OPTIONPARSER_HXX

#include "OptionDef.hxx"

#include <span>
#include <vector>

/**
 * Command line option parser.
 */
class OptionParser
{
	std::span<const OptionDef> options;

	std::span<const char *const> args;

	std::vector<const char *> remaining;

public:
	OptionParser(std::span<const OptionDef> _options,
		     int _argc, char **_argv) noexcept
		:options(_options), args(_argv + 1, _argc - 1) {}

	struct Result {
		int index;
		const char *value;

		constexpr operator bool() const noexcept {
			return index >= 0;
		}
	};

	/**
	 * Parses the current command line entry and advances to the
	 * next one.  Non-option arguments are collected and can be
	 * obtained with GetRemaining().
	 *
	 * Throws on error.
	 */
	Result Next();

	/**
	 * Returns the remaining non-option arguments.
	 */
	std::span<const char *const> GetRemaining() const noexcept {
		return remaining;
	}

private:
	const char *Shift() noexcept {
		const char *s = args.front();
		args = args.subspan(1);
		return s;
	}

	const char *CheckShiftValue(const char *s, const OptionDef &option);
	Result IdentifyOption(const char *s);
};

#endif
