// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_CONFIG_PARAM_HXX
#define NMC_CONFIG_PARAM_HXX

#include <concepts>
#include <string>

struct ConfigParam {
	std::string value;

	int line;

	explicit ConfigParam(int _line=-1)
		:line(_line) {}

	template<typename V>
	explicit ConfigParam(V &&_value, int _line=-1) noexcept
		:value(std::forward<V>(_value)), line(_line) {}

	ConfigParam(ConfigParam &&) = default;
	ConfigParam &operator=(ConfigParam &&) = default;

	/**
	 * Determine if this is a "null" instance, i.e. an empty
	 * object that was synthesized (e.g. from the command line)
	 * and not loaded from a configuration file.
	 */
	bool IsNull() const noexcept {
		return line < 0;
	}

	/**
	 * Call this method in a "catch" block to throw a nested
	 * exception showing the location of this setting in the
	 * configuration file.
	 */
	[[noreturn]]
	void ThrowWithNested() const;

	/**
	 * Invoke a function with the configured value; if the
	 * function throws, call ThrowWithNested().
	 */
	template<std::regular_invocable<const char *> F>
	auto With(F &&f) const {
		try {
			return f(value.c_str());
		} catch (...) {
			ThrowWithNested();
		}
	}
};

#endif
