// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_UTIL_OPTIONDEF_HXX
#define NMC_UTIL_OPTIONDEF_HXX

/**
 * Command line option definition.
 */
class OptionDef
{
	const char *long_option;
	char short_option = 0;
	bool has_value = false;
	const char *value_name = nullptr;
	const char *desc;

public:
	constexpr OptionDef(const char *_long_option, const char *_desc) noexcept
		:long_option(_long_option), desc(_desc) {}

	constexpr OptionDef(const char *_long_option,
			    char _short_option, const char *_desc) noexcept
		:long_option(_long_option),
		 short_option(_short_option),
		 desc(_desc) {}

	/**
	 * Construct an option which expects a value, e.g.
	 * "--config FILE".
	 */
	constexpr OptionDef(const char *_long_option,
			    char _short_option, const char *_value_name,
			    const char *_desc) noexcept
		:long_option(_long_option),
		 short_option(_short_option),
		 has_value(true), value_name(_value_name),
		 desc(_desc) {}

	constexpr bool HasLongOption() const noexcept {
		return long_option != nullptr;
	}

	constexpr bool HasShortOption() const noexcept {
		return short_option != 0;
	}

	constexpr bool HasValue() const noexcept {
		return has_value;
	}

	constexpr bool HasDescription() const noexcept {
		return desc != nullptr;
	}

	constexpr const char *GetLongOption() const noexcept {
		return long_option;
	}

	constexpr char GetShortOption() const noexcept {
		return short_option;
	}

	constexpr const char *GetValueName() const noexcept {
		return value_name;
	}

	constexpr const char *GetDescription() const noexcept {
		return desc;
	}
};

#endif
