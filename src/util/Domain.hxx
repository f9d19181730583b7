// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef NMC_UTIL_DOMAIN_HXX
#define NMC_UTIL_DOMAIN_HXX

/**
 * A named subsystem which tags log messages.  Instances are compared
 * by address, so each one must be a unique (usually "static
 * constexpr") object.
 */
class Domain {
	const char *const name;

public:
	explicit constexpr Domain(const char *_name) noexcept
		:name(_name) {}

	Domain(const Domain &) = delete;
	Domain &operator=(const Domain &) = delete;

	constexpr const char *GetName() const noexcept {
		return name;
	}

	bool operator==(const Domain &other) const noexcept {
		return this == &other;
	}
};

#endif
