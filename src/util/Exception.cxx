// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Exception.hxx"
#include "CharUtil.hxx"
#include "StringStrip.hxx"

static void
AppendSanitize(std::string &dest, const char *src) noexcept
{
	src = StripLeft(src);

	bool space = false;
	while (char ch = *src++) {
		if (IsWhitespaceFast(ch)) {
			space = true;
			continue;
		}

		if (space) {
			space = false;
			dest.push_back(' ');
		}

		dest.push_back(ch);
	}
}

static void
AppendNested(std::string &dest, const std::exception &e,
	     const char *separator) noexcept;

static void
AppendMessage(std::string &dest, std::exception_ptr ep,
	      const char *separator) noexcept
{
	if (!dest.empty())
		dest += separator;

	try {
		std::rethrow_exception(std::move(ep));
	} catch (const std::exception &e) {
		AppendSanitize(dest, e.what());
		AppendNested(dest, e, separator);
	} catch (const char *s) {
		AppendSanitize(dest, s);
	} catch (...) {
		dest += "Unknown exception";
	}
}

static void
AppendNested(std::string &dest, const std::exception &e,
	     const char *separator) noexcept
{
	const auto *nested = dynamic_cast<const std::nested_exception *>(&e);
	if (nested != nullptr && nested->nested_ptr())
		AppendMessage(dest, nested->nested_ptr(), separator);
}

std::string
GetFullMessage(const std::exception &e, const char *separator) noexcept
{
	std::string result;
	AppendSanitize(result, e.what());
	AppendNested(result, e, separator);
	return result;
}

std::string
GetFullMessage(std::exception_ptr ep, const char *separator) noexcept
{
	std::string result;
	AppendMessage(result, std::move(ep), separator);
	return result;
}
