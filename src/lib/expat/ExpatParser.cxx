// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "ExpatParser.hxx"
#include "util/StringAPI.hxx"

void
ExpatParser::Parse(std::string_view src)
{
	if (XML_Parse(parser, src.data(), int(src.size()),
		      true) != XML_STATUS_OK)
		throw ExpatError(parser);
}

const char *
ExpatParser::GetAttribute(const XML_Char **atts,
			  const char *name) noexcept
{
	for (unsigned i = 0; atts[i] != nullptr; i += 2)
		if (StringIsEqual(atts[i], name))
			return atts[i + 1];

	return nullptr;
}

std::pair<std::string_view, std::string_view>
SplitExpandedName(std::string_view name, char separator) noexcept
{
	const auto i = name.rfind(separator);
	if (i == name.npos)
		return {{}, name};

	return {name.substr(0, i), name.substr(i + 1)};
}
