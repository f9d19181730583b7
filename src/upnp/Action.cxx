// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "Action.hxx"

#include <fmt/format.h>

std::string
XmlEscape(std::string_view src) noexcept
{
	std::string result;
	result.reserve(src.size());

	for (const char ch : src) {
		switch (ch) {
		case '&':
			result.append("&amp;");
			break;

		case '<':
			result.append("&lt;");
			break;

		case '>':
			result.append("&gt;");
			break;

		case '"':
			result.append("&quot;");
			break;

		case '\'':
			result.append("&apos;");
			break;

		default:
			result.push_back(ch);
		}
	}

	return result;
}

std::string
FormatBrowseRequest(std::string_view object_id,
		    unsigned starting_index,
		    unsigned requested_count) noexcept
{
	return fmt::format(R"(<?xml version="1.0" encoding="utf-8"?>
<s:Envelope xmlns:s="http://schemas.xmlsoap.org/soap/envelope/" s:encodingStyle="http://schemas.xmlsoap.org/soap/encoding/">
<s:Body>
<u:Browse xmlns:u="{}">
<ObjectID>{}</ObjectID>
<BrowseFlag>BrowseDirectChildren</BrowseFlag>
<Filter>*</Filter>
<StartingIndex>{}</StartingIndex>
<RequestedCount>{}</RequestedCount>
<SortCriteria></SortCriteria>
</u:Browse>
</s:Body>
</s:Envelope>
)",
			   CONTENT_DIRECTORY_SERVICE_TYPE,
			   XmlEscape(object_id),
			   starting_index, requested_count);
}

std::vector<std::string>
MakeSoapHeaders(std::string_view service_type,
		std::string_view action) noexcept
{
	return {
		"Content-Type: text/xml; charset=\"utf-8\"",
		fmt::format("SOAPAction: \"{}#{}\"", service_type, action),
	};
}
