// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "Directory.hxx"
#include "lib/expat/ExpatParser.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>
#include <charconv>
#include <iterator>

static constexpr char NS_SEPARATOR = '|';

static constexpr std::string_view supported_mime_types[] = {
	"video/mp4",
	"video/avi",
	"video/x-msvideo",
	"video/quicktime",
	"video/x-ms-wmv",
	"video/x-flv",
	"video/webm",
	"video/x-matroska",
	"audio/mpeg",
	"audio/mp3",
	"audio/flac",
	"audio/wav",
	"audio/aac",
	"audio/ogg",
	"audio/x-ms-wma",
	"audio/mp4",
};

bool
IsSupportedMimeType(std::string_view mime_type) noexcept
{
	return std::find(std::begin(supported_mime_types),
			 std::end(supported_mime_types),
			 mime_type) != std::end(supported_mime_types);
}

std::string_view
ParseProtocolInfoMimeType(std::string_view protocol_info) noexcept
{
	for (unsigned i = 0; i < 2; ++i) {
		const auto colon = protocol_info.find(':');
		if (colon == protocol_info.npos)
			return {};
		protocol_info.remove_prefix(colon + 1);
	}

	return protocol_info.substr(0, protocol_info.find(':'));
}

template<typename T>
static std::optional<T>
ParseNumber(std::string_view s) noexcept
{
	s = Strip(s);

	T value;
	const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value);
	if (ec != std::errc{} || end != s.data() + s.size())
		return std::nullopt;

	return value;
}

/**
 * An XML parser which builds a list of #CatalogEntry from DIDL-Lite
 * input.
 */
class DidlLiteParser final : public CommonExpatParser {
	std::vector<UPnPContainer> containers;
	std::vector<UPnPMediaItem> items;

	enum class State {
		NONE,
		CONTAINER,
		ITEM,
	} state = State::NONE;

	UPnPContainer container;
	UPnPMediaItem item;

	/**
	 * Has the current item's first "res" element been seen?
	 */
	bool have_res = false;

	/**
	 * Nesting depth below the current container/item element.
	 * Only direct children are evaluated.
	 */
	unsigned depth = 0;

	std::string text;

public:
	DidlLiteParser() noexcept
		:CommonExpatParser(ExpatNamespaceSeparator{NS_SEPARATOR}) {}

	std::vector<CatalogEntry> Finish() noexcept {
		std::vector<CatalogEntry> result;
		result.reserve(containers.size() + items.size());

		for (auto &i : containers)
			result.emplace_back(std::move(i));
		for (auto &i : items)
			result.emplace_back(std::move(i));

		return result;
	}

protected:
	void StartElement(const XML_Char *name,
			  const XML_Char **attrs) override {
		text.clear();

		const auto [ns, local] = SplitExpandedName(name, NS_SEPARATOR);

		if (state == State::NONE) {
			if (ns != DIDL_LITE_NAMESPACE)
				return;

			if (local == "container") {
				state = State::CONTAINER;
				container = {};
				container.id = GetAttributeOr(attrs, "id");
				depth = 0;
			} else if (local == "item") {
				state = State::ITEM;
				item = {};
				item.id = GetAttributeOr(attrs, "id");
				have_res = false;
				depth = 0;
			}

			return;
		}

		++depth;

		if (state == State::ITEM && depth == 1 && !have_res &&
		    ns == DIDL_LITE_NAMESPACE && local == "res") {
			have_res = true;

			item.mime_type = ParseProtocolInfoMimeType(GetAttributeOr(attrs, "protocolInfo"));

			if (const char *size = GetAttribute(attrs, "size"))
				item.size = ParseNumber<uint64_t>(size);

			if (const char *duration = GetAttribute(attrs, "duration"))
				item.duration = duration;
		}
	}

	void EndElement(const XML_Char *name) override {
		if (state == State::NONE)
			return;

		const auto [ns, local] = SplitExpandedName(name, NS_SEPARATOR);

		if (depth > 0) {
			if (depth == 1)
				ChildElement(ns, local);
			--depth;
			return;
		}

		if (state == State::CONTAINER)
			containers.emplace_back(std::move(container));
		else if (!item.resource_url.empty() &&
			 IsSupportedMimeType(item.mime_type))
			items.emplace_back(std::move(item));

		state = State::NONE;
	}

	void CharacterData(const XML_Char *s, int len) override {
		text.append(s, len);
	}

private:
	static const char *GetAttributeOr(const XML_Char **attrs,
					  const char *name) noexcept {
		const char *value = GetAttribute(attrs, name);
		return value != nullptr ? value : "";
	}

	void ChildElement(std::string_view ns, std::string_view local) {
		const std::string_view value = Strip(std::string_view{text});

		if (ns == DC_NAMESPACE && local == "title") {
			if (state == State::CONTAINER)
				container.title = value;
			else
				item.title = value;
		} else if (ns == UPNP_METADATA_NAMESPACE && local == "class") {
			if (state == State::CONTAINER)
				container.upnp_class = value;
		} else if (state == State::ITEM && ns == DIDL_LITE_NAMESPACE &&
			   local == "res" && item.resource_url.empty())
			item.resource_url = value;
	}
};

std::vector<CatalogEntry>
ParseDidlLite(std::string_view didl)
{
	DidlLiteParser parser;
	parser.ParseDocument(didl);
	return parser.Finish();
}

/**
 * An XML parser for the SOAP envelope of a Browse response.  The
 * output arguments are not namespace-qualified, so they are matched
 * by their local name.
 */
class BrowseResponseParser final : public CommonExpatParser {
	BrowseResponse &response;

	bool fault = false;

	std::string fault_string;

	std::string text;

public:
	explicit BrowseResponseParser(BrowseResponse &_response) noexcept
		:CommonExpatParser(ExpatNamespaceSeparator{NS_SEPARATOR}),
		 response(_response) {}

	void Check() const {
		if (fault)
			throw SoapFault(fault_string.empty()
					? std::string{"SOAP fault"}
					: "SOAP fault: " + fault_string);
	}

protected:
	void StartElement(const XML_Char *name, const XML_Char **) override {
		text.clear();

		const auto [ns, local] = SplitExpandedName(name, NS_SEPARATOR);
		if (local == "Fault")
			fault = true;
	}

	void EndElement(const XML_Char *name) override {
		const auto [ns, local] = SplitExpandedName(name, NS_SEPARATOR);

		if (fault) {
			if (local == "faultstring" ||
			    local == "errorDescription")
				fault_string = Strip(std::string_view{text});
		} else if (local == "Result")
			response.result = std::move(text);
		else if (local == "NumberReturned")
			response.number_returned = ParseNumber<unsigned>(text);
		else if (local == "TotalMatches")
			response.total_matches = ParseNumber<unsigned>(text);

		text.clear();
	}

	void CharacterData(const XML_Char *s, int len) override {
		text.append(s, len);
	}
};

BrowseResponse
ParseBrowseResponse(std::string_view soap)
{
	BrowseResponse response;

	BrowseResponseParser parser(response);
	parser.ParseDocument(soap);
	parser.Check();

	return response;
}
