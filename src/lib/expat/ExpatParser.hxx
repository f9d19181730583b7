// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_EXPAT_PARSER_HXX
#define NMC_EXPAT_PARSER_HXX

#include <expat.h>

#include <stdexcept>
#include <string_view>
#include <utility>

class ExpatError final : public std::runtime_error {
public:
	explicit ExpatError(XML_Error code)
		:std::runtime_error(XML_ErrorString(code)) {}

	explicit ExpatError(XML_Parser parser)
		:ExpatError(XML_GetErrorCode(parser)) {}
};

/**
 * Passed to the #ExpatParser constructor for namespace processing.
 * Element and attribute names are reported as "URI<separator>local".
 */
struct ExpatNamespaceSeparator {
	char separator;
};

class ExpatParser final {
	const XML_Parser parser;

public:
	ExpatParser(ExpatNamespaceSeparator ns, void *userData)
		:parser(XML_ParserCreateNS(nullptr, ns.separator)) {
		XML_SetUserData(parser, userData);
	}

	~ExpatParser() noexcept {
		XML_ParserFree(parser);
	}

	ExpatParser(const ExpatParser &) = delete;
	ExpatParser &operator=(const ExpatParser &) = delete;

	void SetElementHandler(XML_StartElementHandler start,
			       XML_EndElementHandler end) noexcept {
		XML_SetElementHandler(parser, start, end);
	}

	void SetCharacterDataHandler(XML_CharacterDataHandler charhndl) noexcept {
		XML_SetCharacterDataHandler(parser, charhndl);
	}

	/**
	 * Parse a complete document.
	 *
	 * Throws #ExpatError on syntax error.
	 */
	void Parse(std::string_view src);

	[[gnu::pure]]
	static const char *GetAttribute(const XML_Char **atts,
					const char *name) noexcept;
};

/**
 * A specialization of #ExpatParser that provides the most common
 * callbacks as virtual methods.
 */
class CommonExpatParser {
	ExpatParser parser;

public:
	explicit CommonExpatParser(ExpatNamespaceSeparator ns)
		:parser(ns, this) {
		parser.SetElementHandler(StartElement, EndElement);
		parser.SetCharacterDataHandler(CharacterData);
	}

	virtual ~CommonExpatParser() noexcept = default;

	/**
	 * Parse a whole document in one call.
	 */
	void ParseDocument(std::string_view src) {
		parser.Parse(src);
	}

	[[gnu::pure]]
	static const char *GetAttribute(const XML_Char **atts,
					const char *name) noexcept {
		return ExpatParser::GetAttribute(atts, name);
	}

protected:
	virtual void StartElement(const XML_Char *name,
				  const XML_Char **attrs) = 0;
	virtual void EndElement(const XML_Char *name) = 0;
	virtual void CharacterData(const XML_Char *s, int len) = 0;

private:
	static void XMLCALL StartElement(void *user_data, const XML_Char *name,
					 const XML_Char **atts) {
		auto &p = *(CommonExpatParser *)user_data;
		p.StartElement(name, atts);
	}

	static void XMLCALL EndElement(void *user_data, const XML_Char *name) {
		auto &p = *(CommonExpatParser *)user_data;
		p.EndElement(name);
	}

	static void XMLCALL CharacterData(void *user_data,
					  const XML_Char *s, int len) {
		auto &p = *(CommonExpatParser *)user_data;
		p.CharacterData(s, len);
	}
};

/**
 * Split a name reported by a namespace-aware parser into namespace
 * URI and local name.  Names without namespace have an empty URI.
 */
[[gnu::pure]]
std::pair<std::string_view, std::string_view>
SplitExpandedName(std::string_view name, char separator) noexcept;

#endif
