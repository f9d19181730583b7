// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "upnp/Directory.hxx"
#include "upnp/Action.hxx"
#include "lib/expat/ExpatParser.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static constexpr auto didl = R"(<DIDL-Lite xmlns="urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/"
 xmlns:dc="http://purl.org/dc/elements/1.1/"
 xmlns:upnp="urn:schemas-upnp-org:metadata-1-0/upnp/">
<item id="v1" parentID="1">
  <dc:title>Holiday.mp4</dc:title>
  <upnp:class>object.item.videoItem</upnp:class>
  <res protocolInfo="http-get:*:video/mp4:DLNA.ORG_PN=AVC_MP4_HP_HD_AAC" size="734003200" duration="0:42:17.000">http://192.168.178.1:49200/AVM/v1.mp4</res>
  <res protocolInfo="http-get:*:image/jpeg:*">http://192.168.178.1:49200/AVM/v1.jpg</res>
</item>
<container id="c1" parentID="0" childCount="3">
  <dc:title>Videos</dc:title>
  <upnp:class>object.container.storageFolder</upnp:class>
</container>
<item id="i1" parentID="1">
  <dc:title>Cover</dc:title>
  <res protocolInfo="http-get:*:image/jpeg:*">http://192.168.178.1:49200/AVM/cover.jpg</res>
</item>
<item id="a1" parentID="1">
  <dc:title>Song.flac</dc:title>
  <res protocolInfo="http-get:*:audio/flac:*" size="abc">http://192.168.178.1:49200/AVM/a1.flac</res>
</item>
<item id="n1" parentID="1">
  <dc:title>No resource</dc:title>
</item>
<container id="c2" parentID="0">
  <dc:title>Music</dc:title>
</container>
</DIDL-Lite>
)";

TEST(Directory, MimeType)
{
	EXPECT_EQ(ParseProtocolInfoMimeType("http-get:*:video/mp4:*"),
		  "video/mp4"sv);
	EXPECT_EQ(ParseProtocolInfoMimeType("http-get:*:audio/mpeg"),
		  "audio/mpeg"sv);
	EXPECT_EQ(ParseProtocolInfoMimeType("http-get:*"), ""sv);
	EXPECT_EQ(ParseProtocolInfoMimeType(""), ""sv);

	EXPECT_TRUE(IsSupportedMimeType("video/x-matroska"));
	EXPECT_TRUE(IsSupportedMimeType("audio/mp4"));
	EXPECT_FALSE(IsSupportedMimeType("image/jpeg"));
	EXPECT_FALSE(IsSupportedMimeType("video/MP4"));
}

TEST(Directory, ParseDidlLite)
{
	const auto entries = ParseDidlLite(didl);

	/* containers first, then items; unsupported and resource-less
	   items are dropped */
	ASSERT_EQ(entries.size(), 4u);

	const auto &c1 = std::get<UPnPContainer>(entries[0]);
	EXPECT_EQ(c1.id, "c1");
	EXPECT_EQ(c1.title, "Videos");
	EXPECT_EQ(c1.upnp_class, "object.container.storageFolder");

	const auto &c2 = std::get<UPnPContainer>(entries[1]);
	EXPECT_EQ(c2.id, "c2");
	EXPECT_TRUE(c2.upnp_class.empty());

	const auto &v1 = std::get<UPnPMediaItem>(entries[2]);
	EXPECT_EQ(v1.id, "v1");
	EXPECT_EQ(v1.title, "Holiday.mp4");
	EXPECT_EQ(v1.mime_type, "video/mp4");
	EXPECT_EQ(v1.resource_url, "http://192.168.178.1:49200/AVM/v1.mp4");
	EXPECT_EQ(v1.size, 734003200u);
	EXPECT_EQ(v1.duration, "0:42:17.000");

	const auto &a1 = std::get<UPnPMediaItem>(entries[3]);
	EXPECT_EQ(a1.mime_type, "audio/flac");
	EXPECT_FALSE(a1.size);
	EXPECT_FALSE(a1.duration);
}

TEST(Directory, ParseDidlLiteEmpty)
{
	EXPECT_TRUE(ParseDidlLite(R"(<DIDL-Lite xmlns="urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/"/>)").empty());
	EXPECT_THROW(ParseDidlLite("<DIDL-Lite>"), ExpatError);
}

TEST(Directory, ParseBrowseResponse)
{
	const auto response = ParseBrowseResponse(R"(<?xml version="1.0"?>
<s:Envelope xmlns:s="http://schemas.xmlsoap.org/soap/envelope/" s:encodingStyle="http://schemas.xmlsoap.org/soap/encoding/">
<s:Body>
<u:BrowseResponse xmlns:u="urn:schemas-upnp-org:service:ContentDirectory:1">
<Result>&lt;DIDL-Lite xmlns=&quot;urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/&quot;/&gt;</Result>
<NumberReturned>0</NumberReturned>
<TotalMatches>12</TotalMatches>
<UpdateID>7</UpdateID>
</u:BrowseResponse>
</s:Body>
</s:Envelope>)");

	EXPECT_EQ(response.result,
		  R"(<DIDL-Lite xmlns="urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/"/>)");
	EXPECT_EQ(response.number_returned, 0u);
	EXPECT_EQ(response.total_matches, 12u);
}

TEST(Directory, SoapFault)
{
	try {
		ParseBrowseResponse(R"(<s:Envelope xmlns:s="http://schemas.xmlsoap.org/soap/envelope/">
<s:Body><s:Fault>
<faultcode>s:Client</faultcode>
<faultstring>UPnPError</faultstring>
<detail><UPnPError xmlns="urn:schemas-upnp-org:control-1-0">
<errorCode>701</errorCode>
<errorDescription>No such object</errorDescription>
</UPnPError></detail>
</s:Fault></s:Body></s:Envelope>)");
		FAIL();
	} catch (const SoapFault &e) {
		EXPECT_STREQ(e.what(), "SOAP fault: No such object");
	}
}

TEST(Action, BrowseRequest)
{
	const auto body = FormatBrowseRequest("a&b");
	EXPECT_NE(body.find("<ObjectID>a&amp;b</ObjectID>"), body.npos);
	EXPECT_NE(body.find("<BrowseFlag>BrowseDirectChildren</BrowseFlag>"),
		  body.npos);
	EXPECT_NE(body.find("<RequestedCount>1000</RequestedCount>"),
		  body.npos);
	EXPECT_NE(body.find("<StartingIndex>0</StartingIndex>"), body.npos);

	const auto headers = MakeSoapHeaders(CONTENT_DIRECTORY_SERVICE_TYPE,
					     "Browse");
	ASSERT_EQ(headers.size(), 2u);
	EXPECT_EQ(headers[0], "Content-Type: text/xml; charset=\"utf-8\"");
	EXPECT_EQ(headers[1],
		  "SOAPAction: \"urn:schemas-upnp-org:service:ContentDirectory:1#Browse\"");
}

TEST(Action, XmlEscape)
{
	EXPECT_EQ(XmlEscape("<a href=\"x\">'&'</a>"),
		  "&lt;a href=&quot;x&quot;&gt;&apos;&amp;&apos;&lt;/a&gt;");
}
