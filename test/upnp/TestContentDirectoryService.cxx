// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "FakeHttpClient.hxx"
#include "upnp/ContentDirectoryService.hxx"
#include "upnp/MediaServer.hxx"
#include "upnp/Action.hxx"

#include <gtest/gtest.h>

static constexpr auto control_url =
	"http://192.168.178.1:49000/upnp/control/content_directory";

static MediaServer
MakeServer()
{
	MediaServer server;
	server.name = "FRITZ!Box 7590 Media";
	server.control_url = control_url;
	return server;
}

static std::string
MakeBrowseResponse(std::string_view escaped_didl,
		   unsigned number_returned, unsigned total_matches)
{
	std::string s = R"(<?xml version="1.0"?>
<s:Envelope xmlns:s="http://schemas.xmlsoap.org/soap/envelope/"><s:Body>
<u:BrowseResponse xmlns:u="urn:schemas-upnp-org:service:ContentDirectory:1">
<Result>)";
	s.append(escaped_didl);
	s.append("</Result><NumberReturned>");
	s.append(std::to_string(number_returned));
	s.append("</NumberReturned><TotalMatches>");
	s.append(std::to_string(total_matches));
	s.append("</TotalMatches></u:BrowseResponse></s:Body></s:Envelope>");
	return s;
}

static constexpr auto escaped_didl =
	"&lt;DIDL-Lite xmlns=&quot;urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/&quot;"
	" xmlns:dc=&quot;http://purl.org/dc/elements/1.1/&quot;&gt;"
	"&lt;container id=&quot;1&quot;&gt;&lt;dc:title&gt;Videos&lt;/dc:title&gt;&lt;/container&gt;"
	"&lt;item id=&quot;2&quot;&gt;&lt;dc:title&gt;A.mp4&lt;/dc:title&gt;"
	"&lt;res protocolInfo=&quot;http-get:*:video/mp4:*&quot;&gt;http://nas/a.mp4&lt;/res&gt;"
	"&lt;/item&gt;"
	"&lt;/DIDL-Lite&gt;";

TEST(ContentDirectoryService, Browse)
{
	FakeHttpClient http;
	http.AddBrowse("0", 200, MakeBrowseResponse(escaped_didl, 2, 2));

	const auto server = MakeServer();
	ContentDirectoryService service(http, server);
	EXPECT_EQ(service.GetControlURL(), control_url);

	const auto entries = service.Browse("0");
	ASSERT_EQ(entries.size(), 2u);
	EXPECT_EQ(std::get<UPnPContainer>(entries[0]).title, "Videos");
	EXPECT_EQ(std::get<UPnPMediaItem>(entries[1]).resource_url,
		  "http://nas/a.mp4");

	ASSERT_EQ(http.requested_urls.size(), 1u);
	EXPECT_EQ(http.requested_urls.front(), control_url);
	EXPECT_EQ(http.last_headers,
		  MakeSoapHeaders(CONTENT_DIRECTORY_SERVICE_TYPE, "Browse"));
}

TEST(ContentDirectoryService, Truncated)
{
	/* more matches than returned: still yields the first page */
	FakeHttpClient http;
	http.AddBrowse("0", 200, MakeBrowseResponse(escaped_didl, 2, 1500));

	const auto server = MakeServer();
	ContentDirectoryService service(http, server);
	EXPECT_EQ(service.Browse("0").size(), 2u);
}

TEST(ContentDirectoryService, Failures)
{
	FakeHttpClient http;
	http.AddBrowse("500", 500, "Internal Server Error");
	http.AddBrowse("bad", 200, "<s:Envelope");
	http.AddBrowse("fault", 200, R"(<s:Envelope xmlns:s="http://schemas.xmlsoap.org/soap/envelope/">
<s:Body><s:Fault><faultstring>UPnPError</faultstring></s:Fault></s:Body></s:Envelope>)");
	http.AddBrowse("empty", 200, MakeBrowseResponse("", 0, 0));

	const auto server = MakeServer();
	ContentDirectoryService service(http, server);

	/* all failures are absorbed */
	EXPECT_TRUE(service.Browse("500").empty());
	EXPECT_TRUE(service.Browse("bad").empty());
	EXPECT_TRUE(service.Browse("fault").empty());
	EXPECT_TRUE(service.Browse("empty").empty());
	EXPECT_TRUE(service.Browse("unreachable").empty());
}
