// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "FakeHttpClient.hxx"
#include "upnp/Session.hxx"
#include "upnp/CatalogWalker.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

static MediaServer
MakeServer(const char *name, const char *control_url)
{
	MediaServer server;
	server.name = name;
	server.udn = std::string{"uuid:"} + name;
	server.base_url = "http://nas/desc.xml";
	server.control_url = control_url;
	return server;
}

static std::vector<MediaServer>
MakeServers()
{
	return {
		MakeServer("Synology DS220", "http://nas/ctl"),
		MakeServer("FRITZ!Box 7590 Media", "http://fritz.box/ctl"),
	};
}

TEST(UpnpSession, NotConnected)
{
	FakeHttpClient http;
	UpnpSession session(MakeServers());

	EXPECT_FALSE(session.IsConnected());
	EXPECT_FALSE(session.GetServerInfo());
	EXPECT_THROW(session.GetConnected(), std::logic_error);
	EXPECT_THROW(session.Browse(http, "0"), std::logic_error);
	EXPECT_THROW(session.Walk(http, {}), std::logic_error);

	/* nothing was sent */
	EXPECT_TRUE(http.requested_urls.empty());
}

TEST(UpnpSession, Connect)
{
	UpnpSession session(MakeServers());

	EXPECT_FALSE(session.Connect("Plex"));
	EXPECT_FALSE(session.IsConnected());

	EXPECT_TRUE(session.Connect("fritz!box"));
	const auto info = session.GetServerInfo();
	ASSERT_TRUE(info);
	EXPECT_EQ(info->name, "FRITZ!Box 7590 Media");
	EXPECT_EQ(info->udn, "uuid:FRITZ!Box 7590 Media");
	EXPECT_EQ(info->base_url, "http://nas/desc.xml");
	EXPECT_EQ(info->control_url, "http://fritz.box/ctl");
	EXPECT_EQ(info->type, "UPnP/DLNA Media Server");

	/* empty name: the first server */
	EXPECT_TRUE(session.Connect(""));
	EXPECT_EQ(session.GetConnected().name, "Synology DS220");
}

TEST(UpnpSession, ConnectWithoutServers)
{
	UpnpSession session;
	EXPECT_FALSE(session.Connect(""));
	EXPECT_FALSE(session.Connect("fritz"));
}

TEST(UpnpSession, Browse)
{
	FakeHttpClient http;
	UpnpSession session(MakeServers());
	ASSERT_TRUE(session.Connect("synology"));

	/* the fake client refuses the connection */
	EXPECT_TRUE(session.Browse(http, "0").empty());
	ASSERT_EQ(http.requested_urls.size(), 1u);
	EXPECT_EQ(http.requested_urls.front(), "http://nas/ctl");
}

TEST(UpnpSession, PreferredServer)
{
	const auto servers = MakeServers();
	const auto *preferred = FindPreferredServer(servers);
	ASSERT_NE(preferred, nullptr);
	EXPECT_EQ(preferred->name, "FRITZ!Box 7590 Media");

	const std::vector<MediaServer> others{
		MakeServer("MiniDLNA", "http://a/"),
		MakeServer("AVM Repeater", "http://b/"),
	};
	EXPECT_EQ(FindPreferredServer(others)->name, "AVM Repeater");

	const std::vector<MediaServer> plain{
		MakeServer("MiniDLNA", "http://a/"),
		MakeServer("Plex", "http://b/"),
	};
	EXPECT_EQ(FindPreferredServer(plain)->name, "MiniDLNA");

	std::vector<MediaServer> renamed{
		MakeServer("MiniDLNA", "http://a/"),
		MakeServer("Living Room", "http://b/"),
	};
	renamed[1].manufacturer = "AVM Berlin";
	EXPECT_EQ(FindPreferredServer(renamed)->name, "Living Room");

	EXPECT_EQ(FindPreferredServer({}), nullptr);
}
