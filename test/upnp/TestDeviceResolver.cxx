// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "FakeHttpClient.hxx"
#include "upnp/DeviceResolver.hxx"

#include <gtest/gtest.h>

#include <string>

static std::string
MakeDescription(const char *device_type, const char *name,
		const char *control_url)
{
	std::string s = "<root xmlns=\"urn:schemas-upnp-org:device-1-0\"><device><deviceType>";
	s += device_type;
	s += "</deviceType><friendlyName>";
	s += name;
	s += "</friendlyName><UDN>uuid:";
	s += name;
	s += "</UDN><serviceList>";
	if (control_url != nullptr) {
		s += "<service><serviceType>urn:schemas-upnp-org:service:ContentDirectory:1</serviceType><controlURL>";
		s += control_url;
		s += "</controlURL></service>";
	}
	s += "</serviceList></device></root>";
	return s;
}

static constexpr auto MEDIA_SERVER = "urn:schemas-upnp-org:device:MediaServer:1";

static DiscoveredDevice
MakeDiscovered(std::string location)
{
	return {std::move(location), "", MEDIA_SERVER_DEVICE_TYPE, ""};
}

TEST(DeviceResolver, RelativeControlURL)
{
	FakeHttpClient http;
	http.AddGet("http://192.168.178.1:49000/MediaServerDevDesc.xml", 200,
		    MakeDescription(MEDIA_SERVER, "FRITZ!Box",
				    "/upnp/control/content_directory"));

	const auto discovered =
		MakeDiscovered("http://192.168.178.1:49000/MediaServerDevDesc.xml");
	const auto server = ResolveDevice(discovered, http);
	ASSERT_TRUE(server);
	EXPECT_EQ(server->name, "FRITZ!Box");
	EXPECT_EQ(server->udn, "uuid:FRITZ!Box");
	EXPECT_EQ(server->base_url, discovered.location);
	EXPECT_EQ(server->control_url,
		  "http://192.168.178.1:49000/upnp/control/content_directory");
	EXPECT_EQ(server->device, discovered);
}

TEST(DeviceResolver, AbsoluteControlURL)
{
	FakeHttpClient http;
	http.AddGet("http://nas:8200/rootDesc.xml", 200,
		    MakeDescription(MEDIA_SERVER, "NAS",
				    "http://nas:8201/ctl/ContentDir"));

	const auto server = ResolveDevice(MakeDiscovered("http://nas:8200/rootDesc.xml"),
					  http);
	ASSERT_TRUE(server);
	EXPECT_EQ(server->control_url, "http://nas:8201/ctl/ContentDir");
}

TEST(DeviceResolver, NetworkPathControlURL)
{
	FakeHttpClient http;
	http.AddGet("http://nas:8200/dev/rootDesc.xml", 200,
		    MakeDescription(MEDIA_SERVER, "NAS", "//nas:8201/ctl"));

	const auto server = ResolveDevice(MakeDiscovered("http://nas:8200/dev/rootDesc.xml"),
					  http);
	ASSERT_TRUE(server);
	EXPECT_EQ(server->control_url, "http://nas:8201/ctl");
}

TEST(DeviceResolver, Rejected)
{
	FakeHttpClient http;
	http.AddGet("http://a/", 200,
		    MakeDescription(MEDIA_SERVER, "NoCDS", nullptr));
	http.AddGet("http://b/", 200,
		    MakeDescription("urn:schemas-upnp-org:device:MediaRenderer:1",
				    "TV", "/ctl"));
	http.AddGet("http://c/", 404, "Not Found");
	http.AddGet("http://d/", 200, "<html>");

	EXPECT_FALSE(ResolveDevice(MakeDiscovered("http://a/"), http));
	EXPECT_FALSE(ResolveDevice(MakeDiscovered("http://b/"), http));
	EXPECT_FALSE(ResolveDevice(MakeDiscovered("http://c/"), http));
	EXPECT_FALSE(ResolveDevice(MakeDiscovered("http://d/"), http));
	EXPECT_FALSE(ResolveDevice(MakeDiscovered("http://unreachable/"), http));
	EXPECT_FALSE(ResolveDevice(MakeDiscovered(""), http));
}

TEST(DeviceResolver, PartialFailure)
{
	FakeHttpClient http;
	for (unsigned i = 0; i < 8; ++i) {
		const auto n = std::to_string(i);
		/* every third device is broken */
		if (i % 3 == 1)
			http.AddGet("http://dev" + n + "/", 500, "");
		else
			http.AddGet("http://dev" + n + "/", 200,
				    MakeDescription(MEDIA_SERVER,
						    ("Server" + n).c_str(),
						    "/ctl"));
	}

	std::vector<DiscoveredDevice> devices;
	for (unsigned i = 0; i < 8; ++i)
		devices.emplace_back(MakeDiscovered("http://dev" + std::to_string(i) + "/"));

	for (unsigned n_threads : {1u, 4u}) {
		const auto servers = ResolveDevices(devices, http, n_threads);

		/* order matches discovery order */
		ASSERT_EQ(servers.size(), 5u);
		EXPECT_EQ(servers[0].name, "Server0");
		EXPECT_EQ(servers[1].name, "Server2");
		EXPECT_EQ(servers[2].name, "Server3");
		EXPECT_EQ(servers[3].name, "Server5");
		EXPECT_EQ(servers[4].name, "Server6");
	}
}
