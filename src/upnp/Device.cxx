// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "Device.hxx"
#include "lib/expat/ExpatParser.hxx"
#include "util/StringStrip.hxx"

#include <stdexcept>

static constexpr char NS_SEPARATOR = '|';

/**
 * An XML parser which fills an #UPnPDevice from the device
 * description.
 */
class UPnPDeviceParser final : public CommonExpatParser {
	UPnPDevice &device;

	/**
	 * How many "device" elements are open.  Only values inside
	 * the root device (depth 1) are used.
	 */
	unsigned device_depth = 0;

	bool found_device = false;
	bool in_service = false;

	UPnPService service;

	std::string text;

public:
	explicit UPnPDeviceParser(UPnPDevice &_device) noexcept
		:CommonExpatParser(ExpatNamespaceSeparator{NS_SEPARATOR}),
		 device(_device) {}

	bool FoundDevice() const noexcept {
		return found_device;
	}

protected:
	void StartElement(const XML_Char *name, const XML_Char **) override {
		text.clear();

		const auto local = GetLocalName(name);
		if (local.empty())
			return;

		if (local == "device") {
			++device_depth;
			found_device = true;
		} else if (local == "service" && device_depth == 1) {
			in_service = true;
			service = {};
		}
	}

	void EndElement(const XML_Char *name) override {
		const auto local = GetLocalName(name);
		const std::string_view value = Strip(std::string_view{text});

		if (local == "device") {
			--device_depth;
		} else if (device_depth != 1) {
			/* outside the root device, or inside an embedded
			   device */
		} else if (in_service) {
			if (local == "service") {
				device.services.emplace_back(std::move(service));
				in_service = false;
			} else if (local == "serviceType")
				service.service_type = value;
			else if (local == "controlURL")
				service.control_url = value;
		} else if (local == "deviceType")
			device.device_type = value;
		else if (local == "friendlyName")
			device.friendly_name = value;
		else if (local == "UDN")
			device.udn = value;
		else if (local == "manufacturer")
			device.manufacturer = value;

		text.clear();
	}

	void CharacterData(const XML_Char *s, int len) override {
		text.append(s, len);
	}

private:
	/**
	 * Returns the local name of an element in the UPnP device
	 * namespace (or without namespace); other namespaces yield
	 * an empty string.
	 */
	static std::string_view GetLocalName(const XML_Char *name) noexcept {
		const auto [ns, local] = SplitExpandedName(name, NS_SEPARATOR);
		if (!ns.empty() && ns != UPNP_DEVICE_NAMESPACE)
			return {};
		return local;
	}
};

void
UPnPDevice::Parse(std::string_view description)
{
	UPnPDeviceParser parser(*this);
	parser.ParseDocument(description);

	if (!parser.FoundDevice())
		throw std::runtime_error("No device element in description");

	if (friendly_name.empty())
		friendly_name = "Unknown Device";
}

const UPnPService *
UPnPDevice::FindService(std::string_view type) const noexcept
{
	for (const auto &i : services)
		if (i.service_type.find(type) != std::string::npos)
			return &i;

	return nullptr;
}
