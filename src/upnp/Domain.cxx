// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "Domain.hxx"
#include "util/Domain.hxx"

constexpr Domain ssdp_domain("ssdp");
constexpr Domain upnp_domain("upnp");
constexpr Domain content_directory_domain("content_directory");
constexpr Domain catalog_domain("catalog");
