// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_UPNP_DOMAIN_HXX
#define NMC_UPNP_DOMAIN_HXX

class Domain;

extern const Domain ssdp_domain;
extern const Domain upnp_domain;
extern const Domain content_directory_domain;
extern const Domain catalog_domain;

#endif
