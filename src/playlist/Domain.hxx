// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#ifndef NMC_PLAYLIST_DOMAIN_HXX
#define NMC_PLAYLIST_DOMAIN_HXX

class Domain;

extern const Domain playlist_domain;

#endif
