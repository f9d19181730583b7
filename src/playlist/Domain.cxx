// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "Domain.hxx"
#include "util/Domain.hxx"

constexpr Domain playlist_domain("playlist");
