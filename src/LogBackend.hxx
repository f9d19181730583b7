// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#ifndef NMC_LOG_BACKEND_HXX
#define NMC_LOG_BACKEND_HXX

#include "LogLevel.hxx"

void
SetLogThreshold(LogLevel _threshold) noexcept;

void
EnableLogTimestamp() noexcept;

#endif
