// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "Param.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <exception>

void
ConfigParam::ThrowWithNested() const
{
	if (IsNull())
		std::throw_with_nested(std::runtime_error("Error in command line setting"));

	std::throw_with_nested(FmtRuntimeError("Error on line {}", line));
}
