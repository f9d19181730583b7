// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project
// Copyright The NAS Media Catalog Project

#include "Data.hxx"
#include "Parser.hxx"

#include <iterator>

void
ConfigData::Clear() noexcept
{
	for (auto &i : params)
		i.clear();
}

template<typename T>
static auto
FindLast(const std::forward_list<T> &list) noexcept
{
	auto i = list.before_begin();
	while (std::next(i) != list.end())
		++i;
	return i;
}

void
ConfigData::AddParam(ConfigOption option,
		     ConfigParam &&param) noexcept
{
	auto &list = GetParamList(option);
	list.emplace_after(FindLast(list), std::move(param));
}

void
ConfigData::SetParam(ConfigOption option,
		     ConfigParam &&param) noexcept
{
	auto &list = GetParamList(option);
	list.clear();
	list.emplace_front(std::move(param));
}

const char *
ConfigData::GetString(ConfigOption option,
		      const char *default_value) const noexcept
{
	const auto *param = GetParam(option);
	if (param == nullptr)
		return default_value;

	return param->value.c_str();
}

unsigned
ConfigData::GetUnsigned(ConfigOption option, unsigned default_value) const
{
	return With(option, [default_value](const char *s){
		return s != nullptr
			? ParseUnsigned(s)
			: default_value;
	});
}

unsigned
ConfigData::GetPositive(ConfigOption option, unsigned default_value) const
{
	return With(option, [default_value](const char *s){
		return s != nullptr
			? ParsePositive(s)
			: default_value;
	});
}

bool
ConfigData::GetBool(ConfigOption option, bool default_value) const
{
	return With(option, [default_value](const char *s){
		return s != nullptr
			? ParseBool(s)
			: default_value;
	});
}
