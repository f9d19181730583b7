// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "CompatibilityPolicy.hxx"
#include "MediaFile.hxx"
#include "util/ASCII.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>

ScoringContext
ScoringContext::Make(std::span<const MediaFile> files) noexcept
{
	std::size_t total = 0, n = 0;
	for (const auto &i : files) {
		if (i.file_type != FileType::VIDEO)
			continue;

		total += i.path.length();
		++n;
	}

	ScoringContext context;
	if (n > 0)
		context.mean_path_length = double(total) / double(n);
	return context;
}

[[gnu::pure]]
static unsigned
CountSpecialCharacters(std::string_view s) noexcept
{
	return std::count_if(s.begin(), s.end(), [](char ch){
		switch (ch) {
		case '\'':
		case '(':
		case ')':
		case '[':
		case ']':
		case '&':
		case '%':
			return true;

		default:
			return false;
		}
	});
}

[[gnu::pure]]
static bool
IsPureASCII(std::string_view s) noexcept
{
	return std::all_of(s.begin(), s.end(), [](char ch){
		return IsASCII(ch);
	});
}

int
DefaultCompatibilityPolicy::Score(const MediaFile &file,
				  const ScoringContext &context) const noexcept
{
	const std::string_view path = file.path, name = file.name;
	int score = 0;

	if (path.find("DLNA-11-0") != path.npos)
		score += 3;
	else if (path.find("DLNA-0-0") != path.npos)
		score += 2;
	else if (path.find("DLNA-8-0") != path.npos)
		score += 1;

	if (StringEndsWithCaseASCII(name, ".mp4"))
		score += 3;
	else if (StringEndsWithCaseASCII(name, ".mkv"))
		score += 2;
	else if (StringEndsWithCaseASCII(name, ".avi"))
		score += 1;

	if (!name.starts_with("._"))
		score += 2;

	if (double(path.length()) < context.mean_path_length)
		score += 1;

	const unsigned n_special = CountSpecialCharacters(name);
	if (n_special <= 2)
		score += 1;
	else if (n_special > 5)
		score -= 1;

	if (IsPureASCII(name))
		score += 1;

	return score;
}

std::vector<const MediaFile *>
SelectCompatible(std::span<const MediaFile> files,
		 const CompatibilityPolicy &policy,
		 int threshold, std::size_t limit) noexcept
{
	const auto context = ScoringContext::Make(files);

	struct Candidate {
		const MediaFile *file;
		int score;
	};

	std::vector<Candidate> candidates;
	for (const auto &i : files) {
		if (i.file_type != FileType::VIDEO)
			continue;

		const int score = policy.Score(i, context);
		if (score >= threshold)
			candidates.push_back({&i, score});
	}

	std::stable_sort(candidates.begin(), candidates.end(),
			 [](const Candidate &a, const Candidate &b){
				 return a.score > b.score;
			 });

	if (candidates.size() > limit)
		candidates.resize(limit);

	std::vector<const MediaFile *> result;
	result.reserve(candidates.size());
	for (const auto &i : candidates)
		result.push_back(i.file);
	return result;
}
