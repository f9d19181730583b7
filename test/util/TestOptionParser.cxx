// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The NAS Media Catalog Project

#include "util/OptionDef.hxx"
#include "util/OptionParser.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

static constexpr OptionDef test_options[] = {
	{"verbose", 'v', "verbose"},
	{"config", 'c', "FILE", "config file"},
	{"list", "list"},
};

template<std::size_t N>
static OptionParser
MakeParser(const char *(&args)[N]) noexcept
{
	return OptionParser(test_options, int(N), const_cast<char **>(args));
}

TEST(OptionParser, LongAndShort)
{
	const char *args[] = {"nmc", "-v", "--list", "--config", "a.conf", "x"};
	auto parser = MakeParser(args);

	auto o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, 0);
	EXPECT_EQ(o.value, nullptr);

	o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, 2);

	o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_EQ(o.index, 1);
	EXPECT_STREQ(o.value, "a.conf");

	EXPECT_FALSE(parser.Next());

	ASSERT_EQ(parser.GetRemaining().size(), 1u);
	EXPECT_STREQ(parser.GetRemaining().front(), "x");
}

TEST(OptionParser, InlineValue)
{
	const char *args[] = {"nmc", "--config=b.conf", "-c", "c.conf"};
	auto parser = MakeParser(args);

	auto o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_STREQ(o.value, "b.conf");

	o = parser.Next();
	ASSERT_TRUE(o);
	EXPECT_STREQ(o.value, "c.conf");
}

TEST(OptionParser, Errors)
{
	const char *unknown[] = {"nmc", "--foo"};
	auto parser = MakeParser(unknown);
	EXPECT_THROW(parser.Next(), std::runtime_error);

	const char *missing[] = {"nmc", "--config"};
	auto parser2 = MakeParser(missing);
	EXPECT_THROW(parser2.Next(), std::runtime_error);
}
