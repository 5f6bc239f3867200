/*
 * Argument cursor tests - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <winpipe/cli/args.hpp>
#include <winpipe/util/error.hpp>

using namespace winpipe;

TEST(ArgCursor, ShortClusterAndLongWithValue) {
    ArgCursor c({"-dn", "--name=foo", "--shortcut", "Meta+K", "search"});
    auto a = c.next(); ASSERT_TRUE(a); EXPECT_TRUE(a->is_short('d'));
    a = c.next(); ASSERT_TRUE(a); EXPECT_TRUE(a->is_short('n'));
    a = c.next(); ASSERT_TRUE(a); EXPECT_TRUE(a->is_long("name"));
    EXPECT_EQ(c.value(), "foo");
    a = c.next(); ASSERT_TRUE(a); EXPECT_TRUE(a->is_long("shortcut"));
    EXPECT_EQ(c.value(), "Meta+K");
    a = c.next(); ASSERT_TRUE(a);
    EXPECT_EQ(a->kind, ArgKind::Value);
    EXPECT_EQ(a->text, "search");
    EXPECT_FALSE(c.next());
    EXPECT_TRUE(c.exhausted());
}

TEST(ArgCursor, NegativeNumbersAreValues) {
    ArgCursor c({"-50", "-x"});
    auto a = c.next(); ASSERT_TRUE(a);
    EXPECT_EQ(a->kind, ArgKind::Value);
    EXPECT_EQ(a->text, "-50");
    a = c.next(); ASSERT_TRUE(a);
    EXPECT_TRUE(a->is_short('x'));
}

TEST(ArgCursor, DoubleDashEndsOptions) {
    ArgCursor c({"--", "--class"});
    auto a = c.next(); ASSERT_TRUE(a);
    EXPECT_EQ(a->kind, ArgKind::Value);
    EXPECT_EQ(a->text, "--class");
}

TEST(ArgCursor, UnconsumedInlineValueIsAnError) {
    ArgCursor c({"--debug=yes"});
    auto a = c.next(); ASSERT_TRUE(a);
    EXPECT_THROW(c.next(), ArgumentError);
}

TEST(ArgCursor, MissingOptionValue) {
    ArgCursor c({"--remove"});
    c.next();
    try {
        c.value();
        FAIL() << "expected ArgumentError";
    } catch (const ArgumentError& e) {
        EXPECT_STREQ(e.what(), "missing argument for option '--remove'");
    }
}

TEST(ArgCursor, UnexpectedArgumentMessage) {
    try {
        throw_unexpected(Arg{ArgKind::Long, "bogus"});
    } catch (const ArgumentError& e) {
        EXPECT_STREQ(e.what(), "unexpected argument '--bogus'");
    }
}

TEST(ParseInt, AcceptsSignsRejectsJunk) {
    EXPECT_EQ(parse_int("42"), 42);
    EXPECT_EQ(parse_int("-7"), -7);
    EXPECT_EQ(parse_int("+3"), 3);
    EXPECT_THROW(parse_int(""), ArgumentError);
    EXPECT_THROW(parse_int("12a"), ArgumentError);
    EXPECT_THROW(parse_uint("-1"), ArgumentError);
    try {
        parse_int("abc");
    } catch (const ArgumentError& e) {
        EXPECT_STREQ(e.what(), "invalid number 'abc'");
    }
}

TEST(ErrorContext, OutermostFirst) {
    ArgumentError e("invalid number 'abc'");
    e.add_context("in command 'windowmove'");
    EXPECT_EQ(std::string(e.what()), "in command 'windowmove'\n\nCaused by:\n    invalid number 'abc'");
    e.add_context("failed to compile");
    EXPECT_EQ(e.context().size(), 2u);
    EXPECT_EQ(e.context().front(), "failed to compile");
    EXPECT_EQ(e.message(), "invalid number 'abc'");
}
