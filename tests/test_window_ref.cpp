/*
 * Window reference tests - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <winpipe/compile/window_ref.hpp>
#include <winpipe/util/error.hpp>

using namespace winpipe;
using namespace winpipe::compile;

TEST(WindowRef, StackSyntax) {
    auto r = resolve_window_ref("%2");
    ASSERT_TRUE(r);
    EXPECT_EQ(*r, WindowRef{StackIndex{2}});
    r = resolve_window_ref("%@");
    ASSERT_TRUE(r);
    EXPECT_TRUE(std::holds_alternative<AllStack>(*r));
}

TEST(WindowRef, ExplicitIds) {
    for (const char* id : {"12345", "0x3a0000f", "{6f2c5b8e-1d3a-4c5e-9b7f-0a1b2c3d4e5f}"}) {
        auto r = resolve_window_ref(id);
        ASSERT_TRUE(r) << id;
        EXPECT_EQ(*r, WindowRef{ExplicitId{id}});
    }
}

TEST(WindowRef, NotAReference) {
    EXPECT_FALSE(resolve_window_ref("firefox"));
    EXPECT_FALSE(resolve_window_ref("0x"));
    EXPECT_FALSE(resolve_window_ref("{not-a-uuid}"));
}

TEST(WindowRef, MalformedStackSyntax) {
    EXPECT_THROW(resolve_window_ref("%"), ArgumentError);
    EXPECT_THROW(resolve_window_ref("%abc"), ArgumentError);
    EXPECT_THROW(resolve_window_ref("%0"), ArgumentError);
}

TEST(WindowRef, Ambiguity) {
    EXPECT_TRUE(is_unambiguous_window_ref("%1"));
    EXPECT_TRUE(is_unambiguous_window_ref("0x10"));
    EXPECT_FALSE(is_unambiguous_window_ref("100"));
    EXPECT_TRUE(is_explicit_id("100"));
}

TEST(WindowRef, Describe) {
    EXPECT_EQ(describe(StackIndex{3}), "%3");
    EXPECT_EQ(describe(AllStack{}), "%@");
    EXPECT_EQ(describe(ExplicitId{"0x1"}), "0x1");
}
