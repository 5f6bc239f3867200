/*
 * Directive parser tests - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <winpipe/compile/directive_parser.hpp>
#include <winpipe/util/error.hpp>

using namespace winpipe;
using namespace winpipe::compile;

namespace {

ParsedDirective parse(const std::string& command, std::vector<std::string> rest) {
    ArgCursor c(std::move(rest));
    return parse_directive(command, c);
}

WindowActionDirective window(const ParsedDirective& p) {
    return std::get<WindowActionDirective>(p.directive);
}

std::string error_of(const std::string& command, std::vector<std::string> rest) {
    try {
        parse(command, std::move(rest));
    } catch (const ArgumentError& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST(SearchDirective, DefaultAttributeFlags) {
    auto p = parse("search", {"firefox"});
    auto s = std::get<SearchDirective>(p.directive);
    EXPECT_TRUE(s.match_class && s.match_classname && s.match_role && s.match_name);
    EXPECT_FALSE(s.match_pid);
    EXPECT_EQ(s.term, "firefox");
    EXPECT_FALSE(p.next_command);
    EXPECT_TRUE(is_query(p.directive));
}

TEST(SearchDirective, ExplicitFlags) {
    auto p = parse("search", {"--pid", "42", "--class", "--limit", "3", "--all", "term"});
    auto s = std::get<SearchDirective>(p.directive);
    EXPECT_TRUE(s.match_pid);
    EXPECT_EQ(s.pid, 42);
    EXPECT_TRUE(s.match_class);
    EXPECT_FALSE(s.match_name);
    EXPECT_EQ(s.limit, 3u);
    EXPECT_TRUE(s.match_all);
    EXPECT_EQ(s.term, "term");
}

TEST(SearchDirective, PushbackAfterTerm) {
    auto p = parse("search", {"foo", "activatewindow"});
    ASSERT_TRUE(p.next_command);
    EXPECT_EQ(*p.next_command, "activatewindow");
}

TEST(SearchDirective, UnexpectedFlag) {
    EXPECT_EQ(error_of("search", {"--bogus", "x"}), "unexpected argument '--bogus'");
    EXPECT_EQ(error_of("search", {"--pid", "many"}), "invalid number 'many'");
}

TEST(StackDirective, SaveAndLoad) {
    auto save = parse("savewindowstack", {"work"});
    EXPECT_FALSE(is_query(save.directive));
    EXPECT_EQ(std::get<StackDirective>(save.directive).name, "work");
    auto load = parse("loadwindowstack", {"work", "windowraise"});
    EXPECT_TRUE(is_query(load.directive));
    EXPECT_EQ(*load.next_command, "windowraise");
    EXPECT_EQ(error_of("savewindowstack", {}), "missing argument 'name'");
}

TEST(WindowAction, DefaultTargetIsFirstStackEntry) {
    auto d = window(parse("windowactivate", {}));
    EXPECT_EQ(d.target, WindowRef{StackIndex{1}});
    EXPECT_EQ(d.action, WindowAction::WindowActivate);
}

TEST(WindowAction, ExplicitTargets) {
    EXPECT_EQ(window(parse("windowraise", {"%2"})).target, WindowRef{StackIndex{2}});
    EXPECT_EQ(window(parse("windowraise", {"%@"})).target, WindowRef{AllStack{}});
    EXPECT_EQ(window(parse("windowraise", {"12345"})).target, WindowRef{ExplicitId{"12345"}});
}

TEST(WindowAction, AliasKeepsTypedName) {
    auto d = window(parse("activatewindow", {}));
    EXPECT_EQ(d.action, WindowAction::WindowActivate);
    EXPECT_EQ(d.name, "activatewindow");
}

TEST(WindowAction, NonReferenceValueIsNextCommand) {
    auto p = parse("windowminimize", {"getwindowname"});
    EXPECT_EQ(window(p).target, WindowRef{StackIndex{1}});
    ASSERT_TRUE(p.next_command);
    EXPECT_EQ(*p.next_command, "getwindowname");
}

TEST(WindowAction, MalformedReference) {
    EXPECT_EQ(error_of("windowactivate", {"%abc"}), "invalid window reference '%abc'");
}

TEST(WindowState, ChangesInOrder) {
    auto d = window(parse("windowstate", {"--add", "maximized", "--toggle", "MINIMIZED"}));
    ASSERT_EQ(d.state.size(), 2u);
    EXPECT_EQ(d.state[0].op, StateChange::Op::Add);
    EXPECT_EQ(d.state[0].property, "maximized");
    EXPECT_EQ(d.state[1].op, StateChange::Op::Toggle);
    EXPECT_EQ(d.state[1].property, "minimized");
}

TEST(WindowState, UnsupportedProperty) {
    EXPECT_EQ(error_of("windowstate", {"--add", "sticky"}), "unsupported property 'sticky'");
    EXPECT_EQ(error_of("windowraise", {"--add", "above"}), "unexpected argument '--add'");
}

TEST(WindowMove, PercentOnOneAxis) {
    auto d = window(parse("windowmove", {"x", "50%"}));
    EXPECT_EQ(d.x.mode, Axis::Mode::Unset);
    EXPECT_EQ(d.y.mode, Axis::Mode::Percent);
    EXPECT_EQ(d.y.value, 50);
}

TEST(WindowMove, AbsoluteAxes) {
    auto d = window(parse("windowmove", {"100", "200"}));
    EXPECT_EQ(d.target, WindowRef{StackIndex{1}});
    EXPECT_EQ(d.x.mode, Axis::Mode::Absolute);
    EXPECT_EQ(d.x.value, 100);
    EXPECT_EQ(d.y.mode, Axis::Mode::Absolute);
    EXPECT_EQ(d.y.value, 200);
}

TEST(WindowMove, WindowIdBeforeAxes) {
    auto d = window(parse("windowmove", {"--relative", "12345", "-10", "20"}));
    EXPECT_TRUE(d.relative);
    EXPECT_EQ(d.target, WindowRef{ExplicitId{"12345"}});
    EXPECT_EQ(d.x.value, -10);
    EXPECT_EQ(d.y.value, 20);
}

TEST(WindowMove, PushbackAfterAxes) {
    auto p = parse("windowmove", {"%1", "10", "20", "windowraise"});
    EXPECT_EQ(window(p).target, WindowRef{StackIndex{1}});
    EXPECT_EQ(*p.next_command, "windowraise");
}

TEST(WindowMove, Errors) {
    EXPECT_EQ(error_of("windowmove", {"abc", "5"}), "invalid number 'abc'");
    EXPECT_EQ(error_of("windowmove", {}), "missing argument 'x'");
    EXPECT_EQ(error_of("windowsize", {"10"}), "missing argument 'y'");
}

TEST(SetDesktopForWindow, TargetAndDesktop) {
    auto d = window(parse("set_desktop_for_window", {"2"}));
    EXPECT_EQ(d.target, WindowRef{StackIndex{1}});
    EXPECT_EQ(*d.desktop, 2);
    d = window(parse("set_desktop_for_window", {"12345", "3"}));
    EXPECT_EQ(d.target, WindowRef{ExplicitId{"12345"}});
    EXPECT_EQ(*d.desktop, 3);
    EXPECT_EQ(error_of("set_desktop_for_window", {"%2"}), "missing argument 'desktop_id'");
}

TEST(GlobalAction, Arguments) {
    auto p = parse("set_num_desktops", {"4", "get_num_desktops"});
    auto g = std::get<GlobalActionDirective>(p.directive);
    EXPECT_EQ(g.action, GlobalAction::SetNumDesktops);
    EXPECT_EQ(*g.n, 4);
    EXPECT_EQ(*p.next_command, "get_num_desktops");
    EXPECT_EQ(error_of("set_desktop", {}), "missing argument 'desktop_id'");
    EXPECT_EQ(error_of("set_num_desktops", {}), "missing argument 'num'");
    EXPECT_FALSE(std::get<GlobalActionDirective>(parse("get_desktop", {}).directive).n);
}

TEST(Commands, UnknownCommand) {
    EXPECT_EQ(error_of("frobnicate", {}), "Unknown command: frobnicate");
}
