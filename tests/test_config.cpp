/*
 * Configuration tests - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <winpipe/session/config.hpp>
#include <winpipe/session/context.hpp>
#include <cstdlib>
#include <fstream>

using namespace winpipe::session;

namespace {

std::string write_rc(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream(path) << content;
    return path;
}

} // namespace

TEST(Config, DefaultsWhenMissing) {
    Config c = load_config(::testing::TempDir() + "winpipe-no-such-rc");
    EXPECT_FALSE(c.debug);
    EXPECT_EQ(c.host_version, HostVersion::Auto);
    EXPECT_EQ(c.reply_timeout_ms, 5000);
    EXPECT_EQ(c.completion_timeout_ms, 2000);
    EXPECT_FALSE(c.keep_script);
}

TEST(Config, ParsesKeys) {
    auto path = write_rc("winpipe-rc-1",
                         "# comment\n"
                         "\n"
                         "debug=on\n"
                         "host_version = 5\n"
                         "reply_timeout_ms=1500\n"
                         "completion_timeout_ms=250\n"
                         "keep_script=true\n");
    Config c = load_config(path);
    EXPECT_TRUE(c.debug);
    EXPECT_EQ(c.host_version, HostVersion::Kde5);
    EXPECT_EQ(c.reply_timeout_ms, 1500);
    EXPECT_EQ(c.completion_timeout_ms, 250);
    EXPECT_TRUE(c.keep_script);
}

TEST(Config, MalformedValuesKeepDefaults) {
    auto path = write_rc("winpipe-rc-2",
                         "reply_timeout_ms=soon\n"
                         "completion_timeout_ms=-5\n"
                         "host_version=7\n"
                         "debug=yes\n"
                         "no equals sign\n"
                         "color=1\n");
    Config c = load_config(path);
    EXPECT_EQ(c.reply_timeout_ms, 5000);
    EXPECT_EQ(c.completion_timeout_ms, 2000);
    EXPECT_EQ(c.host_version, HostVersion::Auto);
    EXPECT_FALSE(c.debug);
}

TEST(Config, PathFromEnvironment) {
    ::setenv("WINPIPE_CONFIG", "/etc/winpipe.conf", 1);
    EXPECT_EQ(default_config_path(), "/etc/winpipe.conf");
    ::unsetenv("WINPIPE_CONFIG");
    ::setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(default_config_path(), "/home/tester/.winpiperc");
}

TEST(HostVersion, PinnedOrDetected) {
    EXPECT_TRUE(detect_kde5(HostVersion::Kde5));
    EXPECT_FALSE(detect_kde5(HostVersion::Kde6));
    ::setenv("KDE_SESSION_VERSION", "5", 1);
    EXPECT_TRUE(detect_kde5(HostVersion::Auto));
    EXPECT_FALSE(detect_kde5(HostVersion::Kde6));
    ::setenv("KDE_SESSION_VERSION", "6", 1);
    EXPECT_FALSE(detect_kde5(HostVersion::Auto));
    ::unsetenv("KDE_SESSION_VERSION");
    EXPECT_FALSE(detect_kde5(HostVersion::Auto));
}

TEST(SessionContext, BaseBindings) {
    SessionContext ctx;
    ctx.marker = "winpipe-x";
    ctx.dbus_addr = ":1.5";
    auto b = base_bindings(ctx);
    for (const char* key : {"debug", "kde5", "marker", "dbus_addr", "script_name", "shortcut", "cmdline"}) {
        EXPECT_TRUE(b.contains(key)) << key;
    }
    EXPECT_EQ(winpipe::render::to_text(*b.find("marker")), "winpipe-x");
}
