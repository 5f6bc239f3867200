/*
 * Session manager tests - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <winpipe/session/host_log.hpp>
#include <winpipe/session/session.hpp>
#include <sys/stat.h>
#include <unistd.h>
#include "fake_bus.hpp"

using namespace winpipe;
using namespace winpipe::session;
using winpipe::fakes::FakeChannel;
using winpipe::fakes::FakeHost;

namespace {

SessionOptions options(bool dry_run = false) {
    SessionOptions o;
    o.dry_run = dry_run;
    o.completion_timeout_ms = 1000;
    o.tmp_dir = ::testing::TempDir();
    return o;
}

SessionContext context() {
    SessionContext ctx;
    ctx.cmdline = "winpipe search firefox windowactivate getwindowname";
    return ctx;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) s.replace(pos, from.size(), to);
    return s;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace

TEST(Session, RunDrainsCallbacks) {
    FakeChannel channel;
    FakeHost host(channel);
    host.callbacks = {{"result", "Firefox"}, {"error", "no window %2"}, {"debug", "3 window(s)"}};
    std::ostringstream out, err;
    Session s(host, channel, options(), out, err);
    ArgCursor args({"firefox", "getwindowname"});
    s.execute(context(), args, "search");

    ASSERT_EQ(host.calls.size(), 3u);
    EXPECT_EQ(host.calls[0], "loadScript " + s.last_marker());
    EXPECT_EQ(host.calls[1], "run 7");
    EXPECT_EQ(host.calls[2], "stop 7");
    EXPECT_EQ(out.str(), "Firefox\ndebug: 3 window(s)\n");
    EXPECT_EQ(err.str(), "ERROR: no window %2\n");

    EXPECT_EQ(host.loaded_text, s.last_script());
    EXPECT_EQ(host.marker(), s.last_marker());
    EXPECT_EQ(s.last_marker().rfind("winpipe-", 0), 0u);
    EXPECT_NE(s.last_script().find("callDBus(\":1.42\""), std::string::npos);
    EXPECT_FALSE(file_exists(host.loaded_path));
}

TEST(Session, DryRunMakesNoRemoteCalls) {
    FakeChannel channel;
    FakeHost host(channel);
    std::ostringstream out, err;
    Session dry(host, channel, options(true), out, err);
    ArgCursor dry_args({"firefox", "windowactivate"});
    dry.execute(context(), dry_args, "search");
    EXPECT_TRUE(host.calls.empty());
    EXPECT_EQ(out.str().back(), '\n');
    EXPECT_NE(out.str().find("wp_main();"), std::string::npos);

    std::ostringstream out2, err2;
    Session real(host, channel, options(false), out2, err2);
    ArgCursor real_args({"firefox", "windowactivate"});
    real.execute(context(), real_args, "search");
    EXPECT_FALSE(host.calls.empty());

    std::string a = replace_all(dry.last_script(), dry.last_marker(), "MARKER");
    std::string b = replace_all(real.last_script(), real.last_marker(), "MARKER");
    EXPECT_EQ(a, b);
}

TEST(Session, DryRunStillWritesTheScriptFile) {
    FakeChannel channel;
    FakeHost host(channel);
    std::ostringstream out, err;
    SessionOptions opts = options(true);
    opts.keep_script = true;
    Session s(host, channel, opts, out, err);
    ArgCursor args({"firefox", "windowactivate"});
    s.execute(context(), args, "search");
    EXPECT_TRUE(host.calls.empty());

    std::string path = opts.tmp_dir + "/" + s.last_marker();
    std::ifstream in(path);
    ASSERT_TRUE(in.good()) << path;
    std::stringstream text;
    text << in.rdbuf();
    EXPECT_EQ(text.str(), s.last_script());
    in.close();
    ::unlink(path.c_str());
}

TEST(Session, RemoveIsOneCall) {
    FakeChannel channel;
    FakeHost host(channel);
    std::ostringstream out, err;
    Session s(host, channel, options(), out, err);
    s.remove("foo");
    ASSERT_EQ(host.calls.size(), 1u);
    EXPECT_EQ(host.calls[0], "unloadScript foo");
    EXPECT_TRUE(s.last_script().empty());
    EXPECT_TRUE(out.str().empty());
}

TEST(Session, ShortcutKeepsScriptRunning) {
    FakeChannel channel;
    FakeHost host(channel);
    host.send_done = false;
    std::ostringstream out, err;
    Session s(host, channel, options(), out, err);
    SessionContext ctx = context();
    ctx.shortcut = "Meta+Shift+K";
    ctx.script_name = "tiles";
    ArgCursor args({"windowminimize"});
    s.execute(ctx, args, "getactivewindow");

    ASSERT_EQ(host.calls.size(), 2u);
    EXPECT_EQ(host.calls[0], "loadScript tiles");
    EXPECT_EQ(host.calls[1], "run 7");
    EXPECT_EQ(out.str(), "Shortcut registered: Meta+Shift+K\nScript ID: 7\nScript name: tiles\n");
    EXPECT_NE(host.loaded_text.find("registerShortcut(\"tiles\""), std::string::npos);
}

TEST(Session, MissingCompletionStillDrains) {
    FakeChannel channel;
    FakeHost host(channel);
    host.send_done = false;
    host.callbacks = {{"result", "1"}};
    std::ostringstream out, err;
    SessionOptions o = options();
    o.completion_timeout_ms = 300;
    Session s(host, channel, o, out, err);
    ArgCursor args(std::vector<std::string>{});
    s.execute(context(), args, "get_desktop");
    EXPECT_EQ(out.str(), "1\n");
}

TEST(Session, HostErrorsGetContext) {
    FakeChannel channel;
    FakeHost host(channel);
    host.fail_load = true;
    std::ostringstream out, err;
    Session s(host, channel, options(), out, err);
    ArgCursor args(std::vector<std::string>{});
    try {
        s.execute(context(), args, "getactivewindow");
        FAIL() << "expected IpcError";
    } catch (const IpcError& e) {
        ASSERT_EQ(e.context().size(), 1u);
        EXPECT_EQ(e.context()[0], "failed to run script " + s.last_marker());
    }
}

TEST(Session, CompileErrorsMakeNoRemoteCalls) {
    FakeChannel channel;
    FakeHost host(channel);
    std::ostringstream out, err;
    Session s(host, channel, options(), out, err);
    ArgCursor args({"abc", "5"});
    EXPECT_THROW(s.execute(context(), args, "windowmove"), ArgumentError);
    EXPECT_TRUE(host.calls.empty());
}

TEST(HostLog, JournalQuery) {
    auto cmd = host_log_command("2025-01-02 03:04:05");
    ASSERT_EQ(cmd.size(), 8u);
    EXPECT_EQ(cmd[0], "journalctl");
    EXPECT_EQ(cmd[1], "--since=2025-01-02 03:04:05");
    EXPECT_EQ(cmd[3], "--user-unit=plasma-kwin_wayland.service");
    EXPECT_EQ(cmd[6], "QT_CATEGORY=kwin_scripting");
    EXPECT_EQ(cmd.back(), "--output=cat");
    EXPECT_EQ(journal_timestamp().size(), 19u);
}
