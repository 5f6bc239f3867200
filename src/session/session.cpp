/*
 * winpipe Session Manager Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <winpipe/session/session.hpp>
#include <winpipe/compile/pipeline.hpp>
#include <winpipe/session/host_log.hpp>
#include <winpipe/util/error.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <unistd.h>

namespace winpipe::session {

namespace {

std::string temp_dir(const std::string& configured) {
    if (!configured.empty()) return configured;
    const char* env = std::getenv("TMPDIR");
    if (env && *env) return env;
    return "/tmp";
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

TempScriptFile::TempScriptFile(const std::string& dir, bool keep) : m_keep(keep) {
    std::string tmpl = temp_dir(dir) + "/winpipe-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    m_fd = ::mkstemp(buf.data());
    if (m_fd < 0) throw Error("cannot create temporary script file " + tmpl + ": " + std::strerror(errno));
    m_path = buf.data();
}

TempScriptFile::~TempScriptFile() {
    if (m_fd >= 0) ::close(m_fd);
    if (m_keep) {
        spdlog::info("script kept at {}", m_path);
        return;
    }
    if (::unlink(m_path.c_str()) != 0) spdlog::warn("cannot remove {}: {}", m_path, std::strerror(errno));
}

void TempScriptFile::write(const std::string& content) {
    std::size_t off = 0;
    while (off < content.size()) {
        ssize_t n = ::write(m_fd, content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw Error("cannot write " + m_path + ": " + std::strerror(errno));
        }
        off += static_cast<std::size_t>(n);
    }
    if (::close(m_fd) != 0) {
        m_fd = -1;
        throw Error("cannot close " + m_path + ": " + std::strerror(errno));
    }
    m_fd = -1;
}

std::string TempScriptFile::marker() const {
    auto slash = m_path.find_last_of('/');
    return slash == std::string::npos ? m_path : m_path.substr(slash + 1);
}

Session::Session(ipc::ScriptHost& host, ipc::CallbackChannel& callbacks, SessionOptions opts,
                 std::ostream& out, std::ostream& err)
    : m_host(host), m_callbacks(callbacks), m_opts(std::move(opts)), m_out(out), m_err(err) {}

void Session::remove(const std::string& script_name) {
    try {
        m_host.unload_script(script_name);
    } catch (Error& e) {
        e.add_context("failed to remove script '" + script_name + "'");
        throw;
    }
}

void Session::execute(SessionContext ctx, ArgCursor& args, const std::string& first_command) {
    ctx.dbus_addr = m_callbacks.unique_name();
    TempScriptFile file(m_opts.tmp_dir, m_opts.keep_script);
    ctx.marker = file.marker();

    compile::CompiledScript compiled = compile::compile_script(base_bindings(ctx), args, first_command);
    m_last_script = compiled.text;
    m_last_marker = ctx.marker;

    file.write(compiled.text);
    spdlog::debug("script {}:\n{}", file.path(), compiled.text);

    if (m_opts.dry_run) {
        m_out << trim(compiled.text) << "\n";
        return;
    }

    std::string started = journal_timestamp();
    ipc::MessageLog log;
    ipc::Listener listener(m_callbacks, log, ctx.marker);
    int script_id = 0;
    try {
        script_id = m_host.load_script(file.path(), ctx.script_name.empty() ? ctx.marker : ctx.script_name);
        listener.start();
        m_host.run(script_id);
        if (ctx.shortcut.empty()) {
            m_host.stop(script_id);
            if (!listener.wait_finished(std::chrono::milliseconds(m_opts.completion_timeout_ms))) {
                spdlog::warn("script {} did not report completion within {} ms", ctx.marker, m_opts.completion_timeout_ms);
            }
        }
        listener.stop();
        listener.join();
        listener.rethrow_if_failed();
    } catch (Error& e) {
        e.add_context("failed to run script " + ctx.marker);
        throw;
    }

    if (ctx.debug) {
        std::string host_log = fetch_host_log(started);
        if (!host_log.empty()) spdlog::debug("KWin log:\n{}", host_log);
    }

    drain(log);

    if (!ctx.shortcut.empty()) {
        m_out << "Shortcut registered: " << ctx.shortcut << "\n";
        m_out << "Script ID: " << script_id << "\n";
        if (!ctx.script_name.empty()) m_out << "Script name: " << ctx.script_name << "\n";
    }
}

void Session::drain(const ipc::MessageLog& log) {
    for (auto& m : log.snapshot()) {
        if (m.tag == "result") m_out << m.payload << "\n";
        else if (m.tag == "error") m_err << "ERROR: " << m.payload << "\n";
        else m_out << m.tag << ": " << m.payload << "\n";
    }
}

} // namespace winpipe::session
