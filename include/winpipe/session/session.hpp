/*
 * winpipe Session Manager
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Drives one invocation against the script host: writes the compiled
 *   script to a private temporary file, loads and runs it, collects the
 *   callbacks the script sends on the callback channel and writes them to the
 *   output streams. Also handles script removal.
 *
 * License (MIT): (see full text in args.hpp header)
 */
#pragma once
#include <ostream>
#include <string>
#include "winpipe/cli/args.hpp"
#include "winpipe/ipc/listener.hpp"
#include "winpipe/ipc/script_host.hpp"
#include "winpipe/session/context.hpp"

namespace winpipe::session {

struct SessionOptions {
    bool dry_run = false;
    bool keep_script = false;
    int completion_timeout_ms = 2000;
    std::string tmp_dir; // empty: $TMPDIR, else /tmp
};

// mkstemp-backed script file, removed on destruction unless kept.
class TempScriptFile {
public:
    TempScriptFile(const std::string& dir, bool keep);
    ~TempScriptFile();
    TempScriptFile(const TempScriptFile&) = delete;
    TempScriptFile& operator=(const TempScriptFile&) = delete;

    void write(const std::string& content);
    const std::string& path() const { return m_path; }
    // Base name of the file, unique per invocation.
    std::string marker() const;

private:
    std::string m_path;
    int m_fd = -1;
    bool m_keep;
};

class Session {
public:
    Session(ipc::ScriptHost& host, ipc::CallbackChannel& callbacks, SessionOptions opts,
            std::ostream& out, std::ostream& err);

    // One unloadScript call; nothing is compiled.
    void remove(const std::string& script_name);

    // Compiles the pipeline starting at first_command and runs it (or prints it on dry run).
    void execute(SessionContext ctx, ArgCursor& args, const std::string& first_command);

    const std::string& last_script() const { return m_last_script; }
    const std::string& last_marker() const { return m_last_marker; }

private:
    void drain(const ipc::MessageLog& log);

    ipc::ScriptHost& m_host;
    ipc::CallbackChannel& m_callbacks;
    SessionOptions m_opts;
    std::ostream& m_out;
    std::ostream& m_err;
    std::string m_last_script;
    std::string m_last_marker;
};

} // namespace winpipe::session
