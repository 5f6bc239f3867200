/*
 * winpipe Script Host
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <winpipe/ipc/script_host.hpp>
#include <winpipe/ipc/dbus_connection.hpp>
#include <spdlog/spdlog.h>

namespace winpipe::ipc {

namespace {
const char* kDestination = "org.kde.KWin";
const char* kScriptingPath = "/Scripting";
const char* kScriptingInterface = "org.kde.kwin.Scripting";
const char* kScriptInterface = "org.kde.kwin.Script";
}

std::string script_object_path(int script_id, bool kde5) {
    if (kde5) return "/" + std::to_string(script_id);
    return "/Scripting/Script" + std::to_string(script_id);
}

int KWinScriptHost::load_script(const std::string& path, const std::string& name) {
    MessagePtr reply = m_conn.call(kDestination, kScriptingPath, kScriptingInterface, "loadScript", {path, name});
    int id = reply_int32(reply.get());
    spdlog::debug("loaded {} as script {}", path, id);
    return id;
}

void KWinScriptHost::unload_script(const std::string& name) {
    m_conn.call(kDestination, kScriptingPath, kScriptingInterface, "unloadScript", {name});
}

void KWinScriptHost::run(int script_id) {
    m_conn.call(kDestination, script_object_path(script_id, m_kde5), kScriptInterface, "run");
}

void KWinScriptHost::stop(int script_id) {
    m_conn.call(kDestination, script_object_path(script_id, m_kde5), kScriptInterface, "stop");
}

} // namespace winpipe::ipc
