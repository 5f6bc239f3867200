/*
 * winpipe Script Host
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace winpipe::ipc {

class BusConnection;

// Remote scripting facility of the compositor. Each call is one blocking
// round trip; failures throw IpcError.
class ScriptHost {
public:
    virtual ~ScriptHost() = default;
    virtual int load_script(const std::string& path, const std::string& name) = 0;
    virtual void unload_script(const std::string& name) = 0;
    virtual void run(int script_id) = 0;
    virtual void stop(int script_id) = 0;
};

// "/<id>" on KDE 5, "/Scripting/Script<id>" on later versions.
std::string script_object_path(int script_id, bool kde5);

class KWinScriptHost : public ScriptHost {
public:
    KWinScriptHost(BusConnection& conn, bool kde5) : m_conn(conn), m_kde5(kde5) {}

    int load_script(const std::string& path, const std::string& name) override;
    void unload_script(const std::string& name) override;
    void run(int script_id) override;
    void stop(int script_id) override;

private:
    BusConnection& m_conn;
    bool m_kde5;
};

} // namespace winpipe::ipc
