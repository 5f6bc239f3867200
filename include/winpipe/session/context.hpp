/*
 * winpipe Session Context
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include "winpipe/render/bindings.hpp"
#include "winpipe/session/config.hpp"

namespace winpipe::session {

struct SessionContext {
    bool debug = false;
    bool kde5 = false;
    std::string marker;      // temp script base name
    std::string dbus_addr;   // unique name of the callback connection
    std::string script_name; // --name, may be empty
    std::string shortcut;    // --shortcut, may be empty
    std::string cmdline;
};

// Bindings every fragment may reference.
render::Bindings base_bindings(const SessionContext& ctx);

// KDE 5 if KDE_SESSION_VERSION says so, unless the config pins a version.
bool detect_kde5(HostVersion configured);

} // namespace winpipe::session
