/*
 * winpipe Session Context
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <winpipe/session/context.hpp>
#include <cstdlib>
#include <cstring>

namespace winpipe::session {

render::Bindings base_bindings(const SessionContext& ctx) {
    return render::Bindings{}
        .with("debug", ctx.debug)
        .with("kde5", ctx.kde5)
        .with("marker", ctx.marker)
        .with("dbus_addr", ctx.dbus_addr)
        .with("script_name", ctx.script_name)
        .with("shortcut", ctx.shortcut)
        .with("cmdline", ctx.cmdline);
}

bool detect_kde5(HostVersion configured) {
    switch (configured) {
        case HostVersion::Kde5: return true;
        case HostVersion::Kde6: return false;
        case HostVersion::Auto: break;
    }
    const char* v = std::getenv("KDE_SESSION_VERSION");
    return v && std::strcmp(v, "5") == 0;
}

} // namespace winpipe::session
