/*
 * Command table - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <winpipe/compile/commands.hpp>
#include <algorithm>
#include <unordered_map>

namespace winpipe::compile {

namespace {

const std::unordered_map<std::string, CommandInfo>& table() {
    static const std::unordered_map<std::string, CommandInfo> commands = [] {
        std::unordered_map<std::string, CommandInfo> m;
        m["search"] = {CommandKind::Search};
        m["getactivewindow"] = {CommandKind::GetActiveWindow};
        m["savewindowstack"] = {CommandKind::SaveWindowStack};
        m["loadwindowstack"] = {CommandKind::LoadWindowStack};
        auto win = [&](const char* name, WindowAction a) { m[name] = {CommandKind::WindowAction, a}; };
        win("getwindowname", WindowAction::GetWindowName);
        win("getwindowclassname", WindowAction::GetWindowClassName);
        win("getwindowgeometry", WindowAction::GetWindowGeometry);
        win("getwindowid", WindowAction::GetWindowId);
        win("getwindowpid", WindowAction::GetWindowPid);
        win("get_desktop_for_window", WindowAction::GetDesktopForWindow);
        win("windowactivate", WindowAction::WindowActivate);
        win("activatewindow", WindowAction::WindowActivate);
        win("windowraise", WindowAction::WindowRaise);
        win("windowminimize", WindowAction::WindowMinimize);
        win("windowclose", WindowAction::WindowClose);
        win("windowkill", WindowAction::WindowKill);
        win("windowstate", WindowAction::WindowState);
        win("windowmove", WindowAction::WindowMove);
        win("windowsize", WindowAction::WindowSize);
        win("set_desktop_for_window", WindowAction::SetDesktopForWindow);
        auto global = [&](const char* name, GlobalAction a) {
            CommandInfo info{CommandKind::GlobalAction};
            info.global = a;
            m[name] = info;
        };
        global("get_desktop", GlobalAction::GetDesktop);
        global("set_desktop", GlobalAction::SetDesktop);
        global("get_num_desktops", GlobalAction::GetNumDesktops);
        global("set_num_desktops", GlobalAction::SetNumDesktops);
        return m;
    }();
    return commands;
}

std::vector<std::string> names_of(CommandKind kind) {
    std::vector<std::string> out;
    for (auto& [name, info] : table()) if (info.kind == kind) out.push_back(name);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

std::optional<CommandInfo> lookup_command(const std::string& name) {
    auto it = table().find(name);
    if (it == table().end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> window_action_names() { return names_of(CommandKind::WindowAction); }
std::vector<std::string> global_action_names() { return names_of(CommandKind::GlobalAction); }

} // namespace winpipe::compile
