/*
 * Command table - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace winpipe::compile {

enum class CommandKind {
    Search,
    GetActiveWindow,
    SaveWindowStack,
    LoadWindowStack,
    WindowAction,
    GlobalAction
};

enum class WindowAction {
    GetWindowName,
    GetWindowClassName,
    GetWindowGeometry,
    GetWindowId,
    GetWindowPid,
    GetDesktopForWindow,
    WindowActivate,
    WindowRaise,
    WindowMinimize,
    WindowClose,
    WindowKill,
    WindowState,
    WindowMove,
    WindowSize,
    SetDesktopForWindow
};

enum class GlobalAction {
    GetDesktop,
    SetDesktop,
    GetNumDesktops,
    SetNumDesktops
};

struct CommandInfo {
    CommandKind kind;
    WindowAction window = WindowAction::GetWindowName; // valid when kind == WindowAction
    GlobalAction global = GlobalAction::GetDesktop;    // valid when kind == GlobalAction
};

// Returns nullopt if name is not a command.
std::optional<CommandInfo> lookup_command(const std::string& name);

// Sorted, for the usage text. Aliases are included.
std::vector<std::string> window_action_names();
std::vector<std::string> global_action_names();

} // namespace winpipe::compile
