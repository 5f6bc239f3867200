/*
 * winpipe Directive Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   One parsed command of a pipeline. Directive is a closed variant over the
 *   command families; the parser produces them and the step renderer turns each
 *   one into a script fragment. Directives are plain values and are not
 *   modified after parsing.
 *
 * License (MIT): (see full text in args.hpp header)
 */
#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "winpipe/compile/commands.hpp"
#include "winpipe/compile/window_ref.hpp"

namespace winpipe::compile {

struct SearchDirective {
    bool match_class = false;
    bool match_classname = false;
    bool match_role = false;
    bool match_name = false;
    bool match_pid = false;
    int pid = 0;
    bool match_desktop = false;
    int desktop = 0;
    bool match_screen = false;
    int screen = 0;
    unsigned limit = 0;     // 0 = no limit
    bool match_all = false; // --all; default is --any
    std::string term;
};

struct ActiveWindowDirective {};

struct StackDirective {
    enum class Op { Save, Load } op;
    std::string name;
};

struct Axis {
    enum class Mode { Unset, Absolute, Percent } mode = Mode::Unset;
    int value = 0;
};

struct StateChange {
    enum class Op { Add, Remove, Toggle } op;
    std::string property; // user-facing name, lower case
};

struct WindowActionDirective {
    WindowAction action;
    std::string name;                 // as typed, e.g. "activatewindow"
    WindowRef target = StackIndex{1};
    std::vector<StateChange> state;   // windowstate
    bool relative = false;            // windowmove
    Axis x, y;                        // windowmove / windowsize
    std::optional<int> desktop;       // set_desktop_for_window
};

struct GlobalActionDirective {
    GlobalAction action;
    std::string name;
    std::optional<int> n; // set_desktop / set_num_desktops
};

using Directive = std::variant<SearchDirective, ActiveWindowDirective, StackDirective,
                               WindowActionDirective, GlobalActionDirective>;

// Script property behind a windowstate name, or nullptr if unsupported.
const char* windowstate_property(const std::string& name);

} // namespace winpipe::compile
