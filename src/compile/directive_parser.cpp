/*
 * winpipe Directive Parser Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <winpipe/compile/directive_parser.hpp>
#include <winpipe/util/error.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace winpipe::compile {

const char* windowstate_property(const std::string& name) {
    static const std::unordered_map<std::string, const char*> props = {
        {"above", "keepAbove"},
        {"below", "keepBelow"},
        {"skip_taskbar", "skipTaskbar"},
        {"skip_pager", "skipPager"},
        {"skip_switcher", "skipSwitcher"},
        {"fullscreen", "fullScreen"},
        {"shaded", "shade"},
        {"demands_attention", "demandsAttention"},
        {"no_border", "noBorder"},
        {"minimized", "minimized"},
        {"maximized", "maximized"},
    };
    auto it = props.find(name);
    return it == props.end() ? nullptr : it->second;
}

bool is_query(const Directive& d) {
    if (std::holds_alternative<SearchDirective>(d)) return true;
    if (std::holds_alternative<ActiveWindowDirective>(d)) return true;
    if (auto s = std::get_if<StackDirective>(&d)) return s->op == StackDirective::Op::Load;
    return false;
}

namespace {

bool is_int_token(const std::string& tok) {
    size_t i = (!tok.empty() && (tok[0] == '-' || tok[0] == '+')) ? 1 : 0;
    if (i >= tok.size()) return false;
    return std::all_of(tok.begin() + i, tok.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool is_axis_token(const std::string& tok) {
    if (tok == "x" || tok == "y") return true;
    if (!tok.empty() && tok.back() == '%') return is_int_token(tok.substr(0, tok.size() - 1));
    return is_int_token(tok);
}

Axis parse_axis(const std::string& tok, const char* keyword) {
    Axis a;
    if (tok == keyword) return a;
    if (!tok.empty() && tok.back() == '%') {
        a.mode = Axis::Mode::Percent;
        a.value = parse_int(tok.substr(0, tok.size() - 1));
    } else {
        a.mode = Axis::Mode::Absolute;
        a.value = parse_int(tok);
    }
    return a;
}

// Positional values of a window action: an optional leading window reference
// followed by `slots` arguments. A bare decimal in front is only promoted to a
// window id when one more argument-shaped value follows the filled slots.
class Positionals {
public:
    Positionals(size_t slots, bool (*fits)(const std::string&)) : m_slots(slots), m_fits(fits) {}

    // Returns false when tok belongs to the next command.
    bool offer(const std::string& tok) {
        if (m_slots == 0) {
            if (m_target) return false;
            m_target = resolve_window_ref(tok);
            return m_target.has_value();
        }
        if (!m_target && m_values.empty() && is_unambiguous_window_ref(tok)) {
            m_target = resolve_window_ref(tok);
            return true;
        }
        if (m_values.size() < m_slots) {
            m_values.push_back(tok);
            return true;
        }
        if (!m_target && is_explicit_id(m_values.front()) && m_fits(tok)) {
            m_target = ExplicitId{m_values.front()};
            m_values.erase(m_values.begin());
            m_values.push_back(tok);
            return true;
        }
        return false;
    }

    WindowRef target() const { return m_target.value_or(WindowRef{StackIndex{1}}); }
    const std::vector<std::string>& values() const { return m_values; }

private:
    size_t m_slots;
    bool (*m_fits)(const std::string&);
    std::optional<WindowRef> m_target;
    std::vector<std::string> m_values;
};

ParsedDirective parse_search(ArgCursor& args) {
    SearchDirective s;
    std::optional<std::string> next;
    while (auto arg = args.next()) {
        if (arg->is_long("class")) s.match_class = true;
        else if (arg->is_long("classname")) s.match_classname = true;
        else if (arg->is_long("role")) s.match_role = true;
        else if (arg->is_long("name")) s.match_name = true;
        else if (arg->is_long("pid")) { s.match_pid = true; s.pid = parse_int(args.value()); }
        else if (arg->is_long("desktop")) { s.match_desktop = true; s.desktop = parse_int(args.value()); }
        else if (arg->is_long("screen")) { s.match_screen = true; s.screen = parse_int(args.value()); }
        else if (arg->is_long("limit")) s.limit = parse_uint(args.value());
        else if (arg->is_long("all")) s.match_all = true;
        else if (arg->is_long("any")) s.match_all = false;
        else if (arg->kind == ArgKind::Value && s.term.empty()) s.term = arg->text;
        else if (arg->kind == ArgKind::Value) { next = arg->text; break; }
        else throw_unexpected(*arg);
    }
    if (!(s.match_class || s.match_classname || s.match_role || s.match_name)) {
        s.match_class = s.match_classname = s.match_role = s.match_name = true;
    }
    return {s, next};
}

ParsedDirective parse_stack(StackDirective::Op op, ArgCursor& args) {
    std::optional<std::string> name, next;
    while (auto arg = args.next()) {
        if (arg->kind != ArgKind::Value) throw_unexpected(*arg);
        if (!name) { name = arg->text; continue; }
        next = arg->text;
        break;
    }
    if (!name) throw ArgumentError("missing argument 'name'");
    return {StackDirective{op, *name}, next};
}

ParsedDirective parse_window_action(const std::string& command, WindowAction action, ArgCursor& args) {
    WindowActionDirective d;
    d.action = action;
    d.name = command;
    std::optional<std::string> next;

    size_t slots = 0;
    bool (*fits)(const std::string&) = is_int_token;
    if (action == WindowAction::WindowMove || action == WindowAction::WindowSize) { slots = 2; fits = is_axis_token; }
    else if (action == WindowAction::SetDesktopForWindow) slots = 1;
    Positionals pos(slots, fits);

    while (auto arg = args.next()) {
        if (arg->kind == ArgKind::Value) {
            if (pos.offer(arg->text)) continue;
            next = arg->text;
            break;
        }
        if (action == WindowAction::WindowState && (arg->is_long("add") || arg->is_long("remove") || arg->is_long("toggle"))) {
            StateChange::Op op = arg->is_long("add") ? StateChange::Op::Add
                               : arg->is_long("remove") ? StateChange::Op::Remove : StateChange::Op::Toggle;
            std::string key = args.value();
            std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
            if (!windowstate_property(key)) throw ArgumentError("unsupported property '" + key + "'");
            d.state.push_back({op, key});
            continue;
        }
        if (action == WindowAction::WindowMove && arg->is_long("relative")) { d.relative = true; continue; }
        throw_unexpected(*arg);
    }

    d.target = pos.target();
    const auto& v = pos.values();
    if (action == WindowAction::WindowMove || action == WindowAction::WindowSize) {
        if (v.size() < 1) throw ArgumentError("missing argument 'x'");
        if (v.size() < 2) throw ArgumentError("missing argument 'y'");
        d.x = parse_axis(v[0], "x");
        d.y = parse_axis(v[1], "y");
    } else if (action == WindowAction::SetDesktopForWindow) {
        if (v.empty()) throw ArgumentError("missing argument 'desktop_id'");
        d.desktop = parse_int(v[0]);
    }
    return {d, next};
}

ParsedDirective parse_global_action(const std::string& command, GlobalAction action, ArgCursor& args) {
    GlobalActionDirective d{action, command, std::nullopt};
    std::optional<std::string> next;
    if (action == GlobalAction::SetDesktop || action == GlobalAction::SetNumDesktops) {
        while (auto arg = args.next()) {
            if (arg->kind != ArgKind::Value) throw_unexpected(*arg);
            if (!d.n) { d.n = parse_int(arg->text); continue; }
            next = arg->text;
            break;
        }
        if (!d.n) {
            throw ArgumentError(action == GlobalAction::SetDesktop ? "missing argument 'desktop_id'" : "missing argument 'num'");
        }
    }
    return {d, next};
}

} // namespace

ParsedDirective parse_directive(const std::string& command, ArgCursor& args) {
    auto info = lookup_command(command);
    if (!info) throw ArgumentError("Unknown command: " + command);
    switch (info->kind) {
        case CommandKind::Search: return parse_search(args);
        case CommandKind::GetActiveWindow: return {ActiveWindowDirective{}, std::nullopt};
        case CommandKind::SaveWindowStack: return parse_stack(StackDirective::Op::Save, args);
        case CommandKind::LoadWindowStack: return parse_stack(StackDirective::Op::Load, args);
        case CommandKind::WindowAction: return parse_window_action(command, info->window, args);
        case CommandKind::GlobalAction: return parse_global_action(command, info->global, args);
    }
    throw ArgumentError("Unknown command: " + command);
}

} // namespace winpipe::compile
