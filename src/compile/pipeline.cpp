/*
 * winpipe Pipeline Compiler Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <winpipe/compile/pipeline.hpp>
#include <winpipe/render/fragments.hpp>
#include <winpipe/render/template.hpp>
#include <winpipe/util/error.hpp>
#include <spdlog/spdlog.h>

namespace winpipe::compile {

namespace frag = render::fragments;
using render::Bindings;

namespace {

const render::Template& window_action_body(WindowAction a) {
    switch (a) {
        case WindowAction::GetWindowName: return frag::kGetWindowName;
        case WindowAction::GetWindowClassName: return frag::kGetWindowClassName;
        case WindowAction::GetWindowGeometry: return frag::kGetWindowGeometry;
        case WindowAction::GetWindowId: return frag::kGetWindowId;
        case WindowAction::GetWindowPid: return frag::kGetWindowPid;
        case WindowAction::GetDesktopForWindow: return frag::kGetDesktopForWindow;
        case WindowAction::WindowActivate: return frag::kWindowActivate;
        case WindowAction::WindowRaise: return frag::kWindowRaise;
        case WindowAction::WindowMinimize: return frag::kWindowMinimize;
        case WindowAction::WindowClose: return frag::kWindowClose;
        case WindowAction::WindowKill: return frag::kWindowKill;
        case WindowAction::WindowState: return frag::kWindowState;
        case WindowAction::WindowMove: return frag::kWindowMove;
        case WindowAction::WindowSize: return frag::kWindowSize;
        case WindowAction::SetDesktopForWindow: return frag::kSetDesktopForWindow;
    }
    throw RenderError("no fragment for window action");
}

const render::Template& global_action_body(GlobalAction a) {
    switch (a) {
        case GlobalAction::GetDesktop: return frag::kGetDesktop;
        case GlobalAction::SetDesktop: return frag::kSetDesktop;
        case GlobalAction::GetNumDesktops: return frag::kGetNumDesktops;
        case GlobalAction::SetNumDesktops: return frag::kSetNumDesktops;
    }
    throw RenderError("no fragment for global action");
}

std::string windowstate_script(const std::vector<StateChange>& changes) {
    std::string out;
    for (auto& c : changes) {
        std::string prop = render::js_quote(windowstate_property(c.property));
        if (!out.empty()) out += "\n";
        switch (c.op) {
            case StateChange::Op::Add: out += "                wp_set_state(w, " + prop + ", true);"; break;
            case StateChange::Op::Remove: out += "                wp_set_state(w, " + prop + ", false);"; break;
            case StateChange::Op::Toggle: out += "                wp_toggle_state(w, " + prop + ");"; break;
        }
    }
    return out;
}

std::string axis_text(const Axis& a, Axis::Mode mode) {
    return a.mode == mode ? std::to_string(a.value) : std::string();
}

struct StepRenderer {
    const Bindings& b;

    std::string operator()(const SearchDirective& s) const {
        Bindings ctx = b.with("match_class", s.match_class)
                        .with("match_classname", s.match_classname)
                        .with("match_role", s.match_role)
                        .with("match_name", s.match_name)
                        .with("match_pid", s.match_pid)
                        .with("pid", s.pid)
                        .with("match_desktop", s.match_desktop)
                        .with("desktop", s.desktop)
                        .with("match_screen", s.match_screen)
                        .with("screen", s.screen)
                        .with("limit", s.limit)
                        .with("match_all", s.match_all)
                        .with("search_term", s.term);
        return render::render(frag::kSearch, ctx);
    }

    std::string operator()(const ActiveWindowDirective&) const {
        return render::render(frag::kGetActiveWindow, b);
    }

    std::string operator()(const StackDirective& s) const {
        Bindings ctx = b.with("name", s.name);
        return render::render(s.op == StackDirective::Op::Save ? frag::kSaveWindowStack : frag::kLoadWindowStack, ctx);
    }

    std::string operator()(const WindowActionDirective& d) const {
        Bindings ctx = b;
        switch (d.action) {
            case WindowAction::WindowState:
                ctx = ctx.with("windowstate", windowstate_script(d.state));
                break;
            case WindowAction::WindowMove:
            case WindowAction::WindowSize:
                ctx = ctx.with("relative", d.relative)
                         .with("x", axis_text(d.x, Axis::Mode::Absolute))
                         .with("y", axis_text(d.y, Axis::Mode::Absolute))
                         .with("x_percent", axis_text(d.x, Axis::Mode::Percent))
                         .with("y_percent", axis_text(d.y, Axis::Mode::Percent));
                break;
            case WindowAction::SetDesktopForWindow:
                if (!d.desktop) throw RenderError("set_desktop_for_window without desktop_id");
                ctx = ctx.with("desktop_id", *d.desktop);
                break;
            default:
                break;
        }
        Bindings wrap = b.with("action", render::render(window_action_body(d.action), ctx));
        if (std::holds_alternative<AllStack>(d.target)) {
            return render::render(frag::kOnStackAll, wrap);
        }
        if (auto s = std::get_if<StackIndex>(&d.target)) {
            return render::render(frag::kOnStackItem, wrap.with("item_index", s->index));
        }
        return render::render(frag::kOnWindowId, wrap.with("window_id", std::get<ExplicitId>(d.target).id));
    }

    std::string operator()(const GlobalActionDirective& d) const {
        Bindings ctx = d.n ? b.with("n", *d.n) : b;
        Bindings wrap = b.with("action", render::render(global_action_body(d.action), ctx));
        return render::render(frag::kGlobalAction, wrap);
    }
};

enum class State {
    AwaitingCommand,
    Compiling,
    Done
};

} // namespace

Step render_step(const std::string& command, const ParsedDirective& parsed, const Bindings& base) {
    Bindings ctx = base.with("step_name", command);
    Step step;
    step.script = std::visit(StepRenderer{ctx}, parsed.directive);
    step.is_query = is_query(parsed.directive);
    step.next_command = parsed.next_command;
    return step;
}

CompiledScript compile_script(const Bindings& base, ArgCursor& args, const std::string& first_command) {
    CompiledScript out;
    out.text = render::render(frag::kHeader, base);

    std::string command = first_command;
    State state = State::Compiling;
    while (state != State::Done) {
        switch (state) {
            case State::AwaitingCommand: {
                auto arg = args.next();
                if (!arg) { state = State::Done; break; }
                if (arg->kind != ArgKind::Value) throw_unexpected(*arg);
                command = arg->text;
                state = State::Compiling;
                break;
            }
            case State::Compiling: {
                Step step;
                try {
                    step = render_step(command, parse_directive(command, args), base);
                } catch (Error& e) {
                    e.add_context("in command '" + command + "'");
                    throw;
                }
                spdlog::debug("step '{}' compiled (query: {})", command, step.is_query);
                out.text += step.script;
                if (step.next_command) command = *step.next_command;
                state = step.next_command ? State::Compiling : State::AwaitingCommand;
                out.steps.push_back(std::move(step));
                break;
            }
            case State::Done:
                break;
        }
    }

    if (!out.steps.empty() && out.steps.back().is_query) {
        out.text += render::render(frag::kLastOutput, base);
        out.emits_last_result = true;
    }
    out.text += render::render(frag::kFooter, base);
    return out;
}

} // namespace winpipe::compile
