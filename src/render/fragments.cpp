/*
 * Script fragment catalog - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Desktop and stack numbers are 1-based in every fragment.
 */
#include <winpipe/render/fragments.hpp>

namespace winpipe::render::fragments {

const Template kHeader{"header", R"js(// winpipe script {{marker}}
var wp_marker = {{js marker}};
var wp_cmdline = {{js cmdline}};
var wp_debug_enabled = {{debug}};
var wp_stack = [];
var wp_saved_stacks = {};

function wp_send(tag, text) {
    callDBus({{js dbus_addr}}, "/", "", tag, String(text));
}
function wp_result(text) { wp_send("result", text); }
function wp_error(text) { wp_send("error", text); }
function wp_debug(text) { if (wp_debug_enabled) wp_send("debug", text); }

function wp_windows() {
{{#if kde5}}
    return workspace.clientList();
{{else}}
    return workspace.windowList();
{{/if}}
}
function wp_active_window() {
{{#if kde5}}
    return workspace.activeClient;
{{else}}
    return workspace.activeWindow;
{{/if}}
}
function wp_window_id(w) {
    return String(w.internalId);
}
function wp_find_window(id) {
    var windows = wp_windows();
    for (var i = 0; i < windows.length; i++) {
        var w = windows[i];
        if (String(w.internalId) === id || String(w.windowId) === id) return w;
    }
    return null;
}
function wp_desktop_number(w) {
{{#if kde5}}
    return w.desktop;
{{else}}
    if (w.onAllDesktops || w.desktops.length == 0) return -1;
    return workspace.desktops.indexOf(w.desktops[0]) + 1;
{{/if}}
}
function wp_screen_number(w) {
{{#if kde5}}
    return w.screen;
{{else}}
    return workspace.screens.indexOf(w.output);
{{/if}}
}
function wp_is_maximized(w) {
    var area = workspace.clientArea(KWin.MaximizeArea, w);
    var g = w.frameGeometry;
    return g.width >= area.width && g.height >= area.height;
}
function wp_set_state(w, prop, value) {
    if (prop == "maximized") {
        w.setMaximize(value, value);
        return;
    }
    w[prop] = value;
}
function wp_toggle_state(w, prop) {
    if (prop == "maximized") {
        wp_set_state(w, prop, !wp_is_maximized(w));
        return;
    }
    w[prop] = !w[prop];
}

function wp_main() {
    wp_debug("running: " + wp_cmdline);
    try {
)js"};

const Template kFooter{"footer", R"js(    } catch (e) {
        wp_error(String(e));
    }
    wp_send("done", wp_marker);
}

{{#if shortcut}}
registerShortcut({{#if script_name}}{{js script_name}}{{else}}{{js marker}}{{/if}}, wp_cmdline, {{js shortcut}}, wp_main);
{{else}}
wp_main();
{{/if}}
)js"};

const Template kLastOutput{"last_output", R"js(        for (var wp_i = 0; wp_i < wp_stack.length; wp_i++) {
            wp_result(wp_window_id(wp_stack[wp_i]));
        }
)js"};

const Template kOnStackAll{"action_on_stack_all", R"js(        wp_debug({{js step_name}} + " on all " + wp_stack.length + " window(s)");
        for (var wp_i = 0; wp_i < wp_stack.length; wp_i++) {
            (function (w) {
{{{action}}}
            })(wp_stack[wp_i]);
        }
)js"};

const Template kOnStackItem{"action_on_stack_item", R"js(        (function (w) {
            if (!w) {
                wp_error({{js step_name}} + ": window stack has no entry %{{item_index}}");
                return;
            }
{{{action}}}
        })(wp_stack[{{item_index}} - 1]);
)js"};

const Template kOnWindowId{"action_on_window_id", R"js(        (function (w) {
            if (!w) {
                wp_error({{js step_name}} + ": no window with id " + {{js window_id}});
                return;
            }
{{{action}}}
        })(wp_find_window({{js window_id}}));
)js"};

const Template kGlobalAction{"global_action", R"js(        (function () {
{{{action}}}
        })();
)js"};

const Template kSearch{"search", R"js(        wp_stack = [];
        (function () {
            var term = new RegExp({{js search_term}}, "i");
            var windows = wp_windows();
            for (var i = 0; i < windows.length; i++) {
                var w = windows[i];
                if (w.specialWindow) continue;
                var checks = [];
{{#if match_class}}
                checks.push(term.test(w.resourceClass));
{{/if}}
{{#if match_classname}}
                checks.push(term.test(w.resourceName));
{{/if}}
{{#if match_role}}
                checks.push(term.test(w.windowRole));
{{/if}}
{{#if match_name}}
                checks.push(term.test(w.caption));
{{/if}}
{{#if match_pid}}
                checks.push(w.pid == {{pid}});
{{/if}}
{{#if match_desktop}}
                checks.push(wp_desktop_number(w) == {{desktop}});
{{/if}}
{{#if match_screen}}
                checks.push(wp_screen_number(w) == {{screen}});
{{/if}}
{{#if match_all}}
                var ok = checks.every(function (c) { return c; });
{{else}}
                var ok = checks.some(function (c) { return c; });
{{/if}}
                if (ok) wp_stack.push(w);
{{#if limit}}
                if (wp_stack.length >= {{limit}}) break;
{{/if}}
            }
        })();
        wp_debug({{js step_name}} + ": " + wp_stack.length + " window(s)");
)js"};

const Template kGetActiveWindow{"getactivewindow", R"js(        wp_stack = [];
        (function () {
            var w = wp_active_window();
            if (w) wp_stack.push(w);
        })();
)js"};

const Template kSaveWindowStack{"savewindowstack", R"js(        wp_saved_stacks[{{js name}}] = wp_stack.slice();
)js"};

const Template kLoadWindowStack{"loadwindowstack", R"js(        if ({{js name}} in wp_saved_stacks) {
            wp_stack = wp_saved_stacks[{{js name}}].slice();
        } else {
            wp_stack = [];
            wp_error("window stack " + {{js name}} + " was never saved");
        }
)js"};

const Template kGetWindowName{"getwindowname", R"js(                wp_result(w.caption);)js"};

const Template kGetWindowClassName{"getwindowclassname", R"js(                wp_result(w.resourceClass);)js"};

const Template kGetWindowGeometry{"getwindowgeometry", R"js(                var g = w.frameGeometry;
                wp_result("Window " + wp_window_id(w));
                wp_result("  Position: " + g.x + "," + g.y);
                wp_result("  Geometry: " + g.width + "x" + g.height);)js"};

const Template kGetWindowId{"getwindowid", R"js(                wp_result(wp_window_id(w));)js"};

const Template kGetWindowPid{"getwindowpid", R"js(                wp_result(w.pid);)js"};

const Template kGetDesktopForWindow{"get_desktop_for_window", R"js(                wp_result(wp_desktop_number(w));)js"};

const Template kWindowActivate{"windowactivate", R"js({{#if kde5}}
                workspace.activeClient = w;{{else}}
                workspace.activeWindow = w;{{/if}})js"};

const Template kWindowRaise{"windowraise", R"js({{#if kde5}}
                workspace.activeClient = w;{{else}}
                workspace.raiseWindow(w);{{/if}})js"};

const Template kWindowMinimize{"windowminimize", R"js(                w.minimized = true;)js"};

const Template kWindowClose{"windowclose", R"js(                w.closeWindow();)js"};

const Template kWindowKill{"windowkill", R"js(                w.killWindow();)js"};

const Template kWindowState{"windowstate", R"js({{{windowstate}}})js"};

const Template kWindowMove{"windowmove", R"js(                var g = w.frameGeometry;
                var area = workspace.clientArea(KWin.FullScreenArea, w);
                var x = g.x;
                var y = g.y;
{{#if x}}
                x = {{#if relative}}g.x + {{/if}}{{x}};
{{/if}}
{{#if x_percent}}
                x = {{#if relative}}g.x{{else}}area.x{{/if}} + area.width * {{x_percent}} / 100;
{{/if}}
{{#if y}}
                y = {{#if relative}}g.y + {{/if}}{{y}};
{{/if}}
{{#if y_percent}}
                y = {{#if relative}}g.y{{else}}area.y{{/if}} + area.height * {{y_percent}} / 100;
{{/if}}
                w.frameGeometry = { x: x, y: y, width: g.width, height: g.height };)js"};

const Template kWindowSize{"windowsize", R"js(                var g = w.frameGeometry;
                var area = workspace.clientArea(KWin.FullScreenArea, w);
                var width = g.width;
                var height = g.height;
{{#if x}}
                width = {{x}};
{{/if}}
{{#if x_percent}}
                width = area.width * {{x_percent}} / 100;
{{/if}}
{{#if y}}
                height = {{y}};
{{/if}}
{{#if y_percent}}
                height = area.height * {{y_percent}} / 100;
{{/if}}
                w.frameGeometry = { x: g.x, y: g.y, width: width, height: height };)js"};

const Template kSetDesktopForWindow{"set_desktop_for_window", R"js({{#if kde5}}
                w.desktop = {{desktop_id}};{{else}}
                var d = workspace.desktops[{{desktop_id}} - 1];
                if (d) w.desktops = [d];
                else wp_error("no desktop " + {{desktop_id}});{{/if}})js"};

const Template kGetDesktop{"get_desktop", R"js({{#if kde5}}
            wp_result(workspace.currentDesktop);{{else}}
            wp_result(workspace.desktops.indexOf(workspace.currentDesktop) + 1);{{/if}})js"};

const Template kSetDesktop{"set_desktop", R"js({{#if kde5}}
            workspace.currentDesktop = {{n}};{{else}}
            var d = workspace.desktops[{{n}} - 1];
            if (d) workspace.currentDesktop = d;
            else wp_error("no desktop " + {{n}});{{/if}})js"};

const Template kGetNumDesktops{"get_num_desktops", R"js({{#if kde5}}
            wp_result(workspace.desktops);{{else}}
            wp_result(workspace.desktops.length);{{/if}})js"};

const Template kSetNumDesktops{"set_num_desktops", R"js({{#if kde5}}
            workspace.desktops = {{n}};{{else}}
            while (workspace.desktops.length < {{n}}) workspace.createDesktop(workspace.desktops.length, "");
            while (workspace.desktops.length > {{n}} && workspace.desktops.length > 1) {
                workspace.removeDesktop(workspace.desktops[workspace.desktops.length - 1]);
            }{{/if}})js"};

} // namespace winpipe::render::fragments
