/*
 * Script fragment catalog - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   The closed set of KWin script fragments a pipeline is assembled from. Every
 *   fragment may reference the session bindings (marker, dbus_addr, cmdline,
 *   debug, kde5, script_name, shortcut) and step_name; the remaining keys each
 *   fragment needs are listed next to it.
 */
#pragma once
#include "winpipe/render/template.hpp"

namespace winpipe::render::fragments {

extern const Template kHeader;
extern const Template kFooter;
extern const Template kLastOutput;

// Wrappers applying a window action ("action") to its target.
extern const Template kOnStackAll;
extern const Template kOnStackItem;   // item_index
extern const Template kOnWindowId;    // window_id
extern const Template kGlobalAction;  // action

// search: match_class match_classname match_role match_name match_pid pid
//         match_desktop desktop match_screen screen limit match_all search_term
extern const Template kSearch;
extern const Template kGetActiveWindow;
extern const Template kSaveWindowStack; // name
extern const Template kLoadWindowStack; // name

// Window action bodies; they operate on the variable w.
extern const Template kGetWindowName;
extern const Template kGetWindowClassName;
extern const Template kGetWindowGeometry;
extern const Template kGetWindowId;
extern const Template kGetWindowPid;
extern const Template kGetDesktopForWindow;
extern const Template kWindowActivate;
extern const Template kWindowRaise;
extern const Template kWindowMinimize;
extern const Template kWindowClose;
extern const Template kWindowKill;
extern const Template kWindowState;          // windowstate
extern const Template kWindowMove;           // relative x y x_percent y_percent
extern const Template kWindowSize;           // x y x_percent y_percent
extern const Template kSetDesktopForWindow;  // desktop_id

// Global action bodies.
extern const Template kGetDesktop;
extern const Template kSetDesktop;      // n
extern const Template kGetNumDesktops;
extern const Template kSetNumDesktops;  // n

} // namespace winpipe::render::fragments
