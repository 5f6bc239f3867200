/*
 * Window addressing - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   A window action targets an explicit window id, one numbered entry of the
 *   current window stack (%N, 1-based), or every entry of it (%@). Explicit ids
 *   are recognised first: a braced UUID, a 0x-prefixed hex number or a bare
 *   decimal.
 */
#pragma once
#include <optional>
#include <string>
#include <variant>

namespace winpipe::compile {

struct ExplicitId {
    std::string id;
};

struct StackIndex {
    int index = 1;
};

struct AllStack {};

using WindowRef = std::variant<ExplicitId, StackIndex, AllStack>;

inline bool operator==(const ExplicitId& a, const ExplicitId& b) { return a.id == b.id; }
inline bool operator==(const StackIndex& a, const StackIndex& b) { return a.index == b.index; }
inline bool operator==(const AllStack&, const AllStack&) { return true; }

// nullopt when token is not window syntax at all; throws ArgumentError for a
// malformed %-reference such as "%x" or "%0".
std::optional<WindowRef> resolve_window_ref(const std::string& token);

// %-syntax, braced UUID or 0x id: never an ordinary numeric argument.
bool is_unambiguous_window_ref(const std::string& token);
bool is_explicit_id(const std::string& token);

std::string describe(const WindowRef& ref);

} // namespace winpipe::compile
