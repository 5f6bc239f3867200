/*
 * Window addressing - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <winpipe/compile/window_ref.hpp>
#include <winpipe/cli/args.hpp>
#include <winpipe/util/error.hpp>
#include <cctype>

namespace winpipe::compile {

static bool all_of(const std::string& s, size_t from, int (*pred)(int)) {
    if (from >= s.size()) return false;
    for (size_t i = from; i < s.size(); ++i) if (!pred(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

static bool is_uuid(const std::string& s) {
    // {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}
    if (s.size() != 38 || s.front() != '{' || s.back() != '}') return false;
    for (size_t i = 1; i < 37; ++i) {
        bool dash = (i == 9 || i == 14 || i == 19 || i == 24);
        if (dash ? s[i] != '-' : !std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

static bool is_hex_id(const std::string& s) {
    return s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X') && all_of(s, 2, [](int c) { return std::isxdigit(c); });
}

bool is_explicit_id(const std::string& token) {
    return is_uuid(token) || is_hex_id(token) || all_of(token, 0, [](int c) { return std::isdigit(c); });
}

bool is_unambiguous_window_ref(const std::string& token) {
    return (!token.empty() && token[0] == '%') || is_uuid(token) || is_hex_id(token);
}

std::optional<WindowRef> resolve_window_ref(const std::string& token) {
    if (is_explicit_id(token)) return WindowRef{ExplicitId{token}};
    if (token.empty() || token[0] != '%') return std::nullopt;
    if (token == "%@") return WindowRef{AllStack{}};
    if (!all_of(token, 1, [](int c) { return std::isdigit(c); })) throw ArgumentError("invalid window reference '" + token + "'");
    int index = parse_int(token.substr(1));
    if (index < 1) throw ArgumentError("invalid window reference '" + token + "': stack positions start at 1");
    return WindowRef{StackIndex{index}};
}

std::string describe(const WindowRef& ref) {
    if (auto e = std::get_if<ExplicitId>(&ref)) return e->id;
    if (auto s = std::get_if<StackIndex>(&ref)) return "%" + std::to_string(s->index);
    return "%@";
}

} // namespace winpipe::compile
