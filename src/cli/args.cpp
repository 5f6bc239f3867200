/*
 * winpipe Argument Cursor Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <winpipe/cli/args.hpp>
#include <winpipe/util/error.hpp>
#include <cctype>
#include <charconv>

namespace winpipe {

std::string Arg::display() const {
    switch (kind) {
        case ArgKind::Short: return "-" + text;
        case ArgKind::Long: return "--" + text;
        case ArgKind::Value: return text;
    }
    return text;
}

ArgCursor::ArgCursor(std::vector<std::string> args) : m_args(std::move(args)) {}

ArgCursor ArgCursor::from_argv(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return ArgCursor(std::move(args));
}

bool ArgCursor::is_number(const std::string& s) const {
    return s.size() > 1 && s[0] == '-' && std::isdigit(static_cast<unsigned char>(s[1]));
}

bool ArgCursor::exhausted() const {
    return m_shorts.empty() && !m_inline && m_pos >= m_args.size();
}

std::optional<Arg> ArgCursor::next() {
    if (m_inline) {
        std::string v = *m_inline; m_inline.reset();
        throw ArgumentError("unexpected value '" + v + "' for option '" + m_last_flag + "'");
    }
    if (!m_shorts.empty()) {
        std::string c(1, m_shorts[0]); m_shorts.erase(0, 1);
        m_last_flag = "-" + c;
        return Arg{ArgKind::Short, c};
    }
    if (m_pos >= m_args.size()) return std::nullopt;
    const std::string& tok = m_args[m_pos++];
    if (m_options_done || tok.size() < 2 || tok[0] != '-' || is_number(tok)) {
        return Arg{ArgKind::Value, tok};
    }
    if (tok == "--") {
        m_options_done = true;
        return next();
    }
    if (tok[1] == '-') {
        auto eq = tok.find('=');
        std::string name = tok.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
        if (eq != std::string::npos) m_inline = tok.substr(eq + 1);
        m_last_flag = "--" + name;
        return Arg{ArgKind::Long, name};
    }
    m_shorts = tok.substr(2);
    m_last_flag = tok.substr(0, 2);
    return Arg{ArgKind::Short, std::string(1, tok[1])};
}

std::string ArgCursor::value() {
    if (m_inline) { std::string v = *m_inline; m_inline.reset(); return v; }
    if (!m_shorts.empty()) { std::string v = m_shorts; m_shorts.clear(); return v; }
    if (m_pos >= m_args.size()) throw ArgumentError("missing argument for option '" + m_last_flag + "'");
    return m_args[m_pos++];
}

void throw_unexpected(const Arg& arg) {
    throw ArgumentError("unexpected argument '" + arg.display() + "'");
}

int parse_int(const std::string& text) {
    int out = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (text.empty() || ec != std::errc() || ptr != last) throw ArgumentError("invalid number '" + text + "'");
    return out;
}

unsigned parse_uint(const std::string& text) {
    unsigned out = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        throw ArgumentError("invalid number '" + text + "'");
    }
    return out;
}

} // namespace winpipe
