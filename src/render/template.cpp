/*
 * winpipe Template Renderer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <winpipe/render/template.hpp>
#include <winpipe/util/error.hpp>
#include <cctype>
#include <cstdio>

namespace winpipe::render {

namespace {

enum class Stop { End, Else, EndIf };

class Renderer {
public:
    Renderer(const Template& tpl, const Bindings& b) : m_tpl(tpl), m_text(tpl.text), m_bindings(b) {}

    std::string run() {
        std::string out;
        Stop s = block(out, true);
        if (s == Stop::Else) fail("{{else}} outside of {{#if}}");
        if (s == Stop::EndIf) fail("{{/if}} without matching {{#if}}");
        return out;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw RenderError("template '" + std::string(m_tpl.name) + "': " + what);
    }

    const Value& lookup(const std::string& key) const {
        const Value* v = m_bindings.find(key);
        if (!v) fail("variable '" + key + "' not found in strict mode");
        return *v;
    }

    static std::string trim(const std::string& s) {
        size_t a = 0; while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
        size_t b = s.size(); while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
        return s.substr(a, b - a);
    }

    static bool is_name(const std::string& s) {
        if (s.empty()) return false;
        for (char c : s) if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
        return true;
    }

    std::string name_or_fail(const std::string& s) const {
        if (!is_name(s)) fail("invalid variable name '" + s + "'");
        return s;
    }

    // Reads text and tags until end of input or an {{else}} / {{/if}} at this level.
    Stop block(std::string& out, bool emit) {
        while (m_pos < m_text.size()) {
            size_t open = m_text.find("{{", m_pos);
            if (open == std::string::npos) {
                if (emit) out.append(m_text, m_pos, std::string::npos);
                m_pos = m_text.size();
                break;
            }
            if (emit) out.append(m_text, m_pos, open - m_pos);
            bool triple = m_text.compare(open, 3, "{{{") == 0;
            size_t body = open + (triple ? 3 : 2);
            size_t close = m_text.find(triple ? "}}}" : "}}", body);
            if (close == std::string::npos) fail("unterminated tag at offset " + std::to_string(open));
            std::string tag = trim(m_text.substr(body, close - body));
            m_pos = close + (triple ? 3 : 2);

            if (triple) {
                std::string key = name_or_fail(tag);
                if (emit) out += to_text(lookup(key));
                continue;
            }
            if (tag == "else") return Stop::Else;
            if (tag == "/if") return Stop::EndIf;
            if (tag.rfind("#if", 0) == 0) {
                std::string key = name_or_fail(trim(tag.substr(3)));
                conditional(out, emit, key);
                continue;
            }
            if (!tag.empty() && (tag[0] == '#' || tag[0] == '/')) fail("unsupported block '" + tag + "'");
            if (tag.rfind("js ", 0) == 0) {
                std::string key = name_or_fail(trim(tag.substr(3)));
                if (emit) out += js_quote(to_text(lookup(key)));
                continue;
            }
            std::string key = name_or_fail(tag);
            if (emit) out += to_text(lookup(key));
        }
        return Stop::End;
    }

    void conditional(std::string& out, bool emit, const std::string& key) {
        bool taken = emit && is_truthy(lookup(key));
        Stop s = block(out, emit && taken);
        if (s == Stop::Else) s = block(out, emit && !taken);
        if (s != Stop::EndIf) fail("{{#if " + key + "}} is not closed");
    }

    const Template& m_tpl;
    std::string m_text;
    const Bindings& m_bindings;
    size_t m_pos = 0;
};

} // namespace

std::string render(const Template& tpl, const Bindings& bindings) {
    return Renderer(tpl, bindings).run();
}

std::string js_quote(const std::string& in) {
    std::string out; out.reserve(in.size() + 2);
    out.push_back('"');
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c)); out += buf;
                } else out.push_back(c);
        }
    }
    out.push_back('"');
    return out;
}

} // namespace winpipe::render
