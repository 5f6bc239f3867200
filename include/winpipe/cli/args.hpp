/*
 * winpipe Argument Cursor
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Turns the process argv into a stream of Arg items: short flags (-d, and
 *   clusters such as -dn), long flags (--name, --name=value) and bare values.
 *   Directive grammars pull items one at a time and ask for an option value
 *   with value(). A token that looks like a negative number (-5) is a value,
 *   not a flag, and everything after "--" is a value.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace winpipe {

enum class ArgKind {
    Short,
    Long,
    Value
};

struct Arg {
    ArgKind kind;
    std::string text; // flag name without dashes, or the raw value

    bool is_long(const char* name) const { return kind == ArgKind::Long && text == name; }
    bool is_short(char c) const { return kind == ArgKind::Short && text.size() == 1 && text[0] == c; }
    // "--name", "-n" or the value itself, for error messages.
    std::string display() const;
};

class ArgCursor {
public:
    explicit ArgCursor(std::vector<std::string> args);
    static ArgCursor from_argv(int argc, char* argv[]);

    std::optional<Arg> next();
    // Value for the flag just returned by next(): the "=value" part or the next raw token.
    std::string value();

    bool exhausted() const;

private:
    bool is_number(const std::string& s) const;

    std::vector<std::string> m_args;
    std::size_t m_pos = 0;              // next raw token
    std::string m_shorts;               // rest of a short-flag cluster
    std::optional<std::string> m_inline; // pending "=value" of a long flag
    std::string m_last_flag;            // for "missing value" messages
    bool m_options_done = false;        // seen "--"
};

// Error helpers shared by the option and directive grammars.
[[noreturn]] void throw_unexpected(const Arg& arg);
int parse_int(const std::string& text);
unsigned parse_uint(const std::string& text);

} // namespace winpipe
