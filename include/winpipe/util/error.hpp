/*
 * Error types - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   All failures are reported as exceptions derived from winpipe::Error. Each
 *   layer that catches one appends a context line (e.g. "in command 'windowmove'")
 *   and rethrows the same object, so the top level prints the root cause together
 *   with the chain of contexts it travelled through.
 */
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace winpipe {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message), m_message(message) { rebuild(); }

    // Outermost context first.
    const std::vector<std::string>& context() const { return m_context; }
    const std::string& message() const { return m_message; }

    void add_context(const std::string& line) {
        m_context.insert(m_context.begin(), line);
        rebuild();
    }

    const char* what() const noexcept override { return m_full.c_str(); }

private:
    void rebuild() {
        if (m_context.empty()) { m_full = m_message; return; }
        m_full = m_context.front();
        m_full += "\n\nCaused by:";
        for (size_t i = 1; i < m_context.size(); ++i) m_full += "\n    " + m_context[i];
        m_full += "\n    " + m_message;
    }

    std::string m_message;
    std::vector<std::string> m_context;
    std::string m_full;
};

// Bad user input: malformed flag, unexpected token, bad number, missing argument,
// unknown command or property.
class ArgumentError : public Error {
public:
    using Error::Error;
};

// A fragment referenced a binding that was never provided, or a fragment is
// malformed. Always a bug in the fragment catalog or in the step renderer.
class RenderError : public Error {
public:
    using Error::Error;
};

// Bus connection, authentication, error replies and reply timeouts.
class IpcError : public Error {
public:
    using Error::Error;
};

} // namespace winpipe
