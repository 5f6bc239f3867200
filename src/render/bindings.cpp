/*
 * Template bindings - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <winpipe/render/bindings.hpp>

namespace winpipe::render {

Bindings Bindings::with(const std::string& key, Value value) const {
    Bindings out = *this;
    out.m_values[key] = std::move(value);
    return out;
}

const Value* Bindings::find(const std::string& key) const {
    auto it = m_values.find(key);
    return it == m_values.end() ? nullptr : &it->second;
}

std::string to_text(const Value& v) {
    if (auto b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (auto i = std::get_if<std::int64_t>(&v)) return std::to_string(*i);
    return std::get<std::string>(v);
}

bool is_truthy(const Value& v) {
    if (auto b = std::get_if<bool>(&v)) return *b;
    if (auto i = std::get_if<std::int64_t>(&v)) return *i != 0;
    return !std::get<std::string>(v).empty();
}

} // namespace winpipe::render
