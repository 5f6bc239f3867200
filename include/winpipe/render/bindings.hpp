/*
 * Template bindings - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Flat key/value record bound into fragment placeholders. A record is never
 *   modified after construction: with() returns an extended copy, so every step
 *   layers its own fields on top of the session's base record.
 */
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace winpipe::render {

using Value = std::variant<bool, std::int64_t, std::string>;

class Bindings {
public:
    Bindings() = default;

    Bindings with(const std::string& key, Value value) const;
    Bindings with(const std::string& key, bool value) const { return with(key, Value{value}); }
    Bindings with(const std::string& key, int value) const { return with(key, Value{std::int64_t{value}}); }
    Bindings with(const std::string& key, unsigned value) const { return with(key, Value{std::int64_t{value}}); }
    Bindings with(const std::string& key, std::int64_t value) const { return with(key, Value{value}); }
    Bindings with(const std::string& key, const char* value) const { return with(key, Value{std::string(value)}); }
    Bindings with(const std::string& key, const std::string& value) const { return with(key, Value{value}); }

    const Value* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }
    std::size_t size() const { return m_values.size(); }

private:
    std::map<std::string, Value> m_values;
};

// "true"/"false", decimal integers, strings verbatim.
std::string to_text(const Value& v);
// false, 0 and "" are falsy.
bool is_truthy(const Value& v);

} // namespace winpipe::render
