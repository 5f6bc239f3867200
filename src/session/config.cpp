/*
 * winpipe Configuration
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <winpipe/session/config.hpp>
#include <winpipe/cli/args.hpp>
#include <winpipe/util/error.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

namespace winpipe::session {

namespace {

std::string getenv_or(const char* k, const std::string& def = "") {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

bool as_bool(const std::string& v) { return v == "1" || v == "true" || v == "on"; }

void set_timeout(int& slot, const std::string& key, const std::string& val) {
    try {
        int ms = parse_int(val);
        if (ms <= 0) {
            spdlog::warn("config: {} must be positive, got '{}'", key, val);
            return;
        }
        slot = ms;
    } catch (const ArgumentError& e) {
        spdlog::warn("config: {}: {}", key, e.what());
    }
}

} // namespace

std::string default_config_path() {
    std::string explicit_path = getenv_or("WINPIPE_CONFIG");
    if (!explicit_path.empty()) return explicit_path;
    std::string home = getenv_or("HOME");
    if (home.empty()) return "";
    return home + "/.winpiperc";
}

Config load_config(const std::string& path) {
    Config cfg;
    if (path.empty()) return cfg;
    std::ifstream in(path);
    if (!in) return cfg;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) { spdlog::warn("config: ignoring line '{}'", line); continue; }
        auto key = trim(line.substr(0, eq));
        auto val = trim(line.substr(eq + 1));
        if (key == "debug") cfg.debug = as_bool(val);
        else if (key == "keep_script") cfg.keep_script = as_bool(val);
        else if (key == "reply_timeout_ms") set_timeout(cfg.reply_timeout_ms, key, val);
        else if (key == "completion_timeout_ms") set_timeout(cfg.completion_timeout_ms, key, val);
        else if (key == "host_version") {
            if (val == "auto") cfg.host_version = HostVersion::Auto;
            else if (val == "5") cfg.host_version = HostVersion::Kde5;
            else if (val == "6") cfg.host_version = HostVersion::Kde6;
            else spdlog::warn("config: host_version must be auto, 5 or 6, got '{}'", val);
        }
        else spdlog::warn("config: unknown key '{}'", key);
    }
    return cfg;
}

} // namespace winpipe::session
