/*
 * winpipe Configuration
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace winpipe::session {

enum class HostVersion { Auto, Kde5, Kde6 };

struct Config {
    bool debug = false;
    HostVersion host_version = HostVersion::Auto;
    int reply_timeout_ms = 5000;
    int completion_timeout_ms = 2000;
    bool keep_script = false;
};

// $WINPIPE_CONFIG if set, else ~/.winpiperc; empty when neither is known.
std::string default_config_path();

// Missing file yields defaults. Unknown keys and malformed values are logged and skipped.
Config load_config(const std::string& path);

} // namespace winpipe::session
