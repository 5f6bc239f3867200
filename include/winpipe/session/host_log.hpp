/*
 * Host log retrieval - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>

namespace winpipe::session {

// journalctl argv selecting KWin script output since the given local time.
std::vector<std::string> host_log_command(const std::string& since);

// Runs host_log_command and returns its output. Never throws; any failure yields "".
std::string fetch_host_log(const std::string& since);

// "YYYY-MM-DD HH:MM:SS" for the current local time.
std::string journal_timestamp();

} // namespace winpipe::session
