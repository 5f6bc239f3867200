/*
 * Logging setup - winpipe
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <spdlog/spdlog.h>

namespace winpipe {

// Installs the "winpipe" stderr logger as spdlog's default logger. Standard
// output is reserved for script results.
void init_logging(bool debug);

} // namespace winpipe
