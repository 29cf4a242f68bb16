/*
 * Logging helpers implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/util/log.hpp>
#include <atomic>
#include <iostream>

namespace webwright::log {

static std::atomic<bool> g_debug{false};

void set_debug(bool on) { g_debug = on; }
bool debug_enabled() { return g_debug; }

void debug(const std::string& msg) {
    if (!g_debug) return;
    std::cerr << "[DEBUG] " << msg << '\n';
}

void info(const std::string& msg) { std::cerr << msg << '\n'; }
void warn(const std::string& msg) { std::cerr << "[warn] " << msg << '\n'; }
void error(const std::string& msg) { std::cerr << "[error] " << msg << '\n'; }

} // namespace webwright::log
