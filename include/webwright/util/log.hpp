/*
 * Logging helpers - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace webwright::log {

// Diagnostics go to stderr only; stdout carries command output.
void set_debug(bool on);
bool debug_enabled();

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace webwright::log
