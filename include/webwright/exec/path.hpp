/*
 * PATH resolution utilities - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace webwright {

// Resolve command name to absolute path using the given PATH value.
// If cmd contains '/' it is returned when it names an executable file.
std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& path_value);

} // namespace webwright
