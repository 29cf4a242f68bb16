/*
 * Built-in commands - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <webwright/exec/result.hpp>
#include <webwright/shell/state.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace webwright {

// argv[0] is the built-in name; the remaining words are already expanded.
using BuiltinHandler = CommandResult (*)(const std::vector<std::string>& argv, SessionState& state);

const std::map<std::string, BuiltinHandler>& builtin_table();

bool is_builtin(const std::string& name);

// Returns nullopt if argv[0] is not a builtin.
std::optional<CommandResult> run_builtin(const std::vector<std::string>& argv, SessionState& state);

} // namespace webwright
