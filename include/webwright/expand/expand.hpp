/*
 * Webwright Expansion Utilities
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 * Description: ~ and $VAR/${VAR} expansion for built-in arguments and file
 *              references, plus path globbing (*, ?, [...], **).
 */
#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace webwright {

using VariableLookup = std::function<std::optional<std::string>(const std::string&)>;

std::string expand_tilde(const std::string& word, const std::string& home);
std::string expand_variables(const std::string& word, const VariableLookup& lookup);

bool has_glob_chars(const std::string& s);

// Expands an absolute path pattern against the file system. Components may use
// *, ? and [...]; a "**" component matches zero or more directories. Hidden
// entries only match components that start with '.'. Result is sorted and
// contains existing paths only.
std::vector<std::string> glob_paths(const std::string& absolute_pattern);

} // namespace webwright
