/*
 * Translated command risk policy - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace webwright {

// Read-only commands (ls, pwd, cat, git status, ...) matched on word boundaries.
bool is_safe_command(const std::string& cmd);

// Commands that change files, services or remote state (rm, mv, sudo, git push, ...).
bool is_risky_command(const std::string& cmd);

// Translated line may run without confirmation.
bool should_autorun(const std::string& cmd);

// "run it", "go ahead", ... (case-insensitive, surrounding blanks ignored).
bool is_rerun_phrase(const std::string& text);

} // namespace webwright
