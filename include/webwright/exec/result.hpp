/*
 * Command result - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace webwright {

inline constexpr int kExitTimeout = 124;       // same as timeout(1)
inline constexpr int kExitLaunchFailure = 126;
inline constexpr int kExitNotFound = 127;
inline constexpr int kExitInterrupted = 130;   // 128 + SIGINT
inline constexpr int kExitSyntax = 2;

// Value returned by every execution, built-in or external.
struct CommandResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::string command;

    bool ok() const { return exit_code == 0; }
};

} // namespace webwright
