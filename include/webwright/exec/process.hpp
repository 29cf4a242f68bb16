/*
 * Process chain runner - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace webwright {

struct ProcessOptions {
    std::string cwd;                      // empty: inherit
    std::vector<std::string> env;         // NAME=VALUE snapshot passed to execve
    std::chrono::milliseconds timeout{std::chrono::seconds(300)};
    const std::atomic<bool>* cancel = nullptr;
    bool inherit_stdin = true;            // otherwise the first stage reads /dev/null
    bool foreground_terminal = false;     // hand the tty to the chain while it runs
};

struct ProcessOutcome {
    int exit_code = 0;
    std::string out;
    std::string err;
    bool timed_out = false;
    bool interrupted = false;
    bool launch_failed = false;
};

// Runs a strictly linear chain of processes: stage i stdout feeds stage i+1
// stdin, the last stage stdout is captured, every stage stderr is captured
// and concatenated in stage order. All stages share one process group, are
// started before any output is read, and are reaped before returning. The
// timeout covers the whole chain. argv[0] must be an absolute path.
ProcessOutcome run_chain(const std::vector<std::vector<std::string>>& stages, const ProcessOptions& opts);

// Convenience: every stage is `shell -c <stage text>`.
ProcessOutcome run_shell_pipeline(const std::string& shell, const std::vector<std::string>& stages, const ProcessOptions& opts);

} // namespace webwright
