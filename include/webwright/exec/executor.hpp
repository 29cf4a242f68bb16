/*
 * Command executor - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <webwright/exec/result.hpp>
#include <webwright/lex/lexer.hpp>
#include <webwright/shell/state.hpp>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace webwright {

struct ExecutorConfig {
    std::chrono::milliseconds timeout{std::chrono::seconds(300)};
    std::string shell_path = "/bin/sh";
    const std::atomic<bool>* cancel = nullptr; // set by the SIGINT handler
    bool foreground_terminal = false;
};

// Runs one command line against the session: built-ins in process, everything
// else through the OS shell with the session's cwd and environment. Never
// throws for command-level failures.
class Executor {
public:
    Executor(SessionState& state, ExecutorConfig cfg = {}) : m_state(state), m_cfg(std::move(cfg)) {}

    CommandResult execute(const std::string& text);

    const ExecutorConfig& config() const { return m_cfg; }

private:
    CommandResult run_andor(const std::vector<ListSegment>& segments);
    CommandResult run_segment(const std::string& text);
    CommandResult run_external(const std::vector<std::string>& stages);
    std::optional<std::vector<std::string>> builtin_argv(const std::string& text, std::string& error);
    std::string expand_word(const std::string& raw);
    std::string substitute(const std::string& body);
    std::string expand_alias(const std::string& text) const;
    std::optional<std::string> shell_executable() const;

    SessionState& m_state;
    ExecutorConfig m_cfg;
    std::string m_subst_err;
};

// Bare interpreter names ("sh", "bash", ...) that are skipped with a zero result.
bool is_bare_interpreter(const std::string& text);

// False when the line opens with a shell reserved word or a grouping
// (`if`, `for`, `case`, `{`, `(` ...), so it cannot be run piece by piece.
bool is_simple_command(const std::string& text);

} // namespace webwright
