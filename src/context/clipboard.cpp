/*
 * Clipboard access implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/context/clipboard.hpp>
#include <webwright/exec/path.hpp>
#include <webwright/exec/process.hpp>
#include <webwright/util/log.hpp>

namespace webwright {

const std::vector<std::vector<std::string>>& SystemClipboard::candidates() {
    static const std::vector<std::vector<std::string>> tools = {
        {"wl-paste", "--no-newline"},
        {"xclip", "-selection", "clipboard", "-o"},
        {"xsel", "--clipboard", "--output"},
        {"pbpaste"},
    };
    return tools;
}

std::optional<std::string> SystemClipboard::read() {
    auto path = m_state.env("PATH");
    for (auto& tool : candidates()) {
        auto exe = resolve_executable(tool[0], path ? *path : std::string());
        if (!exe) continue;
        std::vector<std::string> argv = tool;
        argv[0] = *exe;
        ProcessOptions opts;
        opts.cwd = m_state.working_directory();
        opts.env = m_state.env_block();
        opts.timeout = m_timeout;
        opts.inherit_stdin = false;
        auto outcome = run_chain({argv}, opts);
        if (outcome.exit_code == 0) return outcome.out;
        log::debug(tool[0] + " exited with " + std::to_string(outcome.exit_code));
    }
    return std::nullopt;
}

} // namespace webwright
