/*
 * Assistant mode handler implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/ai/assistant.hpp>
#include <webwright/util/log.hpp>

namespace webwright::ai {

CommandResult StubAssistant::handle(const std::string& request, SessionState& state) {
    log::debug(std::string("[AI] assistant request in ") + mode_name(state.mode()) + " mode: " + request);
    CommandResult r;
    r.command = "ai: " + request;
    r.stdout_text = "AI mode not yet implemented\n";
    if (!request.empty()) r.stdout_text += "Request: " + request + "\n";
    return r;
}

} // namespace webwright::ai
