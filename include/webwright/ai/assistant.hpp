/*
 * Assistant mode handler - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <webwright/exec/result.hpp>
#include <webwright/shell/state.hpp>
#include <string>

namespace webwright::ai {

// Receives the request with the "ai:" prefix already removed.
class AssistantHandler {
public:
    virtual ~AssistantHandler() = default;
    virtual CommandResult handle(const std::string& request, SessionState& state) = 0;
};

// Placeholder: acknowledges the request and runs nothing.
class StubAssistant : public AssistantHandler {
public:
    CommandResult handle(const std::string& request, SessionState& state) override;
};

} // namespace webwright::ai
