/*
 * Natural language to command translation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <webwright/ai/llm.hpp>
#include <webwright/shell/state.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace webwright::ai {

struct TranslationContext {
    std::string cwd;
    std::vector<std::string> recent_history;  // oldest first
    std::string platform;                     // e.g. "Linux 6.1.0"
    std::string shell;                        // interpreter external commands run under
    std::optional<LastCommand> last;          // output already cut to tails
    std::vector<std::string> blocks;          // rendered context blocks
};

// Text-to-text service: request in, command lines (and # comments) out.
class TranslationGateway {
public:
    virtual ~TranslationGateway() = default;
    // nullopt when the service failed; the reason has been logged.
    virtual std::optional<std::string> translate(const std::string& request, const TranslationContext& ctx) = 0;
};

class LlmTranslator : public TranslationGateway {
public:
    explicit LlmTranslator(std::unique_ptr<LLMClient> client) : m_client(std::move(client)) {}
    std::optional<std::string> translate(const std::string& request, const TranslationContext& ctx) override;

    static const std::string& system_prompt();
    static std::string build_prompt(const std::string& request, const TranslationContext& ctx);

private:
    std::unique_ptr<LLMClient> m_client;
};

// Unwraps a fenced reply: a block tagged bash/sh/shell/zsh/console wins,
// otherwise the first fenced block. Unfenced text is only trimmed.
std::string clean_output(const std::string& text);

// Trimmed lines that are neither empty nor '#' comments, in order.
std::vector<std::string> extract_commands(const std::string& text);

} // namespace webwright::ai
