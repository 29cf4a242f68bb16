/*
 * Anthropic messages client - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/ai/llm.hpp>
#include <webwright/ai/http.hpp>
#include <webwright/ai/json_text.hpp>
#include <sstream>

namespace webwright::ai {

namespace {

class ClaudeLLMClient : public LLMClient {
public:
    explicit ClaudeLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}

    std::optional<LLMCompletion> complete(const std::string& system, const std::string& prompt) override {
        std::string reason;
        std::string key = resolve_api_key(m_cfg, reason);
        if (key.empty()) return LLMCompletion{reason, "error"};
        std::string endpoint = m_cfg.endpoint.empty() ? "https://api.anthropic.com/v1/messages" : m_cfg.endpoint;
        // {model, max_tokens, system, messages:[{role:"user",content:[{type:"text",text:"..."}]}]}
        std::ostringstream body;
        body << "{\"model\":\"" << json_escape(m_cfg.model.empty() ? "claude-3-haiku-20240307" : m_cfg.model) << "\","
             << "\"max_tokens\":" << m_cfg.max_tokens << ",\"temperature\":" << m_cfg.temperature << ","
             << "\"system\":\"" << json_escape(system) << "\","
             << "\"messages\":[{\"role\":\"user\",\"content\":[{\"type\":\"text\",\"text\":\"" << json_escape(prompt) << "\"}]}]}";
        auto resp = http_post_json(endpoint, {"x-api-key: " + key, "anthropic-version: 2023-06-01"},
                                   body.str(), m_cfg.timeout_seconds);
        if (!resp.ok()) return LLMCompletion{provider_error("claude", resp), "error"};
        std::optional<std::string> text;
        if (auto content = json_find_key(resp.body, "content")) text = json_string_field(resp.body, "text", *content);
        if (!text || text->empty()) return LLMCompletion{"(parse-empty)", "error"};
        int prompt_tokens = json_int_field(resp.body, "input_tokens");
        int completion_tokens = json_int_field(resp.body, "output_tokens");
        int total = (prompt_tokens >= 0 && completion_tokens >= 0) ? prompt_tokens + completion_tokens : -1;
        return LLMCompletion{*text, "claude", prompt_tokens, completion_tokens, total};
    }

private:
    LLMConfig m_cfg;
};

} // namespace

std::unique_ptr<LLMClient> make_claude_client(const LLMConfig& cfg) {
    return std::make_unique<ClaudeLLMClient>(cfg);
}

} // namespace webwright::ai
