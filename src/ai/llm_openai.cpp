/*
 * OpenAI chat completions client - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/ai/llm.hpp>
#include <webwright/ai/http.hpp>
#include <webwright/ai/json_text.hpp>
#include <sstream>

namespace webwright::ai {

namespace {

class OpenAILLMClient : public LLMClient {
public:
    explicit OpenAILLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}

    std::optional<LLMCompletion> complete(const std::string& system, const std::string& prompt) override {
        std::string reason;
        std::string key = resolve_api_key(m_cfg, reason);
        if (key.empty()) return LLMCompletion{reason, "error"};
        std::string endpoint = m_cfg.endpoint.empty() ? "https://api.openai.com/v1/chat/completions" : m_cfg.endpoint;
        std::ostringstream body;
        body << "{\"model\":\"" << json_escape(m_cfg.model.empty() ? "gpt-4o-mini" : m_cfg.model) << "\","
             << "\"messages\":[{\"role\":\"system\",\"content\":\"" << json_escape(system) << "\"},"
             << "{\"role\":\"user\",\"content\":\"" << json_escape(prompt) << "\"}],"
             << "\"temperature\":" << m_cfg.temperature << ",\"max_tokens\":" << m_cfg.max_tokens << "}";
        auto resp = http_post_json(endpoint, {"Authorization: Bearer " + key}, body.str(), m_cfg.timeout_seconds);
        if (!resp.ok()) return LLMCompletion{provider_error("openai", resp), "error"};

        // choices[0].message.content
        std::optional<std::string> content;
        if (auto choices = json_find_key(resp.body, "choices")) {
            if (auto message = json_find_key(resp.body, "message", *choices))
                content = json_string_field(resp.body, "content", *message);
        }
        if (!content || content->empty()) {
            return LLMCompletion{"(parse-empty) RAW:" + resp.body.substr(0, 2048), "error"};
        }
        return LLMCompletion{*content, "openai",
                             json_int_field(resp.body, "prompt_tokens"),
                             json_int_field(resp.body, "completion_tokens"),
                             json_int_field(resp.body, "total_tokens")};
    }

private:
    LLMConfig m_cfg;
};

} // namespace

std::unique_ptr<LLMClient> make_openai_client(const LLMConfig& cfg) {
    return std::make_unique<OpenAILLMClient>(cfg);
}

} // namespace webwright::ai
