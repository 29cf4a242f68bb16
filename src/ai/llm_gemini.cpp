/*
 * Gemini generateContent client - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/ai/llm.hpp>
#include <webwright/ai/http.hpp>
#include <webwright/ai/json_text.hpp>
#include <sstream>

namespace webwright::ai {

namespace {

class GeminiLLMClient : public LLMClient {
public:
    explicit GeminiLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}

    std::optional<LLMCompletion> complete(const std::string& system, const std::string& prompt) override {
        std::string reason;
        std::string key = resolve_api_key(m_cfg, reason);
        if (key.empty()) return LLMCompletion{reason, "error"};
        // POST <base><model>:generateContent, key in the x-goog-api-key header
        std::string model = m_cfg.model.empty() ? "gemini-1.5-flash" : m_cfg.model;
        std::string base = m_cfg.endpoint.empty() ? "https://generativelanguage.googleapis.com/v1beta/models/" : m_cfg.endpoint;
        std::ostringstream body;
        body << "{\"systemInstruction\":{\"parts\":[{\"text\":\"" << json_escape(system) << "\"}]},"
             << "\"contents\":[{\"role\":\"user\",\"parts\":[{\"text\":\"" << json_escape(prompt) << "\"}]}],"
             << "\"generationConfig\":{\"temperature\":" << m_cfg.temperature << ",\"maxOutputTokens\":" << m_cfg.max_tokens << "}}";
        auto resp = http_post_json(base + model + ":generateContent", {"x-goog-api-key: " + key},
                                   body.str(), m_cfg.timeout_seconds);
        if (!resp.ok()) return LLMCompletion{provider_error("gemini", resp), "error"};
        std::optional<std::string> text;
        if (auto candidates = json_find_key(resp.body, "candidates")) text = json_string_field(resp.body, "text", *candidates);
        if (!text || text->empty()) return LLMCompletion{"(parse-empty)", "error"};
        return LLMCompletion{*text, "gemini",
                             json_int_field(resp.body, "promptTokenCount"),
                             json_int_field(resp.body, "candidatesTokenCount"),
                             json_int_field(resp.body, "totalTokenCount")};
    }

private:
    LLMConfig m_cfg;
};

} // namespace

std::unique_ptr<LLMClient> make_gemini_client(const LLMConfig& cfg) {
    return std::make_unique<GeminiLLMClient>(cfg);
}

} // namespace webwright::ai
