/*
 * Ollama generate client - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/ai/llm.hpp>
#include <webwright/ai/http.hpp>
#include <webwright/ai/json_text.hpp>
#include <sstream>

namespace webwright::ai {

namespace {

class OllamaLLMClient : public LLMClient {
public:
    explicit OllamaLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}

    std::optional<LLMCompletion> complete(const std::string& system, const std::string& prompt) override {
        std::string endpoint = m_cfg.endpoint.empty() ? "http://localhost:11434/api/generate" : m_cfg.endpoint;
        // {"model":"<model>","system":"...","prompt":"...","stream":false}
        std::ostringstream body;
        body << "{\"model\":\"" << json_escape(m_cfg.model.empty() ? "llama2" : m_cfg.model) << "\","
             << "\"system\":\"" << json_escape(system) << "\","
             << "\"prompt\":\"" << json_escape(prompt) << "\","
             << "\"options\":{\"temperature\":" << m_cfg.temperature << ",\"num_predict\":" << m_cfg.max_tokens << "},"
             << "\"stream\":false}";
        auto resp = http_post_json(endpoint, {}, body.str(), m_cfg.timeout_seconds);
        if (!resp.ok()) return LLMCompletion{provider_error("ollama", resp), "error"};
        auto text = json_string_field(resp.body, "response");
        if (!text || text->empty()) return LLMCompletion{"(parse-empty)", "error"};
        int prompt_tokens = json_int_field(resp.body, "prompt_eval_count");
        int completion_tokens = json_int_field(resp.body, "eval_count");
        int total = (prompt_tokens >= 0 && completion_tokens >= 0) ? prompt_tokens + completion_tokens : -1;
        return LLMCompletion{*text, "ollama", prompt_tokens, completion_tokens, total};
    }

private:
    LLMConfig m_cfg;
};

} // namespace

std::unique_ptr<LLMClient> make_ollama_client(const LLMConfig& cfg) {
    return std::make_unique<OllamaLLMClient>(cfg);
}

} // namespace webwright::ai
