/*
 * LLM client interface - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <memory>
#include <optional>
#include <string>

namespace webwright::ai {

struct LLMConfig {
    bool enabled = false;            // provider != none
    std::string provider = "none";  // openai, ollama, claude, gemini
    std::string model;               // model id
    std::string endpoint;            // HTTP endpoint override
    std::string api_key_env;         // env var containing key
    std::string api_key;             // direct key (less secure; prefer env)
    std::string stub_file;           // canned reply for offline use
    int max_tokens = 512;
    double temperature = 0.2;
    int timeout_seconds = 20;        // network timeout
};

struct LLMCompletion {
    std::string text;                // model text, or a "(... error ...)" diagnostic
    std::string source;              // openai|ollama|claude|gemini|stub_file|stub_plain|error
    int prompt_tokens = -1;
    int completion_tokens = -1;
    int total_tokens = -1;

    bool failed() const { return source == "error"; }
};

class LLMClient {
public:
    virtual ~LLMClient() = default;
    virtual std::optional<LLMCompletion> complete(const std::string& system, const std::string& prompt) = 0;
};

// Returns stub_file contents when readable, otherwise a plain echo comment.
class StubLLMClient : public LLMClient {
public:
    explicit StubLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& system, const std::string& prompt) override;
private:
    LLMConfig m_cfg;
};

// Key from api_key_env (preferred) or api_key. On failure `reason` gets an
// in-band diagnostic such as "(env-missing:OPENAI_API_KEY)".
std::string resolve_api_key(const LLMConfig& cfg, std::string& reason);

std::unique_ptr<LLMClient> make_openai_client(const LLMConfig& cfg);
std::unique_ptr<LLMClient> make_ollama_client(const LLMConfig& cfg);
std::unique_ptr<LLMClient> make_claude_client(const LLMConfig& cfg);
std::unique_ptr<LLMClient> make_gemini_client(const LLMConfig& cfg);

// Provider switch; falls back to the stub for "none" or unknown names.
std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg);

} // namespace webwright::ai
