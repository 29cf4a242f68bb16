/*
 * LLM client factory and stub - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/ai/llm.hpp>
#include <webwright/util/log.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace webwright::ai {

std::optional<LLMCompletion> StubLLMClient::complete(const std::string&, const std::string&) {
    if (!m_cfg.stub_file.empty()) {
        std::ifstream in(m_cfg.stub_file);
        if (in) {
            std::ostringstream oss;
            oss << in.rdbuf();
            std::string data = oss.str();
            if (!data.empty()) return LLMCompletion{data, "stub_file"};
        }
        log::warn("llm_stub_file not readable: " + m_cfg.stub_file);
    }
    // comment only: nothing gets executed without a provider
    return LLMCompletion{"# no LLM provider configured (set llm_provider in ~/.webwrightrc)\n", "stub_plain"};
}

std::string resolve_api_key(const LLMConfig& cfg, std::string& reason) {
    const char* env_key = nullptr;
    if (!cfg.api_key_env.empty()) env_key = std::getenv(cfg.api_key_env.c_str());
    if (env_key && *env_key) return env_key;
    if (!cfg.api_key.empty()) return cfg.api_key;
    if (cfg.api_key_env.empty()) reason = "(no-key-direct)";
    // the key itself pasted where the variable name belongs
    else if (cfg.api_key_env.rfind("sk-", 0) == 0) reason = "(misconfigured-env-key-name)";
    else if (env_key == nullptr) reason = "(env-missing:" + cfg.api_key_env + ")";
    else reason = "(env-empty:" + cfg.api_key_env + ")";
    return {};
}

std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg) {
    if (cfg.enabled) {
        if (cfg.provider == "openai") return make_openai_client(cfg);
        if (cfg.provider == "ollama") return make_ollama_client(cfg);
        if (cfg.provider == "claude") return make_claude_client(cfg);
        if (cfg.provider == "gemini") return make_gemini_client(cfg);
        if (cfg.provider != "none") log::warn("unknown llm_provider '" + cfg.provider + "', using stub");
    }
    return std::make_unique<StubLLMClient>(cfg);
}

} // namespace webwright::ai
