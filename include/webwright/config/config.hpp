/*
 * Shell configuration - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 * Description: ~/.webwrightrc, one key=value per line, '#' comments.
 */
#pragma once
#include <webwright/ai/llm.hpp>
#include <webwright/shell/state.hpp>
#include <optional>
#include <string>

namespace webwright {

struct ShellConfig {
    std::string prompt_format = "{user}@{host} {cwd} [{mode}]$ ";
    bool color = true;
    bool debug = false;
    Mode default_mode = Mode::NaturalLanguage;
    int command_timeout = 300;        // seconds, whole pipeline
    std::string shell_path = "/bin/sh";
    int history_context = 5;          // recent inputs sent to the translator
    bool confirm_risky = false;       // queue risky translated lines
    // LLM translation gateway
    std::string llm_provider = "none";
    std::string llm_model;
    std::string llm_endpoint;
    std::string llm_api_key_env;
    std::string llm_api_key;          // direct key (NOT recommended; prefer env)
    std::string llm_stub_file;
    int llm_timeout = 20;
    int llm_max_tokens = 512;
    double llm_temperature = 0.2;
};

// $WEBWRIGHT_CONFIG if set, otherwise $HOME/.webwrightrc; empty without HOME.
std::string default_config_path();

// 1/true/on/yes (case-insensitive) is true; anything else false.
bool parse_bool(const std::string& value);

// Applies one key=value pair. Returns false for unknown keys; malformed
// values keep the previous setting and are reported with log::warn.
bool apply_config_value(ShellConfig& cfg, const std::string& key, const std::string& value);

// Missing file yields the defaults.
ShellConfig load_config(const std::string& path);

ai::LLMConfig to_llm_config(const ShellConfig& cfg);

} // namespace webwright
