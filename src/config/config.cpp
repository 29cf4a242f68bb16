/*
 * Shell configuration implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/config/config.hpp>
#include <webwright/util/log.hpp>
#include <webwright/util/text.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace webwright {

static std::string getenv_or(const char* k, const std::string& def = "") {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

std::string default_config_path() {
    std::string explicit_path = getenv_or("WEBWRIGHT_CONFIG");
    if (!explicit_path.empty()) return explicit_path;
    std::string home = getenv_or("HOME");
    if (home.empty()) return {};
    return home + "/.webwrightrc";
}

bool parse_bool(const std::string& value) {
    std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "on" || v == "yes";
}

static bool parse_int(const std::string& key, const std::string& value, int min, int& out) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size() || v < min) throw std::invalid_argument(value);
        out = v;
        return true;
    } catch (const std::exception&) {
        log::warn("config: " + key + ": invalid number '" + value + "', keeping " + std::to_string(out));
        return false;
    }
}

static bool parse_double(const std::string& key, const std::string& value, double& out) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        out = v;
        return true;
    } catch (const std::exception&) {
        log::warn("config: " + key + ": invalid number '" + value + "'");
        return false;
    }
}

bool apply_config_value(ShellConfig& cfg, const std::string& key, const std::string& val) {
    if (key == "prompt_format") cfg.prompt_format = val;
    else if (key == "color") cfg.color = parse_bool(val);
    else if (key == "debug") cfg.debug = parse_bool(val);
    else if (key == "default_mode") {
        if (auto m = parse_mode(val)) cfg.default_mode = *m;
        else log::warn("config: default_mode: invalid mode '" + val + "'");
    }
    else if (key == "command_timeout") parse_int(key, val, 1, cfg.command_timeout);
    else if (key == "shell_path") cfg.shell_path = val;
    else if (key == "history_context") parse_int(key, val, 0, cfg.history_context);
    else if (key == "confirm_risky") cfg.confirm_risky = parse_bool(val);
    else if (key == "llm_provider") cfg.llm_provider = to_lower(val);
    else if (key == "llm_model") cfg.llm_model = val;
    else if (key == "llm_endpoint") cfg.llm_endpoint = val;
    else if (key == "llm_api_key_env") cfg.llm_api_key_env = val;
    else if (key == "llm_api_key") cfg.llm_api_key = val;
    else if (key == "llm_stub_file") cfg.llm_stub_file = val;
    else if (key == "llm_timeout") parse_int(key, val, 1, cfg.llm_timeout);
    else if (key == "llm_max_tokens") parse_int(key, val, 1, cfg.llm_max_tokens);
    else if (key == "llm_temperature") parse_double(key, val, cfg.llm_temperature);
    else return false;
    return true;
}

ShellConfig load_config(const std::string& path) {
    ShellConfig cfg;
    if (path.empty()) return cfg;
    std::ifstream in(path);
    if (!in) {
        log::debug("config: no file at " + path);
        return cfg;
    }
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto eq = t.find('=');
        if (eq == std::string::npos) {
            log::warn("config: " + path + ":" + std::to_string(lineno) + ": missing '='");
            continue;
        }
        std::string key = trim(t.substr(0, eq));
        std::string val = trim(t.substr(eq + 1));
        if (!apply_config_value(cfg, key, val)) log::debug("config: unknown key '" + key + "'");
    }
    return cfg;
}

ai::LLMConfig to_llm_config(const ShellConfig& cfg) {
    ai::LLMConfig l;
    l.enabled = cfg.llm_provider != "none" && !cfg.llm_provider.empty();
    l.provider = cfg.llm_provider;
    l.model = cfg.llm_model;
    l.endpoint = cfg.llm_endpoint;
    l.api_key_env = cfg.llm_api_key_env;
    l.api_key = cfg.llm_api_key;
    l.stub_file = cfg.llm_stub_file;
    l.max_tokens = cfg.llm_max_tokens;
    l.temperature = cfg.llm_temperature;
    l.timeout_seconds = cfg.llm_timeout;
    return l;
}

} // namespace webwright
