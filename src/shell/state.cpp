/*
 * Session state implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/shell/state.hpp>
#include <webwright/util/log.hpp>
#include <webwright/util/text.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace webwright {
namespace fs = std::filesystem;

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Shell: return "shell";
        case Mode::NaturalLanguage: return "nl";
        case Mode::Assistant: return "ai";
    }
    return "nl";
}

std::optional<Mode> parse_mode(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "shell") return Mode::Shell;
    if (n == "nl" || n == "natural-language") return Mode::NaturalLanguage;
    if (n == "ai" || n == "assistant") return Mode::Assistant;
    return std::nullopt;
}

const std::vector<std::string>& valid_mode_names() {
    static const std::vector<std::string> names = {"shell", "nl", "ai"};
    return names;
}

static bool valid_env_name(const std::string& name) {
    return !name.empty() && name.find('=') == std::string::npos && name.find('\0') == std::string::npos;
}

SessionState::SessionState(HostEnvironment& host, Mode mode)
    : m_host(host), m_cwd(host.initial_directory()), m_env(host.initial_environment()), m_mode(mode) {}

std::optional<std::string> SessionState::env(const std::string& name) const {
    auto it = m_env.find(name);
    if (it == m_env.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> SessionState::alias(const std::string& name) const {
    auto it = m_aliases.find(name);
    if (it == m_aliases.end()) return std::nullopt;
    return it->second;
}

std::optional<Error> SessionState::set_working_directory(const std::string& path) {
    fs::path target(path);
    if (!target.is_absolute()) target = fs::path(m_cwd) / target;
    target = target.lexically_normal();
    std::string normalized = target.string();
    while (normalized.size() > 1 && normalized.back() == '/') normalized.pop_back();

    std::error_code ec;
    if (!fs::is_directory(normalized, ec) || ec) {
        return Error{ErrorKind::DirectoryNotFound, "cd: " + normalized + ": No such directory"};
    }
    if (!m_host.change_directory(normalized)) {
        return Error{ErrorKind::DirectoryNotFound, "cd: " + normalized + ": " + std::strerror(errno)};
    }
    std::string previous = m_cwd;
    m_cwd = normalized;
    // keep PWD/OLDPWD coherent for children and `cd -`
    if (auto err = set_env_var("OLDPWD", previous)) log::warn(err->message);
    if (auto err = set_env_var("PWD", m_cwd)) log::warn(err->message);
    log::debug("cwd -> " + m_cwd);
    return std::nullopt;
}

std::optional<Error> SessionState::set_env_var(const std::string& name, const std::string& value) {
    if (!valid_env_name(name)) {
        return Error{ErrorKind::InvalidEnvName, "export: invalid variable name: '" + name + "'"};
    }
    if (!m_host.set_env(name, value)) {
        return Error{ErrorKind::InvalidEnvName, "export: " + name + ": " + std::strerror(errno)};
    }
    m_env[name] = value;
    return std::nullopt;
}

std::optional<Error> SessionState::unset_env_var(const std::string& name) {
    if (!valid_env_name(name)) {
        return Error{ErrorKind::InvalidEnvName, "unset: invalid variable name: '" + name + "'"};
    }
    if (!m_host.unset_env(name)) {
        return Error{ErrorKind::InvalidEnvName, "unset: " + name + ": " + std::strerror(errno)};
    }
    m_env.erase(name);
    return std::nullopt;
}

void SessionState::set_mode(Mode mode) {
    m_mode = mode;
    log::debug(std::string("mode -> ") + mode_name(mode));
}

void SessionState::append_history(const std::string& input) { m_history.push_back(input); }

void SessionState::set_last_exit_code(int code) { m_last_exit_code = code; }

std::optional<Error> SessionState::set_alias(const std::string& name, const std::string& value) {
    if (name.empty() || name.find_first_of("= \t/") != std::string::npos) {
        return Error{ErrorKind::InvalidEnvName, "alias: invalid alias name: '" + name + "'"};
    }
    m_aliases[name] = value;
    return std::nullopt;
}

bool SessionState::remove_alias(const std::string& name) { return m_aliases.erase(name) > 0; }

void SessionState::record_result(LastCommand last) { m_last_command = std::move(last); }

void SessionState::set_pending_commands(std::vector<std::string> commands) { m_pending = std::move(commands); }

std::optional<std::string> SessionState::pop_pending_command() {
    if (m_pending.empty()) return std::nullopt;
    std::string front = m_pending.front();
    m_pending.erase(m_pending.begin());
    return front;
}

void SessionState::clear_pending_commands() { m_pending.clear(); }

void SessionState::request_exit(int status) {
    m_exit_requested = true;
    m_exit_status = status;
}

std::vector<std::string> SessionState::env_block() const {
    std::vector<std::string> block; block.reserve(m_env.size());
    for (auto& [k, v] : m_env) block.push_back(k + "=" + v);
    return block;
}

std::string SessionState::home_directory() const {
    auto home = env("HOME");
    if (home && !home->empty()) return *home;
    return "/";
}

std::string SessionState::render_prompt(const std::string& format) const {
    std::string cwd = m_cwd;
    auto home = env("HOME");
    if (home && !home->empty() && home->size() > 1 && starts_with(cwd, *home)
        && (cwd.size() == home->size() || cwd[home->size()] == '/')) {
        cwd = "~" + cwd.substr(home->size());
    }
    std::string p = format;
    auto repl = [&](const std::string& tag, const std::string& val) {
        size_t pos = 0;
        while ((pos = p.find(tag, pos)) != std::string::npos) { p.replace(pos, tag.size(), val); pos += val.size(); }
    };
    repl("{user}", env("USER").value_or("user"));
    repl("{host}", env("HOSTNAME").value_or("webwright"));
    repl("{cwd}", cwd);
    repl("{mode}", mode_name(m_mode));
    repl("{status}", std::to_string(m_last_exit_code));
    return p;
}

} // namespace webwright
