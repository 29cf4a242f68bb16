/*
 * Session state - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <webwright/shell/error.hpp>
#include <webwright/shell/host.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace webwright {

enum class Mode { Shell, NaturalLanguage, Assistant };

// Canonical lowercase names: "shell", "nl", "ai".
const char* mode_name(Mode mode);
// Case-insensitive; also accepts "natural-language" and "assistant".
std::optional<Mode> parse_mode(const std::string& name);
const std::vector<std::string>& valid_mode_names();

struct LastCommand {
    std::string command;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

// Single owner of the mutable session record. Every mutation goes through a
// named operation so the logical state and the host process stay in sync.
class SessionState {
public:
    explicit SessionState(HostEnvironment& host, Mode mode = Mode::NaturalLanguage);

    const std::string& working_directory() const { return m_cwd; }
    const std::map<std::string, std::string>& environment() const { return m_env; }
    std::optional<std::string> env(const std::string& name) const;
    Mode mode() const { return m_mode; }
    const std::vector<std::string>& history() const { return m_history; }
    int last_exit_code() const { return m_last_exit_code; }
    const std::map<std::string, std::string>& aliases() const { return m_aliases; }
    std::optional<std::string> alias(const std::string& name) const;
    const std::optional<LastCommand>& last_command() const { return m_last_command; }
    const std::vector<std::string>& pending_commands() const { return m_pending; }
    bool exit_requested() const { return m_exit_requested; }
    int exit_status() const { return m_exit_status; }

    // Resolves `path` against the working directory and normalizes it. Fails
    // with DirectoryNotFound, leaving the state untouched, when the result is
    // not an existing directory.
    std::optional<Error> set_working_directory(const std::string& path);
    // Rejects empty names and names containing '='.
    std::optional<Error> set_env_var(const std::string& name, const std::string& value);
    std::optional<Error> unset_env_var(const std::string& name);
    void set_mode(Mode mode);
    void append_history(const std::string& input);
    void set_last_exit_code(int code);
    std::optional<Error> set_alias(const std::string& name, const std::string& value);
    bool remove_alias(const std::string& name);
    void record_result(LastCommand last);
    void set_pending_commands(std::vector<std::string> commands);
    std::optional<std::string> pop_pending_command();
    void clear_pending_commands();
    void request_exit(int status);

    // "NAME=VALUE" strings in lexicographic order, for execve.
    std::vector<std::string> env_block() const;
    std::string home_directory() const;
    // Tokens: {user} {host} {cwd} {mode} {status}. {cwd} shortens $HOME to ~.
    std::string render_prompt(const std::string& format) const;

private:
    HostEnvironment& m_host;
    std::string m_cwd;
    std::map<std::string, std::string> m_env;
    Mode m_mode;
    std::vector<std::string> m_history;
    int m_last_exit_code = 0;
    std::map<std::string, std::string> m_aliases;
    std::optional<LastCommand> m_last_command;
    std::vector<std::string> m_pending;
    bool m_exit_requested = false;
    int m_exit_status = 0;
};

} // namespace webwright
