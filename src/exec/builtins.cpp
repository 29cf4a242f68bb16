/*
 * Built-in commands implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/exec/builtins.hpp>
#include <webwright/util/log.hpp>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

namespace webwright {

namespace {

CommandResult failure(const std::string& message, int code = 1) {
    CommandResult r;
    r.exit_code = code;
    r.stderr_text = message + "\n";
    return r;
}

// Whole-word integer parse; nullopt for anything else.
std::optional<long> parse_number(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return std::nullopt;
    return v;
}

CommandResult do_cd(const std::vector<std::string>& argv, SessionState& state) {
    if (argv.size() > 2) return failure("cd: too many arguments");
    CommandResult res;
    std::string target;
    if (argv.size() < 2) target = state.home_directory();
    else if (argv[1] == "-") {
        auto old = state.env("OLDPWD");
        if (!old) return failure("cd: OLDPWD not set");
        target = *old;
    } else target = argv[1];
    if (auto err = state.set_working_directory(target)) return failure(err->message);
    if (argv.size() == 2 && argv[1] == "-") res.stdout_text = state.working_directory() + "\n";
    return res;
}

CommandResult do_pwd(const std::vector<std::string>&, SessionState& state) {
    CommandResult res;
    res.stdout_text = state.working_directory() + "\n";
    return res;
}

CommandResult do_export(const std::vector<std::string>& argv, SessionState& state) {
    CommandResult res;
    if (argv.size() < 2) {
        for (auto& [name, value] : state.environment()) res.stdout_text += name + "=" + value + "\n";
        return res;
    }
    for (size_t i = 1; i < argv.size(); ++i) {
        auto& a = argv[i];
        auto eq = a.find('=');
        // `export NAME` only marks a variable for export; everything is exported here
        if (eq == std::string::npos) continue;
        if (auto err = state.set_env_var(a.substr(0, eq), a.substr(eq + 1))) {
            res.stderr_text += err->message + "\n";
            res.exit_code = 1;
        }
    }
    return res;
}

CommandResult do_unset(const std::vector<std::string>& argv, SessionState& state) {
    CommandResult res;
    for (size_t i = 1; i < argv.size(); ++i) {
        if (auto err = state.unset_env_var(argv[i])) {
            res.stderr_text += err->message + "\n";
            res.exit_code = 1;
        }
    }
    return res;
}

CommandResult do_mode(const std::vector<std::string>& argv, SessionState& state) {
    CommandResult res;
    if (argv.size() < 2) {
        std::string names;
        for (auto& n : valid_mode_names()) names += (names.empty() ? "" : ", ") + n;
        res.stdout_text = std::string("Current mode: ") + mode_name(state.mode()) + "\nAvailable: " + names + "\n";
        return res;
    }
    if (argv.size() > 2) return failure("mode: too many arguments");
    auto mode = parse_mode(argv[1]);
    if (!mode) {
        Error err{ErrorKind::InvalidModeName, "Invalid mode: " + argv[1] + ". Use: shell, nl, or ai"};
        log::debug(std::string(to_string(err.kind)) + ": " + argv[1]);
        return failure(err.message);
    }
    state.set_mode(*mode);
    res.stdout_text = std::string("Switched to ") + mode_name(*mode) + " mode\n";
    return res;
}

CommandResult do_exit(const std::vector<std::string>& argv, SessionState& state) {
    int status = 0;
    if (argv.size() > 1) {
        if (auto n = parse_number(argv[1])) status = static_cast<int>(*n & 0xff);
    }
    state.request_exit(status);
    CommandResult res;
    res.exit_code = status;
    return res;
}

CommandResult do_alias(const std::vector<std::string>& argv, SessionState& state) {
    CommandResult res;
    if (argv.size() < 2) {
        for (auto& [name, value] : state.aliases()) res.stdout_text += "alias " + name + "='" + value + "'\n";
        return res;
    }
    for (size_t i = 1; i < argv.size(); ++i) {
        auto& a = argv[i];
        auto eq = a.find('=');
        if (eq == std::string::npos) {
            if (auto v = state.alias(a)) res.stdout_text += "alias " + a + "='" + *v + "'\n";
            else { res.stderr_text += "alias: " + a + ": not found\n"; res.exit_code = 1; }
            continue;
        }
        if (auto err = state.set_alias(a.substr(0, eq), a.substr(eq + 1))) {
            res.stderr_text += err->message + "\n";
            res.exit_code = 1;
        }
    }
    return res;
}

CommandResult do_unalias(const std::vector<std::string>& argv, SessionState& state) {
    if (argv.size() < 2) return failure("unalias: usage: unalias name [name ...]");
    CommandResult res;
    for (size_t i = 1; i < argv.size(); ++i) {
        if (!state.remove_alias(argv[i])) {
            res.stderr_text += "unalias: " + argv[i] + ": not found\n";
            res.exit_code = 1;
        }
    }
    return res;
}

CommandResult do_history(const std::vector<std::string>& argv, SessionState& state) {
    auto& h = state.history();
    size_t first = 0;
    if (argv.size() > 1) {
        auto n = parse_number(argv[1]);
        if (!n || *n < 0) return failure("history: " + argv[1] + ": numeric argument required");
        if (static_cast<size_t>(*n) < h.size()) first = h.size() - static_cast<size_t>(*n);
    }
    std::ostringstream os;
    for (size_t i = first; i < h.size(); ++i) {
        os.width(5);
        os << (i + 1);
        os.width(0);
        os << "  " << h[i] << '\n';
    }
    CommandResult res;
    res.stdout_text = os.str();
    return res;
}

} // namespace

const std::map<std::string, BuiltinHandler>& builtin_table() {
    static const std::map<std::string, BuiltinHandler> table = {
        {"alias", &do_alias},
        {"cd", &do_cd},
        {"exit", &do_exit},
        {"export", &do_export},
        {"history", &do_history},
        {"mode", &do_mode},
        {"pwd", &do_pwd},
        {"unalias", &do_unalias},
        {"unset", &do_unset},
    };
    return table;
}

bool is_builtin(const std::string& name) {
    return builtin_table().count(name) != 0;
}

std::optional<CommandResult> run_builtin(const std::vector<std::string>& argv, SessionState& state) {
    if (argv.empty()) return CommandResult{};
    auto it = builtin_table().find(argv[0]);
    if (it == builtin_table().end()) return std::nullopt;
    return it->second(argv, state);
}

} // namespace webwright
