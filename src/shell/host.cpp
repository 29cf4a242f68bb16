/*
 * Host environment backend implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/shell/host.hpp>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <unistd.h>

extern char** environ;

namespace webwright {

std::map<std::string, std::string> PosixHostEnvironment::initial_environment() const {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return env;
}

std::string PosixHostEnvironment::initial_directory() const {
    std::error_code ec;
    auto p = std::filesystem::current_path(ec);
    if (ec) {
        const char* home = std::getenv("HOME");
        return home ? home : "/";
    }
    return p.string();
}

bool PosixHostEnvironment::set_env(const std::string& name, const std::string& value) {
    return ::setenv(name.c_str(), value.c_str(), 1) == 0;
}

bool PosixHostEnvironment::unset_env(const std::string& name) {
    return ::unsetenv(name.c_str()) == 0;
}

bool PosixHostEnvironment::change_directory(const std::string& path) {
    return ::chdir(path.c_str()) == 0;
}

} // namespace webwright
