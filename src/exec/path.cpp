/*
 * PATH resolution implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/exec/path.hpp>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace webwright {

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& path_value) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd; else return std::nullopt;
    }
    size_t start=0;
    while (start <= path_value.size()) {
        size_t colon = path_value.find(':', start);
        std::string dir = path_value.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        if (!dir.empty()) {
            std::string full = dir + '/' + cmd;
            if (is_executable(full)) return full;
        }
        if (colon == std::string::npos) break;
        start = colon+1;
    }
    return std::nullopt;
}

} // namespace webwright
