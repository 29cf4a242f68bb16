/*
 * Translated command risk policy implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/shell/risk.hpp>
#include <webwright/util/text.hpp>
#include <cctype>
#include <set>
#include <vector>

namespace webwright {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

// `needle` occurs in `hay` with no word character glued to either side.
bool contains_word(const std::string& hay, const std::string& needle) {
    for (size_t at = hay.find(needle); at != std::string::npos; at = hay.find(needle, at + 1)) {
        bool left = at == 0 || !is_word_char(hay[at - 1]);
        size_t end = at + needle.size();
        bool right = end >= hay.size() || !is_word_char(hay[end]);
        if (left && right) return true;
    }
    return false;
}

} // namespace

bool is_safe_command(const std::string& cmd) {
    static const std::vector<std::string> safe_prefixes = {
        "ls", "pwd", "cd", "whoami", "date", "cat", "echo",
        "git status", "git diff", "git log", "head", "tail", "dir"};
    std::string lower = to_lower(trim(cmd));
    // chained or piped lines need a closer look
    if (lower.find_first_of(";|&>") != std::string::npos) return false;
    for (auto& p : safe_prefixes) {
        if (starts_with(lower, p) && (lower.size() == p.size() || lower[p.size()] == ' ')) return true;
    }
    return false;
}

bool is_risky_command(const std::string& cmd) {
    static const std::vector<std::string> risky_words = {
        "rm", "mv", "chmod", "chown", "chgrp", "sudo", "dd", "mkfs", "fdisk", "wipefs",
        "docker", "kubectl", "git push", "git commit", "git reset", "pip install",
        "npm install", "apt", "apt-get", "brew", "systemctl", "shutdown", "reboot", "kill"};
    std::string lower = to_lower(cmd);
    for (auto& w : risky_words) if (contains_word(lower, w)) return true;
    if (lower.find("> /dev/sd") != std::string::npos || lower.find("> /dev/nvme") != std::string::npos) return true;
    if ((contains_word(lower, "curl") || contains_word(lower, "wget")) &&
        (lower.find("| sh") != std::string::npos || lower.find("| bash") != std::string::npos)) return true;
    return false;
}

bool should_autorun(const std::string& cmd) {
    if (is_safe_command(cmd)) return true;
    return !is_risky_command(cmd);
}

bool is_rerun_phrase(const std::string& text) {
    static const std::set<std::string> phrases = {
        "run it", "run that", "execute it", "do it", "go ahead",
        "please run it", "run the command", "run those"};
    return phrases.count(to_lower(trim(text))) != 0;
}

} // namespace webwright
