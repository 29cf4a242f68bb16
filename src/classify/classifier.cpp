/*
 * Input classifier implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/classify/classifier.hpp>
#include <webwright/lex/lexer.hpp>
#include <webwright/util/text.hpp>
#include <cstring>

namespace webwright {

const char* to_string(InputClass c) {
    switch (c) {
        case InputClass::Empty: return "empty";
        case InputClass::Comment: return "comment";
        case InputClass::ShellCommand: return "shell-command";
        case InputClass::NaturalLanguage: return "natural-language";
        case InputClass::AssistantRequest: return "assistant-request";
    }
    return "empty";
}

const std::set<std::string>& recognized_commands() {
    static const std::set<std::string> cmds = {
        "ls", "cd", "pwd", "cat", "echo", "grep", "find", "git",
        "python", "node", "npm", "pip", "docker", "kubectl",
        "mkdir", "rm", "cp", "mv", "touch", "chmod", "chown",
        "ps", "kill", "top", "df", "du", "tar", "gzip", "curl", "wget",
        "export", "mode", "unset", "alias", "unalias", "history", "exit"
    };
    return cmds;
}

static bool has_shell_metachar(const std::string& text) {
    // ">>" and "||" are caught by '>' and '|'; a lone '&' is not a marker
    return text.find_first_of("|<>;") != std::string::npos || text.find("&&") != std::string::npos;
}

static bool looks_like_shell(const std::string& text) {
    std::string first = first_word(text);
    if (recognized_commands().count(first)) return true;
    if (has_shell_metachar(text)) return true;
    if (starts_with(first, "./") || starts_with(first, "/")) return true;
    if (is_assignment_word(first)) return true;
    return false;
}

InputClass classify(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) return InputClass::Empty;
    if (t[0] == '#') return InputClass::Comment;
    if (starts_with(to_lower(t.substr(0, std::strlen(kAssistantPrefix))), kAssistantPrefix)) return InputClass::AssistantRequest;
    if (looks_like_shell(t)) return InputClass::ShellCommand;
    return InputClass::NaturalLanguage;
}

std::string extract_assistant_request(const std::string& text) {
    std::string t = trim(text);
    if (starts_with(to_lower(t.substr(0, std::strlen(kAssistantPrefix))), kAssistantPrefix)) {
        return trim(t.substr(std::strlen(kAssistantPrefix)));
    }
    return t;
}

} // namespace webwright
