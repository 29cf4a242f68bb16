/*
 * Input classifier - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <set>
#include <string>

namespace webwright {

enum class InputClass { Empty, Comment, ShellCommand, NaturalLanguage, AssistantRequest };

const char* to_string(InputClass c);

inline constexpr const char* kAssistantPrefix = "ai:";

// Pure function of the trimmed text, rules in order, first match wins:
// empty, '#' comment, "ai:" prefix (case-insensitive), shell heuristics,
// natural language.
InputClass classify(const std::string& text);

// Text after the "ai:" prefix, trimmed. Input without the prefix is returned trimmed.
std::string extract_assistant_request(const std::string& text);

// Command names that mark a line as a shell command.
const std::set<std::string>& recognized_commands();

} // namespace webwright
