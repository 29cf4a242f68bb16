/*
 * Minimal JSON text helpers - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 * Description: just enough JSON for the LLM providers: string escaping for
 *              request bodies and key lookup in responses. No DOM.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace webwright::ai {

std::string json_escape(const std::string& in);

// Position just after the ':' that follows "key", searching from `from`.
std::optional<std::size_t> json_find_key(const std::string& body, const std::string& key, std::size_t from = 0);

// First string value of "key" at or after `from`, unescaped (\uXXXX decoded to UTF-8).
std::optional<std::string> json_string_field(const std::string& body, const std::string& key, std::size_t from = 0);

// First non-negative integer value of "key"; -1 if absent.
int json_int_field(const std::string& body, const std::string& key);

} // namespace webwright::ai
