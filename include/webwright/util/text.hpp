/*
 * Text utilities - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>

namespace webwright {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool starts_with(const std::string& s, const std::string& prefix);

// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& text);

// First whitespace-delimited token, or empty.
std::string first_word(const std::string& text);

// Replace every invalid UTF-8 sequence with U+FFFD.
std::string sanitize_utf8(const std::string& bytes);

// Last `max` bytes of `s`, not splitting a UTF-8 sequence.
std::string tail_bytes(const std::string& s, std::size_t max);

} // namespace webwright
