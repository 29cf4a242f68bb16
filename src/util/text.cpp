/*
 * Text utilities implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/util/text.hpp>
#include <algorithm>
#include <cctype>

namespace webwright {

std::string trim(const std::string& s) {
    size_t a = 0; while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size(); while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (nl == std::string::npos) {
            if (!line.empty()) lines.push_back(line);
            break;
        }
        lines.push_back(line);
        start = nl + 1;
    }
    return lines;
}

std::string first_word(const std::string& text) {
    size_t a = 0; while (a < text.size() && std::isspace(static_cast<unsigned char>(text[a]))) ++a;
    size_t b = a; while (b < text.size() && !std::isspace(static_cast<unsigned char>(text[b]))) ++b;
    return text.substr(a, b - a);
}

// Length of the UTF-8 sequence starting at s[i], or 0 if invalid.
static size_t utf8_sequence_length(const std::string& s, size_t i) {
    auto c = static_cast<unsigned char>(s[i]);
    size_t len = 0; unsigned int cp = 0;
    if (c < 0x80) return 1;
    else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return 0;
    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        auto cc = static_cast<unsigned char>(s[i+k]);
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates and out-of-range code points
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return 0;
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
    if (cp > 0x10FFFF) return 0;
    return len;
}

std::string sanitize_utf8(const std::string& bytes) {
    static const std::string replacement = "\xEF\xBF\xBD";
    std::string out; out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) { out += replacement; ++i; continue; }
        out.append(bytes, i, len);
        i += len;
    }
    return out;
}

std::string tail_bytes(const std::string& s, std::size_t max) {
    if (s.size() <= max) return s;
    size_t start = s.size() - max;
    while (start < s.size() && (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) ++start;
    return s.substr(start);
}

} // namespace webwright
