/*
 * Minimal JSON text helpers implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/ai/json_text.hpp>
#include <cctype>
#include <cstdio>

namespace webwright::ai {

std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size() + 32);
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else out.push_back(c);
        }
    }
    return out;
}

std::optional<std::size_t> json_find_key(const std::string& body, const std::string& key, std::size_t from) {
    std::string quoted = "\"" + key + "\"";
    std::size_t pos = body.find(quoted, from);
    while (pos != std::string::npos) {
        std::size_t p = pos + quoted.size();
        while (p < body.size() && std::isspace(static_cast<unsigned char>(body[p]))) ++p;
        if (p < body.size() && body[p] == ':') return p + 1;
        // a string value that happens to equal the key
        pos = body.find(quoted, pos + 1);
    }
    return std::nullopt;
}

static void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) out.push_back(static_cast<char>(cp));
    else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

static std::optional<unsigned> read_hex4(const std::string& s, std::size_t at) {
    if (at + 4 > s.size()) return std::nullopt;
    unsigned v = 0;
    for (std::size_t i = at; i < at + 4; ++i) {
        char c = s[i];
        v <<= 4;
        if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
        else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(c - 'A' + 10);
        else return std::nullopt;
    }
    return v;
}

std::optional<std::string> json_string_field(const std::string& body, const std::string& key, std::size_t from) {
    auto start = json_find_key(body, key, from);
    if (!start) return std::nullopt;
    std::size_t p = *start;
    while (p < body.size() && std::isspace(static_cast<unsigned char>(body[p]))) ++p;
    if (p >= body.size() || body[p] != '"') return std::nullopt;
    std::string out;
    for (std::size_t i = p + 1; i < body.size(); ++i) {
        char c = body[i];
        if (c == '"') return out;
        if (c != '\\') { out.push_back(c); continue; }
        if (++i >= body.size()) break;
        switch (body[i]) {
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'u': {
                auto cp = read_hex4(body, i + 1);
                if (!cp) return std::nullopt;
                i += 4;
                if (*cp >= 0xD800 && *cp < 0xDC00 && i + 2 < body.size() && body[i+1] == '\\' && body[i+2] == 'u') {
                    auto lo = read_hex4(body, i + 3);
                    if (lo && *lo >= 0xDC00 && *lo < 0xE000) {
                        append_utf8(out, 0x10000 + ((*cp - 0xD800) << 10) + (*lo - 0xDC00));
                        i += 6;
                        break;
                    }
                }
                append_utf8(out, (*cp >= 0xD800 && *cp < 0xE000) ? 0xFFFD : *cp);
                break;
            }
            default: out.push_back(body[i]); // \" \\ \/
        }
    }
    return std::nullopt;
}

int json_int_field(const std::string& body, const std::string& key) {
    auto start = json_find_key(body, key);
    if (!start) return -1;
    std::size_t p = *start;
    while (p < body.size() && std::isspace(static_cast<unsigned char>(body[p]))) ++p;
    std::size_t e = p;
    while (e < body.size() && std::isdigit(static_cast<unsigned char>(body[e]))) ++e;
    if (e == p || e - p > 9) return -1;
    return std::stoi(body.substr(p, e - p));
}

} // namespace webwright::ai
