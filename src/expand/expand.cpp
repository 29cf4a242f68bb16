/*
 * Webwright Expansion Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 * Description: Implements ~, $VAR, ${VAR} expansions and path globbing.
 */
#include <webwright/expand/expand.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>
#include <system_error>

namespace webwright {
namespace fs = std::filesystem;

std::string expand_tilde(const std::string& s, const std::string& home) {
    if (!s.empty() && s[0] == '~' && !home.empty()) {
        if (s.size()==1) return home;
        if (s[1]=='/') return home + s.substr(1);
    }
    return s;
}

std::string expand_variables(const std::string& in, const VariableLookup& lookup) {
    std::string out; out.reserve(in.size());
    for (size_t i=0;i<in.size();) {
        if (in[i]=='$') {
            if (i+1 < in.size() && in[i+1]=='{') {
                size_t end = in.find('}', i+2);
                if (end != std::string::npos) {
                    std::string key = in.substr(i+2, end-(i+2));
                    out += lookup(key).value_or("");
                    i = end+1; continue;
                }
            }
            size_t j=i+1;
            if (j < in.size() && (std::isalpha(static_cast<unsigned char>(in[j])) || in[j]=='_')) {
                ++j; while (j<in.size() && (std::isalnum(static_cast<unsigned char>(in[j])) || in[j]=='_')) ++j;
                std::string key = in.substr(i+1, j-(i+1));
                out += lookup(key).value_or("");
                i=j; continue;
            }
        }
        out.push_back(in[i++]);
    }
    return out;
}

bool has_glob_chars(const std::string& s) {
    return s.find_first_of("*?[") != std::string::npos; // '[' start of char class
}

static std::string glob_to_regex(const std::string& pat) {
    std::string rx; rx.reserve(pat.size()*2);
    rx += '^';
    bool in_class=false;
    for (size_t i=0;i<pat.size();++i) {
        char c = pat[i];
        if (in_class) {
            if (c==']') in_class=false;
            if (c=='\\') rx.push_back('\\');
            rx.push_back(c);
            continue;
        }
        switch(c) {
            case '*': rx += ".*"; break;
            case '?': rx += '.'; break;
            case '[':
                if (pat.find(']', i+1) == std::string::npos) { rx += "\\["; break; }
                in_class=true; rx.push_back('[');
                if (i+1 < pat.size() && pat[i+1]=='!') { rx.push_back('^'); ++i; }
                break;
            case '.': case '(': case ')': case '+': case '{': case '}': case '^': case '$': case '|': case '\\': case ']':
                rx.push_back('\\'); rx.push_back(c); break;
            default: rx.push_back(c); break;
        }
    }
    rx += '$';
    return rx;
}

static void walk(const fs::path& base, const std::vector<std::string>& parts, size_t idx, std::vector<std::string>& out) {
    std::error_code ec;
    if (idx == parts.size()) {
        if (fs::exists(base, ec)) out.push_back(base.string());
        return;
    }
    const std::string& part = parts[idx];
    if (part == "**") {
        walk(base, parts, idx+1, out);
        for (auto it = fs::directory_iterator(base, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code sec;
            std::string name = it->path().filename().string();
            if (name.empty() || name[0]=='.') continue;
            if (it->is_directory(sec) && !it->is_symlink(sec)) walk(it->path(), parts, idx, out);
        }
        return;
    }
    if (!has_glob_chars(part)) {
        walk(base / part, parts, idx+1, out);
        return;
    }
    std::regex re(glob_to_regex(part));
    bool show_hidden = part[0]=='.';
    for (auto it = fs::directory_iterator(base, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (!show_hidden && !name.empty() && name[0]=='.') continue;
        if (std::regex_match(name, re)) walk(it->path(), parts, idx+1, out);
    }
}

std::vector<std::string> glob_paths(const std::string& absolute_pattern) {
    fs::path pattern(absolute_pattern);
    std::vector<std::string> parts;
    for (auto& comp : pattern.relative_path()) {
        std::string c = comp.string();
        if (!c.empty()) parts.push_back(c);
    }
    std::vector<std::string> matches;
    walk(pattern.root_path().empty() ? fs::path("/") : pattern.root_path(), parts, 0, matches);
    std::sort(matches.begin(), matches.end());
    matches.erase(std::unique(matches.begin(), matches.end()), matches.end());
    return matches;
}

} // namespace webwright
