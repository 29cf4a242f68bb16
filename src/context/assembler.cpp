/*
 * Context assembler implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/context/assembler.hpp>
#include <webwright/expand/expand.hpp>
#include <webwright/util/log.hpp>
#include <webwright/util/text.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace webwright {
namespace fs = std::filesystem;

std::optional<Error> ContextBlock::error() const {
    switch (status) {
        case BlockStatus::Ok: return std::nullopt;
        case BlockStatus::NotFound: return Error{ErrorKind::FileReferenceNotFound, "File not found: " + origin};
        case BlockStatus::Unreadable: return Error{ErrorKind::FileReferenceUnreadable, "Error reading " + origin + ": " + content};
    }
    return std::nullopt;
}

std::string ContextBlock::render() const {
    switch (source) {
        case BlockSource::File:
            if (status == BlockStatus::Ok) return "# File: " + origin + "\n" + content + "\n";
            return "# Error: " + error()->message + "\n";
        case BlockSource::Clipboard: return "# Clipboard:\n" + content;
        case BlockSource::Stdin: return "# Stdin:\n" + content;
    }
    return {};
}

std::vector<std::string> ContextBundle::rendered() const {
    std::vector<std::string> out;
    out.reserve(blocks.size());
    for (auto& b : blocks) out.push_back(b.render());
    return out;
}

std::optional<std::string> PipedStdin::content() {
    if (m_loaded) return m_text;
    m_loaded = true;
    if (::isatty(m_fd)) return std::nullopt;
    std::string data;
    char buf[4096];
    for (;;) {
        ssize_t r = ::read(m_fd, buf, sizeof buf);
        if (r > 0) { data.append(buf, static_cast<size_t>(r)); continue; }
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) log::warn(std::string("stdin: ") + std::strerror(errno));
        break;
    }
    if (!data.empty()) m_text = sanitize_utf8(data);
    return m_text;
}

namespace {

struct Span {
    size_t begin;
    size_t end;
};

struct Placed {
    size_t pos;
    ContextBlock block;
};

std::string display_path(const fs::path& p, const std::string& cwd) {
    auto rel = p.lexically_relative(cwd);
    if (rel.empty()) return p.string();
    return rel.string();
}

ContextBlock read_file_block(const fs::path& p, const std::string& cwd) {
    ContextBlock b;
    b.source = BlockSource::File;
    b.origin = display_path(p, cwd);
    b.path = p.lexically_normal().string();
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        b.origin = p.string();
        b.status = BlockStatus::NotFound;
        return b;
    }
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        b.status = BlockStatus::Unreadable;
        b.content = std::strerror(errno);
        return b;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        b.status = BlockStatus::Unreadable;
        b.content = "read failed";
        return b;
    }
    b.content = sanitize_utf8(ss.str());
    return b;
}

bool inside(const std::vector<Span>& spans, size_t pos) {
    for (auto& s : spans) if (pos >= s.begin && pos < s.end) return true;
    return false;
}

} // namespace

ContextBundle ContextAssembler::assemble(const std::string& text, const SessionState& state) const {
    ContextBundle bundle;
    std::vector<Placed> placed;
    std::vector<Span> file_spans;
    const std::string& cwd = state.working_directory();

    // file references: whitespace-delimited tokens starting with '@'
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i - start < 2 || text[start] != '@') continue;
        file_spans.push_back({start, i});
        std::string ref = expand_tilde(text.substr(start + 1, i - start - 1), state.home_directory());
        fs::path target = fs::path(ref).is_absolute() ? fs::path(ref) : fs::path(cwd) / ref;
        target = target.lexically_normal();
        if (!has_glob_chars(ref)) {
            placed.push_back({start, read_file_block(target, cwd)});
            continue;
        }
        std::vector<std::string> matches;
        std::error_code ec;
        for (auto& m : glob_paths(target.string())) {
            if (fs::is_regular_file(m, ec)) matches.push_back(m);
        }
        if (matches.empty()) {
            ContextBlock b;
            b.origin = target.string();
            b.status = BlockStatus::NotFound;
            placed.push_back({start, b});
        }
        for (auto& m : matches) placed.push_back({start, read_file_block(m, cwd)});
    }

    // clipboard markers outside file tokens; one read however many there are
    std::vector<Span> clip_spans;
    for (const char* marker : kClipboardMarkers) {
        size_t len = std::strlen(marker);
        for (size_t at = text.find(marker); at != std::string::npos; at = text.find(marker, at + len)) {
            if (!inside(file_spans, at)) clip_spans.push_back({at, at + len});
        }
    }
    if (!clip_spans.empty()) {
        std::optional<std::string> clip = m_clipboard ? m_clipboard->read() : std::nullopt;
        if (!clip) log::debug(std::string(to_string(ErrorKind::ClipboardUnavailable)));
        else if (!clip->empty()) {
            size_t first = std::min_element(clip_spans.begin(), clip_spans.end(),
                [](const Span& a, const Span& b) { return a.begin < b.begin; })->begin;
            placed.push_back({first, ContextBlock{BlockSource::Clipboard, "", sanitize_utf8(*clip), BlockStatus::Ok}});
        }
    }

    std::stable_sort(placed.begin(), placed.end(), [](const Placed& a, const Placed& b) { return a.pos < b.pos; });
    for (auto& p : placed) {
        if (p.block.source == BlockSource::File && !p.block.is_error()) bundle.files.push_back(p.block.path);
        bundle.blocks.push_back(std::move(p.block));
    }

    if (m_stdin) {
        if (auto piped = m_stdin->content(); piped && !piped->empty())
            bundle.blocks.push_back(ContextBlock{BlockSource::Stdin, "", *piped, BlockStatus::Ok});
    }

    // cleanup: drop every marker span in one pass over the original text
    std::vector<Span> spans = file_spans;
    spans.insert(spans.end(), clip_spans.begin(), clip_spans.end());
    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) { return a.begin < b.begin; });
    std::string cleaned;
    size_t pos = 0;
    for (auto& s : spans) {
        if (s.begin < pos) { pos = std::max(pos, s.end); continue; }
        cleaned.append(text, pos, s.begin - pos);
        pos = s.end;
    }
    if (pos < text.size()) cleaned.append(text, pos, std::string::npos);
    bundle.command = trim(cleaned);
    return bundle;
}

} // namespace webwright
