/*
 * Context assembler - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 * Description: extracts @file references, {clipboard}/{clip} markers and piped
 *              stdin from an input line into context blocks, and returns the
 *              line with every marker removed.
 */
#pragma once
#include <webwright/context/clipboard.hpp>
#include <webwright/shell/error.hpp>
#include <webwright/shell/state.hpp>
#include <optional>
#include <string>
#include <vector>

namespace webwright {

enum class BlockSource { File, Clipboard, Stdin };
enum class BlockStatus { Ok, NotFound, Unreadable };

struct ContextBlock {
    BlockSource source = BlockSource::File;
    std::string origin;   // path relative to cwd for files; empty otherwise
    std::string content;  // file text, clipboard text, stdin text or failure reason
    BlockStatus status = BlockStatus::Ok;
    std::string path;     // resolved absolute path for files

    bool is_error() const { return status != BlockStatus::Ok; }
    std::optional<Error> error() const;
    // "# File: <origin>\n<content>\n", "# Error: File not found: <origin>\n", ...
    std::string render() const;
};

struct ContextBundle {
    std::string command;                // cleaned, trimmed text
    std::vector<ContextBlock> blocks;   // one per reference, in marker order; stdin last
    std::vector<std::string> files;     // resolved paths of files read successfully

    std::vector<std::string> rendered() const;
};

class StdinSource {
public:
    virtual ~StdinSource() = default;
    // nullopt when nothing is piped in.
    virtual std::optional<std::string> content() = 0;
};

// Reads a non-terminal descriptor to EOF on first use and keeps the text.
class PipedStdin : public StdinSource {
public:
    explicit PipedStdin(int fd = 0) : m_fd(fd) {}
    std::optional<std::string> content() override;
private:
    int m_fd;
    bool m_loaded = false;
    std::optional<std::string> m_text;
};

class ContextAssembler {
public:
    // Either source may be null, which disables it.
    ContextAssembler(ClipboardReader* clipboard, StdinSource* stdin_source)
        : m_clipboard(clipboard), m_stdin(stdin_source) {}

    ContextBundle assemble(const std::string& text, const SessionState& state) const;

private:
    ClipboardReader* m_clipboard;
    StdinSource* m_stdin;
};

inline constexpr const char* kClipboardMarkers[] = {"{clipboard}", "{clip}"};

} // namespace webwright
