/*
 * Clipboard access - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <webwright/shell/state.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace webwright {

class ClipboardReader {
public:
    virtual ~ClipboardReader() = default;
    // nullopt when no clipboard can be read on this host.
    virtual std::optional<std::string> read() = 0;
};

// Reads the clipboard through the first available helper tool
// (wl-paste, xclip, xsel, pbpaste), found on the session PATH.
class SystemClipboard : public ClipboardReader {
public:
    explicit SystemClipboard(const SessionState& state,
                             std::chrono::milliseconds timeout = std::chrono::seconds(2))
        : m_state(state), m_timeout(timeout) {}
    std::optional<std::string> read() override;

    static const std::vector<std::vector<std::string>>& candidates();

private:
    const SessionState& m_state;
    std::chrono::milliseconds m_timeout;
};

} // namespace webwright
