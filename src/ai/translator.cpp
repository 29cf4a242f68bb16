/*
 * Natural language to command translation implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/ai/translator.hpp>
#include <webwright/util/log.hpp>
#include <webwright/util/text.hpp>
#include <set>

namespace webwright::ai {

const std::string& LlmTranslator::system_prompt() {
    static const std::string prompt = "You are a shell command translator. Output only shell commands and comments.";
    return prompt;
}

std::string LlmTranslator::build_prompt(const std::string& request, const TranslationContext& ctx) {
    std::string p =
        "Convert the natural language request into shell commands.\n"
        "\n"
        "Rules:\n"
        "1. Output ONLY shell commands and comments (lines starting with #), valid for the shell below\n"
        "2. Use comments to say what each step does\n"
        "3. Prefer one command over a script; keep it deterministic\n"
        "4. If the request is ambiguous, pick a reasonable reading and note it in a comment\n"
        "5. Before a destructive command, add a comment warning about it\n"
        "6. If the previous command failed, address that failure first\n"
        "7. NEVER output an interpreter name (sh, bash, cmd, powershell) on its own line\n"
        "\n"
        "Examples:\n"
        "\n"
        "Input: \"show me all python files\"\n"
        "Output:\n"
        "# Listing Python files in the current directory\n"
        "ls *.py\n"
        "\n"
        "Input: \"find large files over 100MB\"\n"
        "Output:\n"
        "# Files larger than 100MB below the current directory\n"
        "find . -type f -size +100M\n"
        "\n"
        "Input: \"commit these changes with message fix bug\"\n"
        "Output:\n"
        "# Staging everything and committing\n"
        "git add -A\n"
        "git commit -m \"fix bug\"\n";

    if (!ctx.cwd.empty()) p += "\nCurrent directory: " + ctx.cwd + "\n";
    if (!ctx.recent_history.empty()) {
        p += "\nRecent commands:\n";
        for (auto& h : ctx.recent_history) p += h + "\n";
    }
    if (!ctx.platform.empty() || !ctx.shell.empty()) {
        p += "\nEnvironment:\n";
        p += "- Platform: " + (ctx.platform.empty() ? std::string("unknown") : ctx.platform) + "\n";
        p += "- Shell: " + (ctx.shell.empty() ? std::string("unknown shell") : ctx.shell) + "\n";
    }
    if (ctx.last) {
        p += "\nPrevious command: " + ctx.last->command + "\n";
        p += "Exit code: " + std::to_string(ctx.last->exit_code) + "\n";
        if (!ctx.last->stdout_text.empty()) p += "Stdout:\n" + ctx.last->stdout_text + "\n";
        if (!ctx.last->stderr_text.empty()) p += "Stderr:\n" + ctx.last->stderr_text + "\n";
    }
    if (!ctx.blocks.empty()) {
        p += "\nFile contents referenced:\n";
        for (auto& b : ctx.blocks) p += "\n" + b + "\n";
    }
    p += "\nUser request: " + request;
    return p;
}

std::optional<std::string> LlmTranslator::translate(const std::string& request, const TranslationContext& ctx) {
    if (!m_client) return std::nullopt;
    auto completion = m_client->complete(system_prompt(), build_prompt(request, ctx));
    if (!completion) {
        log::warn("translation failed: no reply");
        return std::nullopt;
    }
    if (completion->failed()) {
        log::warn("translation failed: " + completion->text);
        return std::nullopt;
    }
    log::debug("[AI] source=" + completion->source + " tokens=" + std::to_string(completion->total_tokens));
    return clean_output(completion->text);
}

std::string clean_output(const std::string& text) {
    static const std::set<std::string> shell_tags = {"bash", "sh", "shell", "zsh", "console"};
    const std::string fence = "```";
    if (text.find(fence) == std::string::npos) return trim(text);

    // odd indices of the split are fenced bodies
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t at = text.find(fence); at != std::string::npos; at = text.find(fence, start)) {
        parts.push_back(text.substr(start, at - start));
        start = at + fence.size();
    }
    parts.push_back(text.substr(start));
    if (parts.size() < 2) return trim(text);

    std::optional<std::string> first;
    for (size_t i = 1; i < parts.size(); i += 2) {
        std::string body = parts[i];
        std::string tag;
        if (!body.empty() && body[0] != '\n') {
            // tag sits on the fence line
            size_t nl = body.find('\n');
            tag = to_lower(trim(body.substr(0, nl)));
            body = nl == std::string::npos ? std::string() : body.substr(nl + 1);
        }
        if (shell_tags.count(tag)) return trim(body);
        if (!first) first = trim(body);
    }
    return first ? *first : trim(text);
}

std::vector<std::string> extract_commands(const std::string& text) {
    std::vector<std::string> out;
    for (auto& line : split_lines(text)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        out.push_back(t);
    }
    return out;
}

} // namespace webwright::ai
