/*
 * Command executor implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/exec/executor.hpp>
#include <webwright/exec/builtins.hpp>
#include <webwright/exec/path.hpp>
#include <webwright/exec/process.hpp>
#include <webwright/expand/expand.hpp>
#include <webwright/util/log.hpp>
#include <webwright/util/text.hpp>
#include <set>

namespace webwright {

bool is_bare_interpreter(const std::string& text) {
    static const std::set<std::string> names = {"bash", "cmd", "powershell", "pwsh", "sh", "zsh"};
    return names.count(to_lower(trim(text))) != 0;
}

bool is_simple_command(const std::string& text) {
    static const std::set<std::string> reserved = {
        "!", "case", "do", "done", "elif", "else", "esac", "fi", "for", "function",
        "if", "in", "select", "then", "until", "while", "{", "}", "[[", "]]"};
    std::string line = trim(text);
    if (line.empty()) return true;
    if (line[0] == '(' || line[0] == '{' || line[0] == '}') return false;
    return reserved.count(first_word(line)) == 0;
}

CommandResult Executor::execute(const std::string& text) {
    std::string line = trim(text);
    if (line.empty() || line[0] == '#') return CommandResult{};
    if (is_bare_interpreter(line)) {
        log::debug("skipping bare interpreter: " + line);
        CommandResult r;
        r.command = line;
        return r;
    }

    CommandResult res;
    auto segments = split_list(line);
    bool has_builtin_segment = false;
    bool all_simple = true;
    for (auto& seg : segments) {
        std::string seg_text = expand_alias(trim(seg.text));
        if (is_builtin(first_word(seg_text))) has_builtin_segment = true;
        if (!is_simple_command(seg_text)) all_simple = false;
    }
    // compound constructs (if/for/case/{ }) keep their structure in the OS shell
    if (segments.size() > 1 && has_builtin_segment && all_simple) res = run_andor(segments);
    else res = run_segment(line);

    res.command = line;
    m_state.set_last_exit_code(res.exit_code);
    m_state.record_result(LastCommand{line, res.stdout_text, res.stderr_text, res.exit_code});
    return res;
}

CommandResult Executor::run_andor(const std::vector<ListSegment>& segments) {
    CommandResult total;
    int status = 0;
    for (size_t i = 0; i < segments.size(); ++i) {
        auto& seg = segments[i];
        if (i > 0) {
            if (seg.op == "&&" && status != 0) continue;
            if (seg.op == "||" && status == 0) continue;
        }
        auto r = run_segment(seg.text);
        status = r.exit_code;
        total.stdout_text += r.stdout_text;
        total.stderr_text += r.stderr_text;
        // state must see each step: `cd dir && pwd`
        m_state.set_last_exit_code(status);
        if (m_state.exit_requested() || status == kExitInterrupted) break;
    }
    total.exit_code = status;
    return total;
}

CommandResult Executor::run_segment(const std::string& text) {
    std::string line = expand_alias(trim(text));
    auto stages = split_pipeline(line);
    if (stages.size() > 1) {
        for (auto& s : stages) {
            if (trim(s).empty()) {
                CommandResult r;
                r.exit_code = kExitSyntax;
                r.stderr_text = "webwright: syntax error near unexpected token `|'\n";
                return r;
            }
        }
        return run_external(stages);
    }
    std::string error;
    m_subst_err.clear();
    if (auto argv = builtin_argv(line, error)) {
        if (auto r = run_builtin(*argv, m_state)) {
            r->stderr_text = m_subst_err + r->stderr_text;
            return *r;
        }
    }
    if (!error.empty()) {
        CommandResult r;
        r.exit_code = kExitSyntax;
        r.stderr_text = error + "\n";
        return r;
    }
    return run_external({line});
}

// Argument vector for an in-process built-in, or nullopt when the line has to
// go to the OS shell (not a built-in, or carries redirections/background).
std::optional<std::vector<std::string>> Executor::builtin_argv(const std::string& text, std::string& error) {
    if (!is_builtin(first_word(text))) return std::nullopt;
    auto tokens = Lexer(text, {false}).run();
    std::vector<std::string> argv;
    for (auto& t : tokens) {
        if (t.kind == TokenKind::Eof) break;
        if (t.kind == TokenKind::Invalid) {
            error = "webwright: syntax error: " + t.lexeme;
            return std::nullopt;
        }
        if (!is_word(t.kind)) return std::nullopt;
        argv.push_back(expand_word(text.substr(t.pos, t.end - t.pos)));
    }
    if (argv.empty() || !is_builtin(argv[0])) return std::nullopt;
    return argv;
}

// End of a `$(...)` body starting at `open` (the index just past "$("), or
// npos when unbalanced. Quoted parentheses do not count.
static size_t find_subst_close(const std::string& raw, size_t open) {
    int depth = 1;
    char quote = 0;
    for (size_t i = open; i < raw.size(); ++i) {
        char c = raw[i];
        if (quote) {
            if (c == '\\' && quote == '"') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '\\') { ++i; continue; }
        if (c == '\'' || c == '"') quote = c;
        else if (c == '(') ++depth;
        else if (c == ')' && --depth == 0) return i;
    }
    return std::string::npos;
}

// Runs a `$(...)` or backtick body through the OS shell; trailing newlines
// are dropped and stderr is kept for the built-in's result.
std::string Executor::substitute(const std::string& body) {
    auto r = run_external({body});
    m_subst_err += r.stderr_text;
    std::string value = r.stdout_text;
    while (!value.empty() && value.back() == '\n') value.pop_back();
    return value;
}

// Quote removal plus ~, $VAR and command substitution on a raw word.
// Single-quoted runs stay literal. Substituted text is not split into fields.
std::string Executor::expand_word(const std::string& raw) {
    auto lookup = [this](const std::string& name) { return m_state.env(name); };
    std::string out, chunk;
    auto flush = [&] { out += expand_variables(chunk, lookup); chunk.clear(); };
    // `$(` or a backtick at i: substitute and return the index past it
    auto try_subst = [&](size_t i) -> size_t {
        if (raw[i] == '$' && i + 1 < raw.size() && raw[i + 1] == '(') {
            auto close = find_subst_close(raw, i + 2);
            if (close == std::string::npos) return i;
            flush();
            out += substitute(raw.substr(i + 2, close - i - 2));
            return close + 1;
        }
        if (raw[i] == '`') {
            auto close = raw.find('`', i + 1);
            while (close != std::string::npos && raw[close - 1] == '\\') close = raw.find('`', close + 1);
            if (close == std::string::npos) return i;
            flush();
            out += substitute(raw.substr(i + 1, close - i - 1));
            return close + 1;
        }
        return i;
    };
    size_t i = 0;
    if (raw.size() >= 1 && raw[0] == '~' && (raw.size() == 1 || raw[1] == '/')) {
        out = expand_tilde("~", m_state.home_directory());
        i = 1;
    }
    while (i < raw.size()) {
        char c = raw[i];
        if (c == '\'') {
            flush();
            auto close = raw.find('\'', i + 1);
            if (close == std::string::npos) close = raw.size();
            out += raw.substr(i + 1, close - i - 1);
            i = close + 1;
        } else if (c == '"') {
            ++i;
            while (i < raw.size() && raw[i] != '"') {
                if (raw[i] == '\\' && i + 1 < raw.size() && std::string("\"\\$`").find(raw[i + 1]) != std::string::npos) {
                    flush();
                    out.push_back(raw[i + 1]);
                    i += 2;
                    continue;
                }
                if (auto next = try_subst(i); next != i) { i = next; continue; }
                chunk.push_back(raw[i++]);
            }
            ++i;
        } else if (c == '\\' && i + 1 < raw.size()) {
            flush();
            out.push_back(raw[i + 1]);
            i += 2;
        } else if (auto next = try_subst(i); next != i) {
            i = next;
        } else {
            chunk.push_back(c);
            ++i;
        }
    }
    flush();
    return out;
}

// One level of alias substitution on the first word.
std::string Executor::expand_alias(const std::string& text) const {
    std::string word = first_word(text);
    if (word.empty()) return text;
    auto value = m_state.alias(word);
    if (!value) return text;
    auto at = text.find(word);
    return *value + text.substr(at + word.size());
}

std::optional<std::string> Executor::shell_executable() const {
    auto path = m_state.env("PATH");
    return resolve_executable(m_cfg.shell_path, path ? *path : std::string());
}

CommandResult Executor::run_external(const std::vector<std::string>& stages) {
    CommandResult res;
    auto shell = shell_executable();
    if (!shell) {
        res.exit_code = kExitNotFound;
        res.stderr_text = "webwright: shell not found: " + m_cfg.shell_path + "\n";
        log::debug(std::string(to_string(ErrorKind::ProcessLaunchFailure)) + ": " + m_cfg.shell_path);
        return res;
    }
    ProcessOptions opts;
    opts.cwd = m_state.working_directory();
    opts.env = m_state.env_block();
    opts.timeout = m_cfg.timeout;
    opts.cancel = m_cfg.cancel;
    opts.foreground_terminal = m_cfg.foreground_terminal;
    log::debug("exec [" + std::to_string(stages.size()) + " stage(s)] in " + opts.cwd);
    auto outcome = run_shell_pipeline(*shell, stages, opts);
    if (outcome.timed_out) log::debug(to_string(ErrorKind::CommandTimeout));
    if (outcome.launch_failed) log::debug(to_string(ErrorKind::ProcessLaunchFailure));
    res.exit_code = outcome.exit_code;
    res.stdout_text = sanitize_utf8(outcome.out);
    res.stderr_text = sanitize_utf8(outcome.err);
    return res;
}

} // namespace webwright
