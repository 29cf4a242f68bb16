/*
 * Resolution loop implementation - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <webwright/shell/resolver.hpp>
#include <webwright/shell/risk.hpp>
#include <webwright/util/log.hpp>
#include <webwright/util/text.hpp>
#include <algorithm>
#include <exception>

namespace webwright {

Resolver::Resolver(SessionState& state, Executor& executor, const ContextAssembler& assembler,
                   ai::TranslationGateway* translator, ai::AssistantHandler* assistant,
                   std::ostream& out, std::ostream& err, ResolverOptions opts)
    : m_state(state), m_executor(executor), m_assembler(assembler), m_translator(translator),
      m_assistant(assistant), m_out(out), m_err(err), m_opts(std::move(opts)) {}

int Resolver::handle(const std::string& raw) {
    if (trim(raw).empty()) return m_state.last_exit_code();
    try {
        auto bundle = m_assembler.assemble(raw, m_state);
        for (auto& b : bundle.blocks) {
            if (auto e = b.error()) m_err << paint("webwright: " + e->message, "31") << '\n';
        }
        dispatch(bundle);
    } catch (const std::exception& e) {
        m_err << paint(std::string("Error: ") + e.what(), "31") << '\n';
        log::error(std::string("resolution loop: ") + e.what());
        m_state.set_last_exit_code(1);
    }
    m_state.append_history(raw);
    m_out.flush();
    return m_state.last_exit_code();
}

void Resolver::dispatch(const ContextBundle& bundle) {
    InputClass cls = classify(bundle.command);
    log::debug(std::string("input class: ") + to_string(cls));
    switch (cls) {
        case InputClass::Empty:
        case InputClass::Comment:
            return;
        case InputClass::ShellCommand:
            run_shell(bundle.command);
            return;
        case InputClass::NaturalLanguage:
            run_natural_language(bundle);
            return;
        case InputClass::AssistantRequest:
            run_assistant(extract_assistant_request(bundle.command));
            return;
    }
}

void Resolver::run_shell(const std::string& command) {
    print_result(m_executor.execute(command));
    // typing the queued command by hand consumes it and resumes the queue
    auto& pending = m_state.pending_commands();
    if (pending.empty() || trim(pending.front()) != command) return;
    m_state.pop_pending_command();
    std::vector<std::string> rest = m_state.pending_commands();
    m_state.clear_pending_commands();
    if (!should_stop()) run_lines(rest);
}

void Resolver::run_natural_language(const ContextBundle& bundle) {
    if (is_rerun_phrase(bundle.command)) {
        run_pending();
        return;
    }
    switch (m_state.mode()) {
        case Mode::Shell:
            run_shell(bundle.command);
            return;
        case Mode::Assistant:
            run_assistant(bundle.command);
            return;
        case Mode::NaturalLanguage:
            translate_and_run(bundle);
            return;
    }
}

void Resolver::run_assistant(const std::string& request) {
    if (request.empty()) {
        m_state.set_mode(Mode::Assistant);
        m_out << "Switched to " << mode_name(Mode::Assistant) << " mode\n";
        m_state.set_last_exit_code(0);
        return;
    }
    if (!m_assistant) {
        m_err << "webwright: assistant mode is not available\n";
        m_state.set_last_exit_code(1);
        return;
    }
    auto r = m_assistant->handle(request, m_state);
    print_result(r);
    m_state.set_last_exit_code(r.exit_code);
}

ai::TranslationContext Resolver::translation_context(const ContextBundle& bundle) const {
    ai::TranslationContext ctx;
    ctx.cwd = m_state.working_directory();
    auto& h = m_state.history();
    size_t n = static_cast<size_t>(std::max(0, m_opts.history_context));
    ctx.recent_history.assign(h.size() > n ? h.end() - static_cast<std::ptrdiff_t>(n) : h.begin(), h.end());
    ctx.platform = m_opts.platform;
    ctx.shell = m_opts.shell;
    if (auto& last = m_state.last_command()) {
        LastCommand cut = *last;
        cut.stdout_text = tail_bytes(cut.stdout_text, kLastOutputTail);
        cut.stderr_text = tail_bytes(cut.stderr_text, kLastOutputTail);
        ctx.last = cut;
    }
    ctx.blocks = bundle.rendered();
    return ctx;
}

void Resolver::translate_and_run(const ContextBundle& bundle) {
    std::optional<std::string> text;
    if (m_translator) text = m_translator->translate(bundle.command, translation_context(bundle));
    if (!text) {
        Error err{ErrorKind::TranslationFailure, "Translation error: no command produced for '" + bundle.command + "'"};
        m_err << paint(err.message, "31") << '\n';
        m_state.set_last_exit_code(1);
        return;
    }
    for (auto& line : split_lines(*text)) {
        std::string t = trim(line);
        if (!t.empty() && t[0] == '#') m_out << paint(t, "36") << '\n';
    }
    auto commands = ai::extract_commands(*text);
    m_state.clear_pending_commands();
    if (commands.empty()) return;
    if (!m_opts.confirm_risky) {
        run_lines(commands);
        return;
    }
    size_t first_risky = 0;
    while (first_risky < commands.size() && should_autorun(commands[first_risky])) ++first_risky;
    std::vector<std::string> now(commands.begin(), commands.begin() + static_cast<std::ptrdiff_t>(first_risky));
    std::vector<std::string> later(commands.begin() + static_cast<std::ptrdiff_t>(first_risky), commands.end());
    run_lines(now);
    if (later.empty() || should_stop()) return;
    for (auto& c : later) m_out << paint("[queued] " + c, "33") << '\n';
    m_out << "Type 'run it' to execute, or type the command yourself.\n";
    m_state.set_pending_commands(later);
}

void Resolver::run_lines(const std::vector<std::string>& lines) {
    for (auto& line : lines) {
        run_echoed(line);
        if (should_stop()) return;
    }
}

void Resolver::run_pending() {
    if (m_state.pending_commands().empty()) {
        m_out << "Nothing queued to run.\n";
        return;
    }
    while (auto next = m_state.pop_pending_command()) {
        run_echoed(*next);
        if (should_stop()) {
            m_state.clear_pending_commands();
            return;
        }
    }
}

CommandResult Resolver::run_echoed(const std::string& command) {
    m_out << paint("$ " + command, "1") << '\n';
    auto r = m_executor.execute(command);
    print_result(r);
    return r;
}

void Resolver::print_result(const CommandResult& r) {
    if (!r.stdout_text.empty()) m_out << r.stdout_text;
    if (!r.stderr_text.empty()) {
        m_out.flush();
        m_err << paint(r.stderr_text, "31");
        m_err.flush();
    }
}

bool Resolver::should_stop() const {
    return m_state.exit_requested() || m_state.last_exit_code() == kExitInterrupted;
}

std::string Resolver::paint(const std::string& s, const char* code) const {
    if (!m_opts.color) return s;
    return std::string("\x1b[") + code + "m" + s + "\x1b[0m";
}

} // namespace webwright
