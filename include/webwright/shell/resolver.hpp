/*
 * Resolution loop - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 * Description: one accepted input at a time: assemble context, classify,
 *              translate when needed, execute and print. History is appended
 *              after the input has been handled, even when handling threw.
 */
#pragma once
#include <webwright/ai/assistant.hpp>
#include <webwright/ai/translator.hpp>
#include <webwright/classify/classifier.hpp>
#include <webwright/context/assembler.hpp>
#include <webwright/exec/executor.hpp>
#include <webwright/shell/state.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace webwright {

struct ResolverOptions {
    bool confirm_risky = false;
    int history_context = 5;
    std::string platform;           // shown to the translator
    std::string shell;
    bool color = false;
};

class Resolver {
public:
    // translator and assistant may be null.
    Resolver(SessionState& state, Executor& executor, const ContextAssembler& assembler,
             ai::TranslationGateway* translator, ai::AssistantHandler* assistant,
             std::ostream& out, std::ostream& err, ResolverOptions opts = {});

    // Handles one raw input line; returns the session's last exit code.
    int handle(const std::string& raw);

    bool exit_requested() const { return m_state.exit_requested(); }

private:
    void dispatch(const ContextBundle& bundle);
    void run_shell(const std::string& command);
    void run_natural_language(const ContextBundle& bundle);
    void run_assistant(const std::string& request);
    void translate_and_run(const ContextBundle& bundle);
    void run_lines(const std::vector<std::string>& lines);
    void run_pending();
    CommandResult run_echoed(const std::string& command);
    void print_result(const CommandResult& r);
    bool should_stop() const;
    ai::TranslationContext translation_context(const ContextBundle& bundle) const;
    std::string paint(const std::string& s, const char* code) const;

    SessionState& m_state;
    Executor& m_executor;
    const ContextAssembler& m_assembler;
    ai::TranslationGateway* m_translator;
    ai::AssistantHandler* m_assistant;
    std::ostream& m_out;
    std::ostream& m_err;
    ResolverOptions m_opts;
};

// Bytes of previous stdout/stderr passed to the translator.
inline constexpr std::size_t kLastOutputTail = 2000;

} // namespace webwright
