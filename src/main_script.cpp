/*
 * Webwright Script Runner
 * Reads a file line by line and resolves each line exactly as the interactive
 * shell would (built-ins, shell commands, natural language, ai: requests).
 */
#include <webwright/ai/assistant.hpp>
#include <webwright/ai/translator.hpp>
#include <webwright/config/config.hpp>
#include <webwright/context/assembler.hpp>
#include <webwright/context/clipboard.hpp>
#include <webwright/exec/executor.hpp>
#include <webwright/shell/host.hpp>
#include <webwright/shell/resolver.hpp>
#include <webwright/util/log.hpp>
#include <webwright/util/text.hpp>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace webwright;

static std::atomic<bool> g_stop{false};
static void sigint_handler(int) { g_stop = true; }

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: webwright-script <file>" << std::endl;
        return 1;
    }
    std::string path = argv[1];
    std::ifstream in(path);
    if (!in) { std::perror("open script"); return 1; }

    std::signal(SIGINT, sigint_handler);

    ShellConfig cfg = load_config(default_config_path());
    log::set_debug(cfg.debug);
    PosixHostEnvironment host;
    SessionState state(host, cfg.default_mode);

    ExecutorConfig exec_cfg;
    exec_cfg.timeout = std::chrono::seconds(cfg.command_timeout);
    exec_cfg.shell_path = cfg.shell_path;
    exec_cfg.cancel = &g_stop;
    Executor executor(state, exec_cfg);
    SystemClipboard clipboard(state);
    ContextAssembler assembler(&clipboard, nullptr);
    ai::LlmTranslator translator(ai::make_llm(to_llm_config(cfg)));
    ai::StubAssistant assistant;
    ResolverOptions opts;
    opts.history_context = cfg.history_context;
    opts.shell = cfg.shell_path;
    Resolver resolver(state, executor, assembler, &translator, &assistant, std::cout, std::cerr, opts);

    int last_status = 0;
    size_t failed = 0;
    std::string line; size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (g_stop) { std::cerr << "Interrupted" << std::endl; break; }
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        last_status = resolver.handle(line);
        if (last_status != 0) {
            ++failed;
            std::cerr << "Line " << lineno << " exit status " << last_status << std::endl;
        }
        if (state.exit_requested()) return state.exit_status();
    }
    if (failed) log::info(path + ": " + std::to_string(failed) + " of " + std::to_string(lineno) + " lines failed");
    return last_status;
}
