// Webwright main: interactive shell with natural language translation
#include <webwright/ai/assistant.hpp>
#include <webwright/ai/llm.hpp>
#include <webwright/ai/translator.hpp>
#include <webwright/config/config.hpp>
#include <webwright/context/assembler.hpp>
#include <webwright/context/clipboard.hpp>
#include <webwright/exec/executor.hpp>
#include <webwright/shell/host.hpp>
#include <webwright/shell/resolver.hpp>
#include <webwright/shell/state.hpp>
#include <webwright/util/log.hpp>

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <sys/utsname.h>
#include <unistd.h>

using namespace webwright;

static std::atomic<bool> g_interrupted{false};

static void sigint_handler(int) { g_interrupted = true; }

static void install_signals() {
    struct sigaction sa{};
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);
    // no job control: the shell itself is never stopped
    std::signal(SIGTSTP, SIG_IGN);
    std::signal(SIGQUIT, SIG_IGN);
}

static std::string platform_string() {
    struct utsname u{};
    if (uname(&u) != 0) return "unknown";
    return std::string(u.sysname) + " " + u.release + " (" + u.machine + ")";
}

static void usage(std::ostream& os) {
    os << "Usage: webwright [-d|--debug] [--config <path>] [-c <input>]\n"
       << "  -c <input>       resolve one input and exit (piped stdin becomes context)\n"
       << "  --config <path>  read settings from <path> instead of ~/.webwrightrc\n"
       << "  -d, --debug      print diagnostics to stderr\n";
}

int main(int argc, char* argv[]) {
    bool debug = false;
    std::optional<std::string> command;
    std::string config_path = default_config_path();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-d" || a == "--debug") debug = true;
        else if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
        else if ((a == "-c" || a == "--config") && i + 1 >= argc) {
            std::cerr << "webwright: " << a << " requires an argument\n";
            usage(std::cerr);
            return 2;
        }
        else if (a == "-c") command = argv[++i];
        else if (a == "--config") config_path = argv[++i];
        else {
            std::cerr << "webwright: unknown option '" << a << "'\n";
            usage(std::cerr);
            return 2;
        }
    }
    // debug first so config parsing diagnostics show up
    log::set_debug(debug);
    ShellConfig cfg = load_config(config_path);
    if (cfg.debug) log::set_debug(true);

    install_signals();
    const bool interactive_in = ::isatty(STDIN_FILENO);

    PosixHostEnvironment host;
    SessionState state(host, cfg.default_mode);

    ExecutorConfig exec_cfg;
    exec_cfg.timeout = std::chrono::seconds(cfg.command_timeout);
    exec_cfg.shell_path = cfg.shell_path;
    exec_cfg.cancel = &g_interrupted;
    exec_cfg.foreground_terminal = interactive_in;
    Executor executor(state, exec_cfg);

    SystemClipboard clipboard(state);
    std::unique_ptr<PipedStdin> piped;
    if (command && !interactive_in) piped = std::make_unique<PipedStdin>(STDIN_FILENO);
    ContextAssembler assembler(&clipboard, piped.get());

    ai::LlmTranslator translator(ai::make_llm(to_llm_config(cfg)));
    ai::StubAssistant assistant;

    ResolverOptions opts;
    opts.confirm_risky = cfg.confirm_risky;
    opts.history_context = cfg.history_context;
    opts.platform = platform_string();
    opts.shell = cfg.shell_path;
    opts.color = cfg.color && ::isatty(STDOUT_FILENO);
    Resolver resolver(state, executor, assembler, &translator, &assistant, std::cout, std::cerr, opts);

    if (command) {
        g_interrupted = false;
        resolver.handle(*command);
        return state.exit_requested() ? state.exit_status() : state.last_exit_code();
    }

    if (interactive_in) {
        std::cout << "\nWebwright Shell\n";
        std::cout << "System: " << opts.platform << "\n";
        std::cout << "Mode: " << mode_name(state.mode()) << " | provider=" << cfg.llm_provider;
        if (!cfg.llm_model.empty()) std::cout << " | model=" << cfg.llm_model;
        if (log::debug_enabled()) std::cout << " | debug";
        std::cout << "\nType 'mode' to switch between shell/nl/ai modes, 'exit' to quit.\n\n";
    }

    std::string line;
    while (true) {
        if (interactive_in) {
            std::cout << state.render_prompt(cfg.prompt_format);
            std::cout.flush();
        }
        if (!std::getline(std::cin, line)) {
            if (interactive_in) std::cout << "\nGoodbye!\n";
            break;
        }
        g_interrupted = false;
        resolver.handle(line);
        if (state.exit_requested()) {
            if (interactive_in) std::cout << "Goodbye!\n";
            break;
        }
    }
    return state.exit_requested() ? state.exit_status() : state.last_exit_code();
}
