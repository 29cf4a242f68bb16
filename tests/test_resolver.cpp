/*
 * Resolution loop tests - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <webwright/ai/assistant.hpp>
#include <webwright/shell/host.hpp>
#include <webwright/shell/resolver.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

using namespace webwright;
namespace fs = std::filesystem;

namespace {

class FakeGateway : public ai::TranslationGateway {
public:
    std::optional<std::string> translate(const std::string& request, const ai::TranslationContext& ctx) override {
        requests.push_back(request);
        last_ctx = ctx;
        if (throw_next) throw std::runtime_error("gateway exploded");
        return reply;
    }
    std::optional<std::string> reply;
    bool throw_next = false;
    std::vector<std::string> requests;
    ai::TranslationContext last_ctx;
};

} // namespace

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("ww_resolver_" + std::to_string(::getpid()));
        fs::create_directories(dir);
        dir = fs::canonical(dir);
        std::ofstream(dir / "notes.txt") << "alpha\nbeta\n";
        host = std::make_unique<InMemoryHostEnvironment>(
            std::map<std::string, std::string>{{"HOME", dir.string()}, {"PATH", "/usr/bin:/bin"}}, dir.string());
        state = std::make_unique<SessionState>(*host);
        executor = std::make_unique<Executor>(*state);
        assembler = std::make_unique<ContextAssembler>(nullptr, nullptr);
        make_resolver(ResolverOptions{});
    }
    void TearDown() override { std::error_code ec; fs::remove_all(dir, ec); }

    void make_resolver(ResolverOptions opts) {
        resolver = std::make_unique<Resolver>(*state, *executor, *assembler, &gateway, &assistant, out, err, opts);
    }

    fs::path dir;
    std::unique_ptr<InMemoryHostEnvironment> host;
    std::unique_ptr<SessionState> state;
    std::unique_ptr<Executor> executor;
    std::unique_ptr<ContextAssembler> assembler;
    FakeGateway gateway;
    ai::StubAssistant assistant;
    std::ostringstream out;
    std::ostringstream err;
    std::unique_ptr<Resolver> resolver;
};

TEST_F(ResolverTest, ShellInputRunsDirectly) {
    EXPECT_EQ(resolver->handle("echo hi"), 0);
    EXPECT_EQ(out.str(), "hi\n");
    EXPECT_TRUE(gateway.requests.empty());
    ASSERT_EQ(state->history().size(), 1u);
    EXPECT_EQ(state->history()[0], "echo hi");
}

TEST_F(ResolverTest, BlankInputIsIgnored) {
    state->set_last_exit_code(4);
    EXPECT_EQ(resolver->handle("   "), 4);
    EXPECT_TRUE(state->history().empty());
}

TEST_F(ResolverTest, CommentIsRecordedButNotRun) {
    EXPECT_EQ(resolver->handle("# just a note"), 0);
    EXPECT_EQ(out.str(), "");
    EXPECT_EQ(state->history().size(), 1u);
}

TEST_F(ResolverTest, NaturalLanguageTranslatedAndRun) {
    gateway.reply = "# say hello\necho hello\necho world";
    EXPECT_EQ(resolver->handle("greet the world"), 0);
    ASSERT_EQ(gateway.requests.size(), 1u);
    EXPECT_EQ(gateway.requests[0], "greet the world");
    EXPECT_EQ(out.str(), "# say hello\n$ echo hello\nhello\n$ echo world\nworld\n");
}

TEST_F(ResolverTest, TranslationFailureReported) {
    gateway.reply = std::nullopt;
    EXPECT_EQ(resolver->handle("do something clever"), 1);
    EXPECT_EQ(err.str(), "Translation error: no command produced for 'do something clever'\n");
    EXPECT_EQ(state->history().size(), 1u);
}

TEST_F(ResolverTest, GatewayExceptionDoesNotEndLoop) {
    gateway.throw_next = true;
    EXPECT_EQ(resolver->handle("break things"), 1);
    EXPECT_NE(err.str().find("Error: gateway exploded"), std::string::npos);
    gateway.throw_next = false;
    EXPECT_EQ(resolver->handle("echo still alive"), 0);
}

TEST_F(ResolverTest, ContextBlocksReachTranslator) {
    gateway.reply = "# nothing to run";
    resolver->handle("pwd");
    resolver->handle("summarize @notes.txt");
    EXPECT_EQ(gateway.requests.back(), "summarize");
    ASSERT_EQ(gateway.last_ctx.blocks.size(), 1u);
    EXPECT_EQ(gateway.last_ctx.blocks[0], "# File: notes.txt\nalpha\nbeta\n\n");
    EXPECT_EQ(gateway.last_ctx.cwd, dir.string());
    ASSERT_EQ(gateway.last_ctx.recent_history.size(), 1u);
    EXPECT_EQ(gateway.last_ctx.recent_history[0], "pwd");
    ASSERT_TRUE(gateway.last_ctx.last.has_value());
    EXPECT_EQ(gateway.last_ctx.last->command, "pwd");
}

TEST_F(ResolverTest, HistoryContextIsBounded) {
    ResolverOptions opts;
    opts.history_context = 2;
    make_resolver(opts);
    gateway.reply = "# ok";
    for (auto c : {"echo 1", "echo 2", "echo 3"}) resolver->handle(c);
    resolver->handle("what happened");
    ASSERT_EQ(gateway.last_ctx.recent_history.size(), 2u);
    EXPECT_EQ(gateway.last_ctx.recent_history[0], "echo 2");
    EXPECT_EQ(gateway.last_ctx.recent_history[1], "echo 3");
}

TEST_F(ResolverTest, MissingFileReferenceKeepsExitCode) {
    EXPECT_EQ(resolver->handle("pwd"), 0);
    EXPECT_EQ(resolver->handle("@missing.txt"), 0);
    EXPECT_EQ(state->last_exit_code(), 0);
    EXPECT_NE(err.str().find("webwright: File not found: "), std::string::npos);
    EXPECT_TRUE(gateway.requests.empty());
}

TEST_F(ResolverTest, AssistantPrefix) {
    EXPECT_EQ(resolver->handle("ai: summarize | this"), 0);
    EXPECT_EQ(out.str(), "AI mode not yet implemented\nRequest: summarize | this\n");
    EXPECT_TRUE(gateway.requests.empty());
}

TEST_F(ResolverTest, EmptyAssistantPrefixSwitchesMode) {
    resolver->handle("ai:");
    EXPECT_EQ(state->mode(), Mode::Assistant);
    EXPECT_EQ(out.str(), "Switched to ai mode\n");
    out.str("");
    resolver->handle("tell me a story");
    EXPECT_EQ(out.str(), "AI mode not yet implemented\nRequest: tell me a story\n");
}

TEST_F(ResolverTest, ShellModeSkipsTranslation) {
    resolver->handle("mode shell");
    EXPECT_EQ(state->mode(), Mode::Shell);
    resolver->handle("printf plain");
    resolver->handle("hello there");
    EXPECT_TRUE(gateway.requests.empty());
    EXPECT_EQ(state->last_exit_code(), kExitNotFound);
}

TEST_F(ResolverTest, RiskyLinesQueuedUntilConfirmed) {
    ResolverOptions opts;
    opts.confirm_risky = true;
    make_resolver(opts);
    std::ofstream(dir / "junk.tmp") << "x";
    gateway.reply = "echo cleaning\nrm junk.tmp\necho done";
    resolver->handle("clean up the junk");
    EXPECT_NE(out.str().find("$ echo cleaning\ncleaning\n"), std::string::npos);
    EXPECT_NE(out.str().find("[queued] rm junk.tmp\n[queued] echo done\n"), std::string::npos);
    EXPECT_TRUE(fs::exists(dir / "junk.tmp"));
    ASSERT_EQ(state->pending_commands().size(), 2u);

    out.str("");
    resolver->handle("run it");
    EXPECT_FALSE(fs::exists(dir / "junk.tmp"));
    EXPECT_EQ(out.str(), "$ rm junk.tmp\n$ echo done\ndone\n");
    EXPECT_TRUE(state->pending_commands().empty());

    out.str("");
    resolver->handle("run it");
    EXPECT_EQ(out.str(), "Nothing queued to run.\n");
}

TEST_F(ResolverTest, TypingQueuedCommandResumesQueue) {
    ResolverOptions opts;
    opts.confirm_risky = true;
    make_resolver(opts);
    std::ofstream(dir / "old.log") << "x";
    gateway.reply = "rm old.log\necho after";
    resolver->handle("remove the old log");
    ASSERT_EQ(state->pending_commands().size(), 2u);
    out.str("");
    resolver->handle("rm old.log");
    EXPECT_FALSE(fs::exists(dir / "old.log"));
    EXPECT_EQ(out.str(), "$ echo after\nafter\n");
    EXPECT_TRUE(state->pending_commands().empty());
}

TEST_F(ResolverTest, NewTranslationDropsOldQueue) {
    ResolverOptions opts;
    opts.confirm_risky = true;
    make_resolver(opts);
    gateway.reply = "rm -rf nothing-here";
    resolver->handle("delete stuff");
    ASSERT_EQ(state->pending_commands().size(), 1u);
    gateway.reply = "echo fresh";
    resolver->handle("say something fresh");
    EXPECT_TRUE(state->pending_commands().empty());
}

TEST_F(ResolverTest, ExitStopsRemainingLines) {
    gateway.reply = "exit 5\necho unreachable";
    resolver->handle("leave now");
    EXPECT_TRUE(resolver->exit_requested());
    EXPECT_EQ(state->exit_status(), 5);
    EXPECT_EQ(out.str(), "$ exit 5\n");
}
