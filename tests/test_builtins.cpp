/*
 * Built-in command tests - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <webwright/exec/builtins.hpp>
#include <webwright/shell/host.hpp>
#include <filesystem>
#include <memory>
#include <unistd.h>

using namespace webwright;
namespace fs = std::filesystem;

class BuiltinsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("ww_builtins_" + std::to_string(::getpid()));
        fs::create_directories(dir / "a");
        dir = fs::canonical(dir);
        host = std::make_unique<InMemoryHostEnvironment>(
            std::map<std::string, std::string>{{"HOME", dir.string()}}, dir.string());
        state = std::make_unique<SessionState>(*host);
    }
    void TearDown() override { std::error_code ec; fs::remove_all(dir, ec); }

    CommandResult run(std::vector<std::string> argv) {
        auto r = run_builtin(argv, *state);
        EXPECT_TRUE(r.has_value());
        return r.value_or(CommandResult{});
    }

    fs::path dir;
    std::unique_ptr<InMemoryHostEnvironment> host;
    std::unique_ptr<SessionState> state;
};

TEST_F(BuiltinsTest, TableCoversShellBuiltins) {
    for (auto name : {"cd", "pwd", "export", "unset", "mode", "exit", "alias", "unalias", "history"}) {
        EXPECT_TRUE(is_builtin(name)) << name;
    }
    EXPECT_FALSE(is_builtin("ls"));
    EXPECT_FALSE(run_builtin({"ls"}, *state).has_value());
}

TEST_F(BuiltinsTest, CdAndPwd) {
    auto r = run({"cd", "a"});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(run({"pwd"}).stdout_text, (dir / "a").string() + "\n");

    r = run({"cd", "-"});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_text, dir.string() + "\n");

    ASSERT_EQ(run({"cd", "a"}).exit_code, 0);
    ASSERT_EQ(run({"cd"}).exit_code, 0);
    EXPECT_EQ(state->working_directory(), dir.string());
}

TEST_F(BuiltinsTest, CdErrors) {
    auto r = run({"cd", "missing"});
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.stderr_text, "cd: " + (dir / "missing").string() + ": No such directory\n");
    EXPECT_EQ(state->working_directory(), dir.string());

    r = run({"cd", "a", "b"});
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.stderr_text, "cd: too many arguments\n");

    r = run({"cd", "-"});
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.stderr_text, "cd: OLDPWD not set\n");
}

TEST_F(BuiltinsTest, ExportAndUnset) {
    auto r = run({"export", "FOO=bar", "EMPTY="});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(state->env("FOO").value_or(""), "bar");
    EXPECT_EQ(host->env().at("EMPTY"), "");

    r = run({"export"});
    EXPECT_NE(r.stdout_text.find("FOO=bar\n"), std::string::npos);

    r = run({"export", "=oops"});
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_FALSE(r.stderr_text.empty());

    EXPECT_EQ(run({"unset", "FOO"}).exit_code, 0);
    EXPECT_FALSE(state->env("FOO").has_value());
}

TEST_F(BuiltinsTest, ModeSwitching) {
    auto r = run({"mode"});
    EXPECT_EQ(r.stdout_text, "Current mode: nl\nAvailable: shell, nl, ai\n");

    r = run({"mode", "shell"});
    EXPECT_EQ(r.stdout_text, "Switched to shell mode\n");
    EXPECT_EQ(state->mode(), Mode::Shell);

    r = run({"mode", "turbo"});
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.stderr_text, "Invalid mode: turbo. Use: shell, nl, or ai\n");
    EXPECT_EQ(state->mode(), Mode::Shell);
}

TEST_F(BuiltinsTest, ExitStatus) {
    auto r = run({"exit", "300"});
    EXPECT_TRUE(state->exit_requested());
    EXPECT_EQ(state->exit_status(), 300 & 0xff);
    EXPECT_EQ(r.exit_code, 300 & 0xff);
}

TEST_F(BuiltinsTest, AliasLifecycle) {
    EXPECT_EQ(run({"alias", "ll=ls -la"}).exit_code, 0);
    EXPECT_EQ(run({"alias"}).stdout_text, "alias ll='ls -la'\n");
    EXPECT_EQ(run({"alias", "ll"}).stdout_text, "alias ll='ls -la'\n");
    auto r = run({"alias", "nope"});
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.stderr_text, "alias: nope: not found\n");

    EXPECT_EQ(run({"unalias", "ll"}).exit_code, 0);
    EXPECT_EQ(run({"unalias", "ll"}).stderr_text, "unalias: ll: not found\n");
    EXPECT_EQ(run({"unalias"}).exit_code, 1);
}

TEST_F(BuiltinsTest, HistoryListing) {
    state->append_history("ls");
    state->append_history("pwd");
    state->append_history("git status");
    EXPECT_EQ(run({"history"}).stdout_text, "    1  ls\n    2  pwd\n    3  git status\n");
    EXPECT_EQ(run({"history", "1"}).stdout_text, "    3  git status\n");
    EXPECT_EQ(run({"history", "x"}).exit_code, 1);
}
