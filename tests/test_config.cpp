/*
 * Configuration tests - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <webwright/config/config.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace webwright;

TEST(ConfigTest, MissingFileGivesDefaults) {
    auto cfg = load_config("/nonexistent/webwrightrc");
    EXPECT_EQ(cfg.default_mode, Mode::NaturalLanguage);
    EXPECT_EQ(cfg.command_timeout, 300);
    EXPECT_EQ(cfg.shell_path, "/bin/sh");
    EXPECT_EQ(cfg.llm_provider, "none");
    EXPECT_FALSE(to_llm_config(cfg).enabled);
}

TEST(ConfigTest, ParsesRcFile) {
    std::string path = "/tmp/ww_rc_" + std::to_string(::getpid());
    {
        std::ofstream out(path);
        out << "# webwright settings\n"
            << "default_mode = shell\n"
            << "command_timeout=60\n"
            << "confirm_risky = yes\n"
            << "llm_provider = OpenAI\n"
            << "llm_model = gpt-4o-mini\n"
            << "llm_api_key_env = OPENAI_API_KEY\n"
            << "llm_temperature = 0.5\n"
            << "history_context = abc\n"
            << "this line has no equals\n"
            << "unknown_key = 1\n";
    }
    auto cfg = load_config(path);
    std::remove(path.c_str());
    EXPECT_EQ(cfg.default_mode, Mode::Shell);
    EXPECT_EQ(cfg.command_timeout, 60);
    EXPECT_TRUE(cfg.confirm_risky);
    EXPECT_EQ(cfg.history_context, 5);
    EXPECT_DOUBLE_EQ(cfg.llm_temperature, 0.5);

    auto llm = to_llm_config(cfg);
    EXPECT_TRUE(llm.enabled);
    EXPECT_EQ(llm.provider, "openai");
    EXPECT_EQ(llm.model, "gpt-4o-mini");
    EXPECT_EQ(llm.api_key_env, "OPENAI_API_KEY");
}

TEST(ConfigTest, ApplyValueRejectsUnknownAndBadNumbers) {
    ShellConfig cfg;
    EXPECT_FALSE(apply_config_value(cfg, "nope", "1"));
    EXPECT_TRUE(apply_config_value(cfg, "command_timeout", "0"));
    EXPECT_EQ(cfg.command_timeout, 300);
    EXPECT_TRUE(apply_config_value(cfg, "default_mode", "weird"));
    EXPECT_EQ(cfg.default_mode, Mode::NaturalLanguage);
}

TEST(ConfigTest, ParseBool) {
    EXPECT_TRUE(parse_bool("TRUE"));
    EXPECT_TRUE(parse_bool(" on "));
    EXPECT_TRUE(parse_bool("1"));
    EXPECT_FALSE(parse_bool("off"));
    EXPECT_FALSE(parse_bool(""));
}

TEST(ConfigTest, ExplicitPathFromEnvironment) {
    ::setenv("WEBWRIGHT_CONFIG", "/etc/webwright.rc", 1);
    EXPECT_EQ(default_config_path(), "/etc/webwright.rc");
    ::unsetenv("WEBWRIGHT_CONFIG");
}
