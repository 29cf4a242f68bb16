/*
 * JSON text helper tests - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <webwright/ai/json_text.hpp>

using namespace webwright::ai;

TEST(JsonText, EscapeControlAndQuotes) {
    EXPECT_EQ(json_escape("a\"b\\c\n"), "a\\\"b\\\\c\\n");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(JsonText, StringFieldUnescapes) {
    std::string body = R"({"id":"x","choices":[{"message":{"content":"ls -la\n# \"q\" caf\u00e9"}}]})";
    auto v = json_string_field(body, "content");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "ls -la\n# \"q\" caf\xC3\xA9");
}

TEST(JsonText, SurrogatePairDecoded) {
    auto v = json_string_field(R"({"text":"\ud83d\ude00"})", "text");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "\xF0\x9F\x98\x80");
}

TEST(JsonText, KeyMustBeFollowedByColon) {
    std::string body = R"({"role":"text","text":"real"})";
    EXPECT_EQ(json_string_field(body, "text").value_or(""), "real");
    EXPECT_FALSE(json_string_field(body, "missing").has_value());
}

TEST(JsonText, IntField) {
    std::string body = R"({"usage":{"prompt_tokens": 12,"total_tokens":30}})";
    EXPECT_EQ(json_int_field(body, "prompt_tokens"), 12);
    EXPECT_EQ(json_int_field(body, "total_tokens"), 30);
    EXPECT_EQ(json_int_field(body, "completion_tokens"), -1);
}
