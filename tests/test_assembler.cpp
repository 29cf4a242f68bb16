/*
 * Context assembler tests - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <webwright/context/assembler.hpp>
#include <webwright/shell/host.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

using namespace webwright;
namespace fs = std::filesystem;

namespace {

class FakeClipboard : public ClipboardReader {
public:
    explicit FakeClipboard(std::optional<std::string> text) : m_text(std::move(text)) {}
    std::optional<std::string> read() override { ++reads; return m_text; }
    int reads = 0;
private:
    std::optional<std::string> m_text;
};

class FakeStdin : public StdinSource {
public:
    explicit FakeStdin(std::optional<std::string> text) : m_text(std::move(text)) {}
    std::optional<std::string> content() override { return m_text; }
private:
    std::optional<std::string> m_text;
};

} // namespace

class AssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("ww_ctx_" + std::to_string(::getpid()));
        fs::create_directories(dir / "logs");
        std::ofstream(dir / "notes.txt") << "remember the milk";
        std::ofstream(dir / "logs" / "a.log") << "A";
        std::ofstream(dir / "logs" / "b.log") << "B";
        dir = fs::canonical(dir);
        host = std::make_unique<InMemoryHostEnvironment>(
            std::map<std::string, std::string>{{"HOME", dir.string()}}, dir.string());
        state = std::make_unique<SessionState>(*host);
    }
    void TearDown() override { std::error_code ec; fs::remove_all(dir, ec); }

    fs::path dir;
    std::unique_ptr<InMemoryHostEnvironment> host;
    std::unique_ptr<SessionState> state;
};

TEST_F(AssemblerTest, PlainTextPassesThrough) {
    ContextAssembler asmb(nullptr, nullptr);
    auto b = asmb.assemble("  list the files  ", *state);
    EXPECT_EQ(b.command, "list the files");
    EXPECT_TRUE(b.blocks.empty());
    EXPECT_TRUE(b.files.empty());
}

TEST_F(AssemblerTest, FileReferenceRead) {
    ContextAssembler asmb(nullptr, nullptr);
    auto b = asmb.assemble("summarize @notes.txt", *state);
    EXPECT_EQ(b.command, "summarize");
    ASSERT_EQ(b.blocks.size(), 1u);
    EXPECT_EQ(b.blocks[0].source, BlockSource::File);
    EXPECT_EQ(b.blocks[0].origin, "notes.txt");
    EXPECT_EQ(b.blocks[0].content, "remember the milk");
    EXPECT_EQ(b.blocks[0].render(), "# File: notes.txt\nremember the milk\n");
    ASSERT_EQ(b.files.size(), 1u);
    EXPECT_EQ(b.files[0], (dir / "notes.txt").string());
}

TEST_F(AssemblerTest, MissingFileYieldsNotice) {
    ContextAssembler asmb(nullptr, nullptr);
    auto b = asmb.assemble("@missing.txt", *state);
    EXPECT_EQ(b.command, "");
    ASSERT_EQ(b.blocks.size(), 1u);
    EXPECT_TRUE(b.blocks[0].is_error());
    EXPECT_EQ(b.blocks[0].status, BlockStatus::NotFound);
    auto err = b.blocks[0].error();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::FileReferenceNotFound);
    EXPECT_EQ(b.blocks[0].render(), "# Error: File not found: " + (dir / "missing.txt").string() + "\n");
    EXPECT_TRUE(b.files.empty());
}

TEST_F(AssemblerTest, DirectoryIsNotRead) {
    ContextAssembler asmb(nullptr, nullptr);
    auto b = asmb.assemble("look at @logs", *state);
    ASSERT_EQ(b.blocks.size(), 1u);
    EXPECT_EQ(b.blocks[0].status, BlockStatus::NotFound);
}

TEST_F(AssemblerTest, GlobExpandsInOrder) {
    ContextAssembler asmb(nullptr, nullptr);
    auto b = asmb.assemble("compare @logs/*.log", *state);
    EXPECT_EQ(b.command, "compare");
    ASSERT_EQ(b.blocks.size(), 2u);
    EXPECT_EQ(b.blocks[0].origin, "logs/a.log");
    EXPECT_EQ(b.blocks[1].origin, "logs/b.log");

    auto none = asmb.assemble("compare @logs/*.csv", *state);
    ASSERT_EQ(none.blocks.size(), 1u);
    EXPECT_TRUE(none.blocks[0].is_error());
}

TEST_F(AssemblerTest, AtInsideWordIsNotAReference) {
    ContextAssembler asmb(nullptr, nullptr);
    auto b = asmb.assemble("mail user@example.com", *state);
    EXPECT_EQ(b.command, "mail user@example.com");
    EXPECT_TRUE(b.blocks.empty());
}

TEST_F(AssemblerTest, ClipboardReadOnceForBothMarkers) {
    FakeClipboard clip(std::string("copied text"));
    ContextAssembler asmb(&clip, nullptr);
    auto b = asmb.assemble("explain {clipboard} and {clip}", *state);
    EXPECT_EQ(clip.reads, 1);
    EXPECT_EQ(b.command, "explain  and");
    ASSERT_EQ(b.blocks.size(), 1u);
    EXPECT_EQ(b.blocks[0].render(), "# Clipboard:\ncopied text");
}

TEST_F(AssemblerTest, UnavailableClipboardContributesNothing) {
    FakeClipboard clip(std::nullopt);
    ContextAssembler asmb(&clip, nullptr);
    auto b = asmb.assemble("explain {clip}", *state);
    EXPECT_EQ(b.command, "explain");
    EXPECT_TRUE(b.blocks.empty());
}

TEST_F(AssemblerTest, BlocksFollowMarkerOrderStdinLast) {
    FakeClipboard clip(std::string("C"));
    FakeStdin in(std::string("piped"));
    ContextAssembler asmb(&clip, &in);
    auto b = asmb.assemble("{clip} then @notes.txt", *state);
    EXPECT_EQ(b.command, "then");
    ASSERT_EQ(b.blocks.size(), 3u);
    EXPECT_EQ(b.blocks[0].source, BlockSource::Clipboard);
    EXPECT_EQ(b.blocks[1].source, BlockSource::File);
    EXPECT_EQ(b.blocks[2].source, BlockSource::Stdin);
    EXPECT_EQ(b.blocks[2].render(), "# Stdin:\npiped");
}

TEST_F(AssemblerTest, MarkerInsideFileTokenNotDoubleProcessed) {
    FakeClipboard clip(std::string("C"));
    ContextAssembler asmb(&clip, nullptr);
    auto b = asmb.assemble("@{clip}.txt", *state);
    EXPECT_EQ(clip.reads, 0);
    ASSERT_EQ(b.blocks.size(), 1u);
    EXPECT_EQ(b.blocks[0].source, BlockSource::File);
    EXPECT_EQ(b.command, "");
}

TEST_F(AssemblerTest, RepeatedAssemblyIsIdentical) {
    FakeClipboard clip(std::string("C"));
    FakeStdin in(std::string("piped"));
    ContextAssembler asmb(&clip, &in);
    auto a = asmb.assemble("use @notes.txt {clip}", *state);
    auto b = asmb.assemble("use @notes.txt {clip}", *state);
    EXPECT_EQ(a.command, b.command);
    EXPECT_EQ(a.rendered(), b.rendered());
    EXPECT_EQ(a.files, b.files);
}

TEST(PipedStdinTest, ReadsOnceAndCaches) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    ASSERT_EQ(::write(fds[1], "hello", 5), 5);
    ::close(fds[1]);
    PipedStdin in(fds[0]);
    EXPECT_EQ(in.content().value_or(""), "hello");
    EXPECT_EQ(in.content().value_or(""), "hello");
    ::close(fds[0]);
}
