#include "frontend/formatter.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

using namespace frontend;  // NOLINT

const char* test_tmpdir = "/tmp/scriptbox_formatter_testdir";

static const constexpr char kBrokenFence[] =
    "\xE2\x80\x8B`\xE2\x80\x8B`\xE2\x80\x8B`\xE2\x80\x8B";

size_t Chars(const std::string& s) {
  size_t chars = 0;
  for (char c : s) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) chars++;
  }
  return chars;
}

sandbox::SandboxResult Completed(const std::string& text) {
  sandbox::SandboxResult result;
  result.status = sandbox::SandboxResult::Status::COMPLETED;
  result.has_text = true;
  result.text = text;
  result.duration_nanos = 1500000;
  return result;
}

/*
 * Code blocks
 */

// NOLINTNEXTLINE
TEST(Formatter, NeutralizeFences) {
  EXPECT_EQ(NeutralizeFences("no fences"), "no fences");
  EXPECT_EQ(NeutralizeFences("a```b"), std::string("a") + kBrokenFence + "b");
  EXPECT_EQ(NeutralizeFences("``"), "``");
  EXPECT_EQ(NeutralizeFences("``````"),
            std::string(kBrokenFence) + kBrokenFence);
  EXPECT_EQ(NeutralizeFences("````").find("```"), std::string::npos);
}

// NOLINTNEXTLINE
TEST(Formatter, CodeBlock) {
  EXPECT_EQ(CodeBlock("x"), "```\nx```");
  EXPECT_EQ(CodeBlock("x", 20, true), "```\nx ...```");
}

// NOLINTNEXTLINE
TEST(Formatter, CodeBlockIsCut) {
  std::string text(3000, 'a');
  std::string block = CodeBlock(text);
  EXPECT_EQ(Chars(block), kMaxBlockChars);
  EXPECT_THAT(block, StartsWith("```\naaa"));
  EXPECT_THAT(block, HasSubstr("a ...```"));

  std::string wide;
  for (int i = 0; i < 3000; i++) wide += "\xC3\xA9";
  EXPECT_EQ(Chars(CodeBlock(wide)), kMaxBlockChars);
}

// NOLINTNEXTLINE
TEST(Formatter, CodeBlockTooSmall) { EXPECT_ANY_THROW(CodeBlock("x", 8)); }

/*
 * Results
 */

// NOLINTNEXTLINE
TEST(Formatter, RenderText) {
  Message message = Render(Completed("42"));
  EXPECT_EQ(message.title, "Returned text (code executed in 1.5000 ms):");
  EXPECT_EQ(message.body, "```\n42```");
  EXPECT_EQ(message.notice, "");
}

// NOLINTNEXTLINE
TEST(Formatter, RenderNoText) {
  sandbox::SandboxResult result = Completed("");
  result.has_text = false;
  EXPECT_EQ(Render(result).body, "```\n ```");
}

// NOLINTNEXTLINE
TEST(Formatter, RenderTruncatedText) {
  sandbox::SandboxResult result = Completed("abc");
  result.text_truncated = true;
  EXPECT_EQ(Render(result).body, "```\nabc ...```");
}

// NOLINTNEXTLINE
TEST(Formatter, RenderHostileText) {
  Message message = Render(Completed("```\n@everyone\n```"));
  EXPECT_EQ(message.body.find("```", 4), message.body.size() - 3);
}

// NOLINTNEXTLINE
TEST(Formatter, RenderException) {
  sandbox::SandboxResult result;
  result.status = sandbox::SandboxResult::Status::FAILED;
  result.exception.kind = "ValueError";
  result.exception.args = {"bad", "3"};
  Message message = Render(result);
  EXPECT_EQ(message.title, "An exception occured!");
  EXPECT_EQ(message.body, "```\nValueError: bad, 3```");
}

// NOLINTNEXTLINE
TEST(Formatter, RenderExceptionWithFence) {
  sandbox::SandboxResult result;
  result.status = sandbox::SandboxResult::Status::FAILED;
  result.exception.kind = "KeyError";
  result.exception.args = {"```"};
  EXPECT_EQ(Render(result).body,
            std::string("```\nKeyError: ") + kBrokenFence + "```");
}

// NOLINTNEXTLINE
TEST(Formatter, RenderTimeout) {
  sandbox::SandboxResult result;
  result.status = sandbox::SandboxResult::Status::TIMED_OUT;
  result.exception.kind = "TimeoutError";
  result.exception.args = {"execution exceeded 2000 ms"};
  EXPECT_EQ(Render(result).body,
            "```\nTimeoutError: execution exceeded 2000 ms```");
}

// NOLINTNEXTLINE
TEST(Formatter, RenderImageTooLarge) {
  sandbox::SandboxResult result = Completed("x");
  result.image_too_large = true;
  EXPECT_THAT(Render(result).notice, HasSubstr(">4 MiB"));
}

/*
 * Units
 */

// NOLINTNEXTLINE
TEST(Formatter, FormatTime) {
  EXPECT_EQ(FormatTime(2.5), "2.5000 s");
  EXPECT_EQ(FormatTime(0.0015), "1.5000 ms");
  EXPECT_EQ(FormatTime(2e-6, 1), "2.0 \xCE\xBCs");
  EXPECT_EQ(FormatTime(3e-9, 0), "3 ns");
  EXPECT_EQ(FormatTime(0), "very fast");
}

// NOLINTNEXTLINE
TEST(Formatter, FormatBytes) {
  EXPECT_EQ(FormatBytes(512), "512 B");
  EXPECT_EQ(FormatBytes(1536), "1.500 KiB");
  EXPECT_EQ(FormatBytes(4194304), "4 MiB");
  EXPECT_EQ(FormatBytes(1610612736, 1), "1.5 GiB");
  EXPECT_EQ(FormatBytes(1024), "1 KiB");
}

/*
 * Pages
 */

// NOLINTNEXTLINE
TEST(Formatter, SplitShortMessage) {
  EXPECT_THAT(SplitLongMessage("a\nb\n"), testing::ElementsAre("a\nb\n"));
  EXPECT_TRUE(SplitLongMessage("").empty());
}

// NOLINTNEXTLINE
TEST(Formatter, SplitAtNewlines) {
  EXPECT_THAT(SplitLongMessage("aaa\nbbb\nccc", 8),
              testing::ElementsAre("aaa\nbbb\n", "ccc"));
}

// NOLINTNEXTLINE
TEST(Formatter, SplitLongLines) {
  EXPECT_THAT(SplitLongMessage("abcdefghij\nk", 4),
              testing::ElementsAre("abcd", "efgh", "ij\nk"));
}

/*
 * Artifacts
 */

class ArtifactTest : public ::testing::Test {
 protected:
  void SetUp() override { util::File::MakeDirs(test_tmpdir); }
  // Artifacts remove themselves, so the directory is empty again.
  void TearDown() override { EXPECT_EQ(rmdir(test_tmpdir), 0); }
};

// NOLINTNEXTLINE
TEST_F(ArtifactTest, WritesTemporaryPng) {
  sandbox::Artifact image;
  image.width = 1;
  image.height = 1;
  image.png = "\x89PNG fake";
  std::string path;
  {
    ArtifactFile artifact(test_tmpdir, image);
    ASSERT_FALSE(artifact.TooLarge());
    path = artifact.Path();
    EXPECT_THAT(path, StartsWith(test_tmpdir));
    EXPECT_EQ(path.substr(path.size() - 4), ".png");
    EXPECT_EQ(util::File::Read(path, 1024), image.png);
  }
  struct stat st {};
  EXPECT_EQ(stat(path.c_str(), &st), -1);
}

// NOLINTNEXTLINE
TEST_F(ArtifactTest, RefusesLargeImages) {
  sandbox::Artifact image;
  image.png = std::string(Flags::max_artifact_bytes + 1, 'x');
  ArtifactFile artifact(test_tmpdir, image);
  EXPECT_TRUE(artifact.TooLarge());
  EXPECT_EQ(artifact.Path(), "");
}

}  // namespace
