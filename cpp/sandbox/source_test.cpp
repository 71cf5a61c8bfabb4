#include "sandbox/source.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using namespace sandbox;  // NOLINT

// NOLINTNEXTLINE
TEST(Source, PlainCode) {
  EXPECT_EQ(NormalizeSource("print(1)"), "print(1)");
  EXPECT_EQ(NormalizeSource("  \n1 + 1\n\t "), "1 + 1");
  EXPECT_EQ(NormalizeSource(""), "");
  EXPECT_EQ(NormalizeSource(" \n "), "");
}

// NOLINTNEXTLINE
TEST(Source, FenceWithLanguage) {
  EXPECT_EQ(NormalizeSource("```py\nprint(1)\n```"), "print(1)\n");
  EXPECT_EQ(NormalizeSource("```python\nx = 1\nx\n```"), "x = 1\nx\n");
  EXPECT_EQ(NormalizeSource("```c++\n1\n```"), "1\n");
}

// NOLINTNEXTLINE
TEST(Source, FenceWithoutLanguage) {
  EXPECT_EQ(NormalizeSource("```\nprint(1)\n```"), "print(1)\n");
  EXPECT_EQ(NormalizeSource("```print(1)```"), "print(1)");
}

// NOLINTNEXTLINE
TEST(Source, CodeOnTheFenceLine) {
  // Not a language tag, so it stays.
  EXPECT_EQ(NormalizeSource("```x = 1\nx\n```"), "x = 1\nx\n");
}

// NOLINTNEXTLINE
TEST(Source, UnclosedFence) {
  EXPECT_EQ(NormalizeSource("```py\n1 + 1"), "1 + 1");
}

// NOLINTNEXTLINE
TEST(Source, InlineCode) {
  EXPECT_EQ(NormalizeSource("`1 + 1`"), "1 + 1");
  EXPECT_EQ(NormalizeSource("`"), "`");
  EXPECT_EQ(NormalizeSource("``"), "");
}

// NOLINTNEXTLINE
TEST(Source, WhitespaceAroundFence) {
  EXPECT_EQ(NormalizeSource("  ```py\nprint(1)\n```  "), "print(1)\n");
  EXPECT_EQ(NormalizeSource("\n\n```\n\nx\n```\n"), "\nx\n");
}

}  // namespace
