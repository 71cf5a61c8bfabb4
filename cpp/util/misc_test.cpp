#include "util/misc.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

/*
 * Setters
 */

// NOLINTNEXTLINE
TEST(Misc, SetBool) {
  bool x = false;
  EXPECT_TRUE(util::setBool(x)());
  EXPECT_TRUE(x);
}

// NOLINTNEXTLINE
TEST(Misc, SetString) {
  std::string x;
  EXPECT_TRUE(util::setString(x)("wow"));
  EXPECT_EQ(x, "wow");
}

// NOLINTNEXTLINE
TEST(Misc, SetInt) {
  int x = 0;
  EXPECT_TRUE(util::setInt(x)("-1500"));
  EXPECT_EQ(x, -1500);
  EXPECT_FALSE(util::setInt(x)("millis"));
  EXPECT_EQ(x, -1500);
}

// NOLINTNEXTLINE
TEST(Misc, SetUint) {
  uint32_t x = 0;
  EXPECT_TRUE(util::setUint(x)("4194304"));
  EXPECT_EQ(x, 4194304u);
  EXPECT_FALSE(util::setUint(x)("-1"));
  EXPECT_FALSE(util::setUint(x)("99999999999"));
  EXPECT_EQ(x, 4194304u);
}

/*
 * UTF-8
 */

// NOLINTNEXTLINE
TEST(Misc, AppendUtf8) {
  std::string s;
  util::AppendUtf8(&s, 'a');
  util::AppendUtf8(&s, 0xE9);
  util::AppendUtf8(&s, 0x20AC);
  util::AppendUtf8(&s, 0x1F600);
  EXPECT_EQ(s, "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
}

// NOLINTNEXTLINE
TEST(Misc, TruncateUtf8KeepsShortStrings) {
  bool truncated = true;
  EXPECT_EQ(util::TruncateUtf8("abc", 3, &truncated), "abc");
  EXPECT_FALSE(truncated);
}

// NOLINTNEXTLINE
TEST(Misc, TruncateUtf8CountsCodePoints) {
  bool truncated = false;
  // Two code points, five bytes.
  std::string s = "\xC3\xA9\xE2\x82\xAC!";
  EXPECT_EQ(util::TruncateUtf8(s, 2, &truncated), "\xC3\xA9\xE2\x82\xAC");
  EXPECT_TRUE(truncated);
  EXPECT_EQ(util::TruncateUtf8(s, 1), "\xC3\xA9");
  EXPECT_EQ(util::TruncateUtf8(s, 0), "");
}

}  // namespace
