#include "script/ops.hpp"
#include <limits>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "script/error.hpp"

namespace {

using namespace script;  // NOLINT

const int64_t kMax = std::numeric_limits<int64_t>::max();

std::string KindOf(const std::function<void()>& f) {
  try {
    f();
  } catch (const ExecutionError& e) {
    return e.Kind();
  }
  return "";
}

/*
 * Arithmetic
 */

// NOLINTNEXTLINE
TEST(Ops, CheckedArithmetic) {
  EXPECT_EQ(CheckedAdd(40, 2), 42);
  EXPECT_EQ(CheckedMul(-6, 7), -42);
  EXPECT_EQ(KindOf([]() { CheckedAdd(kMax, 1); }), "OverflowError");
  EXPECT_EQ(KindOf([]() { CheckedMul(kMax / 2, 3); }), "OverflowError");
}

// NOLINTNEXTLINE
TEST(Ops, IntegerOperators) {
  EXPECT_EQ(BinaryOp(ast::BinOp::ADD, Value::Int(2), Value::Int(3)).AsInt(),
            5);
  EXPECT_EQ(
      BinaryOp(ast::BinOp::FLOOR_DIV, Value::Int(-7), Value::Int(2)).AsInt(),
      -4);
  EXPECT_EQ(BinaryOp(ast::BinOp::MOD, Value::Int(-7), Value::Int(2)).AsInt(),
            1);
  EXPECT_EQ(BinaryOp(ast::BinOp::POW, Value::Int(2), Value::Int(10)).AsInt(),
            1024);
  EXPECT_EQ(
      BinaryOp(ast::BinOp::LSHIFT, Value::Int(1), Value::Int(4)).AsInt(), 16);
}

// NOLINTNEXTLINE
TEST(Ops, TrueDivisionIsFloat) {
  Value v = BinaryOp(ast::BinOp::DIV, Value::Int(7), Value::Int(2));
  EXPECT_TRUE(v.Is(Value::Type::FLOAT));
  EXPECT_DOUBLE_EQ(v.AsFloat(), 3.5);
}

// NOLINTNEXTLINE
TEST(Ops, DivisionByZero) {
  EXPECT_EQ(KindOf([]() {
              BinaryOp(ast::BinOp::DIV, Value::Int(1), Value::Int(0));
            }),
            "ZeroDivisionError");
  EXPECT_EQ(KindOf([]() {
              BinaryOp(ast::BinOp::MOD, Value::Int(1), Value::Int(0));
            }),
            "ZeroDivisionError");
  EXPECT_EQ(KindOf([]() {
              BinaryOp(ast::BinOp::FLOOR_DIV, Value::Float(1),
                       Value::Float(0));
            }),
            "ZeroDivisionError");
}

// NOLINTNEXTLINE
TEST(Ops, IntegerOverflow) {
  EXPECT_EQ(KindOf([]() {
              BinaryOp(ast::BinOp::POW, Value::Int(10), Value::Int(40));
            }),
            "OverflowError");
  EXPECT_EQ(KindOf([]() {
              BinaryOp(ast::BinOp::SUB, Value::Int(-kMax), Value::Int(2));
            }),
            "OverflowError");
}

// NOLINTNEXTLINE
TEST(Ops, Sequences) {
  EXPECT_EQ(
      BinaryOp(ast::BinOp::ADD, Value::Str("ab"), Value::Str("cd")).AsStr(),
      "abcd");
  EXPECT_EQ(
      BinaryOp(ast::BinOp::MUL, Value::Str("ab"), Value::Int(3)).AsStr(),
      "ababab");
  Value list = BinaryOp(ast::BinOp::MUL, Value::List({Value::Int(1)}),
                        Value::Int(4));
  EXPECT_EQ(Length(list), 4);
  EXPECT_EQ(KindOf([]() {
              BinaryOp(ast::BinOp::ADD, Value::Int(1), Value::Str("a"));
            }),
            "TypeError");
}

// NOLINTNEXTLINE
TEST(Ops, SequenceSizeLimit) {
  EXPECT_EQ(KindOf([]() { CheckSequenceSize(kMaxSequenceSize + 1); }),
            "MemoryError");
  EXPECT_EQ(KindOf([]() {
              BinaryOp(ast::BinOp::MUL, Value::Str("abcd"),
                       Value::Int(kMaxSequenceSize));
            }),
            "MemoryError");
}

/*
 * Comparisons
 */

// NOLINTNEXTLINE
TEST(Ops, Compare) {
  EXPECT_TRUE(CompareOp(ast::CmpOp::LT, Value::Int(1), Value::Float(2.5)));
  EXPECT_TRUE(CompareOp(ast::CmpOp::EQ, Value::Int(1), Value::Float(1.0)));
  EXPECT_TRUE(CompareOp(ast::CmpOp::LT, Value::Str("abc"), Value::Str("abd")));
  EXPECT_TRUE(CompareOp(ast::CmpOp::IN, Value::Str("b"), Value::Str("abc")));
  EXPECT_FALSE(CompareOp(ast::CmpOp::EQ, Value::Int(1), Value::Str("1")));
  EXPECT_EQ(KindOf([]() {
              CompareOp(ast::CmpOp::LT, Value::Int(1), Value::Str("1"));
            }),
            "TypeError");
}

/*
 * Strings
 */

// NOLINTNEXTLINE
TEST(Ops, CodePoints) {
  EXPECT_EQ(CodePointCount("h\xC3\xA9llo"), 5);
  EXPECT_THAT(CodePoints("a\xC3\xA9"), testing::ElementsAre("a", "\xC3\xA9"));
  Value s = Value::Str("\xC3\xA9t\xC3\xA9");
  EXPECT_EQ(GetItem(s, Value::Int(-1)).AsStr(), "\xC3\xA9");
  EXPECT_EQ(Length(s), 3);
}

// NOLINTNEXTLINE
TEST(Ops, Slices) {
  Value s = Value::Str("hello");
  EXPECT_EQ(GetSlice(s, Value::Int(1), Value::Int(4), Value()).AsStr(), "ell");
  EXPECT_EQ(GetSlice(s, Value(), Value(), Value::Int(-1)).AsStr(), "olleh");
  EXPECT_EQ(GetSlice(s, Value::Int(-3), Value(), Value()).AsStr(), "llo");
  EXPECT_EQ(GetSlice(s, Value::Int(10), Value(), Value()).AsStr(), "");
  EXPECT_EQ(
      KindOf([&s]() { GetSlice(s, Value(), Value(), Value::Int(0)); }),
      "ValueError");
}

// NOLINTNEXTLINE
TEST(Ops, IndexOutOfRange) {
  Value list = Value::List({Value::Int(1), Value::Int(2)});
  EXPECT_EQ(GetItem(list, Value::Int(-2)).AsInt(), 1);
  EXPECT_EQ(KindOf([&list]() { GetItem(list, Value::Int(2)); }),
            "IndexError");
  EXPECT_EQ(KindOf([]() { GetItem(Value::Dict(), Value::Str("k")); }),
            "KeyError");
}

/*
 * Formatting
 */

// NOLINTNEXTLINE
TEST(Ops, FormatSpec) {
  EXPECT_EQ(FormatSpec(Value::Int(42), ">5"), "   42");
  EXPECT_EQ(FormatSpec(Value::Int(42), "05"), "00042");
  EXPECT_EQ(FormatSpec(Value::Float(3.14159), ".2f"), "3.14");
  EXPECT_EQ(FormatSpec(Value::Int(1234567), ","), "1,234,567");
  EXPECT_EQ(FormatSpec(Value::Str("ab"), "*^6"), "**ab**");
  EXPECT_EQ(FormatSpec(Value::Int(255), "x"), "ff");
  EXPECT_EQ(FormatSpec(Value::Str("abcdef"), ".3"), "abc");
}

// NOLINTNEXTLINE
TEST(Ops, BadFormatSpec) {
  EXPECT_EQ(KindOf([]() { FormatSpec(Value::Int(1), "abc"); }),
            "ValueError");
  EXPECT_EQ(KindOf([]() { FormatSpec(Value::Str("a"), "d"); }),
            "ValueError");
  EXPECT_EQ(KindOf([]() { FormatSpec(Value::Float(1), "x"); }),
            "ValueError");
}

// NOLINTNEXTLINE
TEST(Ops, FormatPercent) {
  EXPECT_EQ(FormatPercent("%d-%s",
                          Value::Tuple({Value::Int(3), Value::Str("x")})),
            "3-x");
  EXPECT_EQ(FormatPercent("%5.1f", Value::Float(3.14159)), "  3.1");
  EXPECT_EQ(FormatPercent("100%%", Value::Tuple()), "100%");
  EXPECT_EQ(KindOf([]() { FormatPercent("%d %d", Value::Int(1)); }),
            "TypeError");
  EXPECT_EQ(KindOf([]() { FormatPercent("%", Value::Int(1)); }),
            "ValueError");
}

}  // namespace
