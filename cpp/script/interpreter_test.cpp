#include "script/interpreter.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "script/context.hpp"
#include "script/surface.hpp"

namespace {

using namespace script;  // NOLINT

static const constexpr uint64_t kSeed = 1;

std::string Text(const std::string& source) {
  Outcome outcome = RunSnippet(source, kSeed);
  EXPECT_TRUE(outcome.completed)
      << source << " raised " << outcome.error_kind;
  EXPECT_TRUE(outcome.completion.has_text) << source;
  return outcome.completion.text;
}

std::string Error(const std::string& source) {
  Outcome outcome = RunSnippet(source, kSeed);
  EXPECT_FALSE(outcome.completed) << source;
  return outcome.error_kind;
}

/*
 * Completion
 */

// NOLINTNEXTLINE
TEST(Interpreter, TrailingExpression) {
  EXPECT_EQ(Text("1 + 2"), "3");
  EXPECT_EQ(Text("x = 2\nx * 21"), "42");
  EXPECT_EQ(Text("'abc'"), "abc");
  EXPECT_EQ(Text("[1, 'a', None, True]"), "[1, 'a', None, True]");
}

// NOLINTNEXTLINE
TEST(Interpreter, NoText) {
  Outcome outcome = RunSnippet("x = 5", kSeed);
  ASSERT_TRUE(outcome.completed);
  EXPECT_FALSE(outcome.completion.has_text);
  EXPECT_FALSE(outcome.completion.image);

  outcome = RunSnippet("None", kSeed);
  ASSERT_TRUE(outcome.completed);
  EXPECT_FALSE(outcome.completion.has_text);
}

// NOLINTNEXTLINE
TEST(Interpreter, PrintedTextComesFirst) {
  EXPECT_EQ(Text("print('a', 'b', sep='-')"), "a-b\n");
  EXPECT_EQ(Text("print(1)\n2"), "1\n2");
  EXPECT_EQ(Text("print('x', end='')\nprint('y')"), "xy\n");
  EXPECT_EQ(Text("print()"), "\n");
}

// NOLINTNEXTLINE
TEST(Interpreter, DurationIsMeasured) {
  Outcome outcome = RunSnippet("sum(range(1000))", kSeed);
  EXPECT_GT(outcome.duration_nanos, 0);
}

/*
 * Language
 */

// NOLINTNEXTLINE
TEST(Interpreter, Functions) {
  EXPECT_EQ(Text("def fact(n):\n"
                 "    return 1 if n <= 1 else n * fact(n - 1)\n"
                 "fact(10)"),
            "3628800");
  EXPECT_EQ(Text("def f(a, b=10):\n    return a - b\nf(b=1, a=3)"), "2");
  EXPECT_EQ(Text("list(map(lambda x: x * 2, [1, 2]))"), "[2, 4]");
}

// NOLINTNEXTLINE
TEST(Interpreter, Globals) {
  EXPECT_EQ(Text("n = 0\n"
                 "def inc():\n"
                 "    global n\n"
                 "    n += 1\n"
                 "inc()\n"
                 "inc()\n"
                 "n"),
            "2");
}

// NOLINTNEXTLINE
TEST(Interpreter, Loops) {
  EXPECT_EQ(Text("t = 0\n"
                 "for i in range(10):\n"
                 "    if i == 5:\n"
                 "        break\n"
                 "    t += i\n"
                 "t"),
            "10");
  EXPECT_EQ(Text("i = 0\n"
                 "while i < 3:\n"
                 "    i += 1\n"
                 "else:\n"
                 "    print('done')\n"
                 "i"),
            "done\n3");
}

// NOLINTNEXTLINE
TEST(Interpreter, Comprehensions) {
  EXPECT_EQ(Text("[x * x for x in range(4)]"), "[0, 1, 4, 9]");
  EXPECT_EQ(Text("{k: v for k, v in zip('ab', [1, 2])}"),
            "{'a': 1, 'b': 2}");
}

// NOLINTNEXTLINE
TEST(Interpreter, Strings) {
  EXPECT_EQ(Text("x = 3.14159\nf'{x:.2f}|{42:>4}'"), "3.14|  42");
  EXPECT_EQ(Text("'%s=%d' % ('a', 1)"), "a=1");
  EXPECT_EQ(Text("' '.join('a b  c'.split())"), "a b c");
  EXPECT_EQ(Text("'{}-{}'.format(1, 'z')"), "1-z");
  EXPECT_EQ(Text("len('h\xC3\xA9llo')"), "5");
  EXPECT_EQ(Text("'h\xC3\xA9llo'[1]"), "\xC3\xA9");
  EXPECT_EQ(Text("'abc'.upper()[::-1]"), "CBA");
}

// NOLINTNEXTLINE
TEST(Interpreter, Containers) {
  EXPECT_EQ(Text("d = {'b': 2}\nd['a'] = 1\nsorted(d.items())"),
            "[('a', 1), ('b', 2)]");
  EXPECT_EQ(Text("sorted([3, 1, 2], reverse=True)"), "[3, 2, 1]");
  EXPECT_EQ(Text("l = [1, 2]\nl.append(3)\nl[1:]"), "[2, 3]");
  EXPECT_EQ(Text("a, b = 1, 2\nb, a"), "(2, 1)");
}

// NOLINTNEXTLINE
TEST(Interpreter, Numbers) {
  EXPECT_EQ(Text("7 / 2"), "3.5");
  EXPECT_EQ(Text("round(2.5)"), "2");
  EXPECT_EQ(Text("divmod(-7, 2)"), "(-4, 1)");
  EXPECT_EQ(Text("hex(255)"), "0xff");
}

/*
 * Modules
 */

// NOLINTNEXTLINE
TEST(Interpreter, Math) {
  EXPECT_EQ(Text("import math\nmath.sqrt(16)"), "4.0");
  EXPECT_EQ(Text("from math import factorial\nfactorial(5)"), "120");
  EXPECT_EQ(Error("import math\nmath.sqrt(-1)"), "ValueError");
}

// NOLINTNEXTLINE
TEST(Interpreter, RandomIsSeeded) {
  const std::string source =
      "import random\n[random.randint(1, 1000) for _ in range(10)]";
  Outcome a = RunSnippet(source, 42);
  Outcome b = RunSnippet(source, 42);
  ASSERT_TRUE(a.completed);
  ASSERT_TRUE(b.completed);
  EXPECT_EQ(a.completion.text, b.completion.text);
}

// NOLINTNEXTLINE
TEST(Interpreter, Help) {
  EXPECT_EQ(Text("help('math.sqrt')"), "math.sqrt: sqrt(x): square root\n");
  EXPECT_THAT(Text("help('random')"),
              testing::HasSubstr("  randint: randint(a, b)"));
}

/*
 * Images
 */

// NOLINTNEXTLINE
TEST(Interpreter, LiveSurfaceBecomesImage) {
  Outcome outcome = RunSnippet(
      "import draw\ns = draw.Surface(4, 3)\ns.fill('red')", kSeed);
  ASSERT_TRUE(outcome.completed);
  ASSERT_TRUE(outcome.completion.image);
  EXPECT_EQ(outcome.completion.image->Width(), 4);
  EXPECT_EQ(outcome.completion.image->Height(), 3);
  EXPECT_EQ(outcome.completion.image->GetAt(0, 0).r, 255);
  EXPECT_FALSE(outcome.completion.has_text);
}

// NOLINTNEXTLINE
TEST(Interpreter, AmbiguousImage) {
  Outcome outcome = RunSnippet(
      "import draw\na = draw.Surface(2, 2)\nb = draw.Surface(2, 2)", kSeed);
  ASSERT_TRUE(outcome.completed);
  EXPECT_FALSE(outcome.completion.image);
}

// NOLINTNEXTLINE
TEST(Interpreter, DroppedSurfaceIsNotAnImage) {
  Outcome outcome =
      RunSnippet("import draw\ns = draw.Surface(2, 2)\ndel s", kSeed);
  ASSERT_TRUE(outcome.completed);
  EXPECT_FALSE(outcome.completion.image);
}

/*
 * Errors
 */

// NOLINTNEXTLINE
TEST(Interpreter, ErrorKinds) {
  EXPECT_EQ(Error("1 / 0"), "ZeroDivisionError");
  EXPECT_EQ(Error("undefined_name"), "NameError");
  EXPECT_EQ(Error("[1][5]"), "IndexError");
  EXPECT_EQ(Error("{}['k']"), "KeyError");
  EXPECT_EQ(Error("int('x')"), "ValueError");
  EXPECT_EQ(Error("1 + 'a'"), "TypeError");
  EXPECT_EQ(Error("1 +"), "SyntaxError");
  EXPECT_EQ(Error("2 ** 64"), "OverflowError");
  EXPECT_EQ(Error("(1).nope"), "AttributeError");
}

// NOLINTNEXTLINE
TEST(Interpreter, ErrorArguments) {
  Outcome outcome = RunSnippet("raise ValueError('bad', 3)", kSeed);
  ASSERT_FALSE(outcome.completed);
  EXPECT_EQ(outcome.error_kind, "ValueError");
  EXPECT_THAT(outcome.error_args, testing::ElementsAre("bad", "3"));

  outcome = RunSnippet("assert 1 == 2, 'mismatch'", kSeed);
  EXPECT_EQ(outcome.error_kind, "AssertionError");
  EXPECT_THAT(outcome.error_args, testing::ElementsAre("mismatch"));
}

// NOLINTNEXTLINE
TEST(Interpreter, CatchErrors) {
  EXPECT_EQ(Text("try:\n"
                 "    1 / 0\n"
                 "except ZeroDivisionError as e:\n"
                 "    print('caught', e)"),
            "caught division by zero\n");
  EXPECT_EQ(Text("try:\n"
                 "    {}['k']\n"
                 "except LookupError:\n"
                 "    print('lookup')\n"
                 "finally:\n"
                 "    print('finally')"),
            "lookup\nfinally\n");
}

// NOLINTNEXTLINE
TEST(Interpreter, Recursion) {
  EXPECT_EQ(Error("def f(n):\n    return f(n + 1)\nf(0)"), "RecursionError");
}

// NOLINTNEXTLINE
TEST(Interpreter, SelfReferentialRepr) {
  EXPECT_EQ(Text("a = []\na.append(a)\na"), "[[...]]");
  EXPECT_EQ(Text("a = [1]\na.append(a)\nprint(a)"), "[1, [...]]\n");
  EXPECT_EQ(Text("d = {}\nd['d'] = d\nstr(d)"), "{'d': {...}}");
  EXPECT_EQ(Text("a = []\nt = (a,)\na.append(t)\nt"), "([(...)],)");
  // Repeated siblings are not cycles.
  EXPECT_EQ(Text("a = [1]\n[a, a]"), "[[1], [1]]");
}

// NOLINTNEXTLINE
TEST(Interpreter, SelfReferentialComparison) {
  EXPECT_EQ(Text("a = []\na.append(a)\na == a"), "True");
  EXPECT_EQ(Error("a = []\na.append(a)\nb = []\nb.append(b)\na == b"),
            "RecursionError");
  EXPECT_EQ(Error("a = [0]\na.append(a)\nb = [0]\nb.append(b)\na < b"),
            "RecursionError");
  EXPECT_EQ(Text("a = []\n"
                 "a.append(a)\n"
                 "b = []\n"
                 "b.append(b)\n"
                 "try:\n"
                 "    a == b\n"
                 "except RecursionError:\n"
                 "    print('caught')"),
            "caught\n");
}

// NOLINTNEXTLINE
TEST(Interpreter, DeepNesting) {
  // Released without recursing once per level.
  EXPECT_EQ(Text("a = []\nfor i in range(300000):\n    a = [a]\nlen(a)"), "1");
  EXPECT_EQ(Text("d = {}\nfor i in range(300000):\n    d = {'d': [d]}\n1"),
            "1");
  EXPECT_EQ(Error("a = []\nfor i in range(5000):\n    a = [a]\na"),
            "RecursionError");
  EXPECT_EQ(Error("a = []\nb = []\nfor i in range(5000):\n"
                  "    a = [a]\n    b = [b]\na == b"),
            "RecursionError");
}

// NOLINTNEXTLINE
TEST(Interpreter, FormatIndexOverflow) {
  Outcome outcome =
      RunSnippet("'{99999999999999999999999}'.format(1)", kSeed);
  ASSERT_FALSE(outcome.completed);
  EXPECT_EQ(outcome.error_kind, "ValueError");
  ASSERT_EQ(outcome.error_args.size(), 1u);
  EXPECT_EQ(outcome.error_args[0], "Too many decimal digits in format string");
  EXPECT_EQ(Text("'{0000000001}'.format(5, 6)"), "6");
}

// NOLINTNEXTLINE
TEST(Interpreter, CaseOfNonAsciiText) {
  EXPECT_EQ(Text("'x\xE2\x82\xACy'.upper()"), "X\xE2\x82\xACY");
  EXPECT_EQ(Text("'\xE2\x82\xAC'.capitalize()"), "\xE2\x82\xAC");
  EXPECT_EQ(Text("'\xE2\x82\xAC" "A'.lower()"), "\xE2\x82\xAC" "a");
  // The euro sign is uncased, so the letter after it starts a word.
  EXPECT_EQ(Text("'a \xE2\x82\xAC" "b'.title()"), "A \xE2\x82\xAC" "B");
  EXPECT_EQ(Text("'{:E}'.format(float('inf'))"), "INF");
}

// NOLINTNEXTLINE
TEST(Interpreter, OversizedObjects) {
  EXPECT_EQ(Error("'a' * (1 << 40)"), "MemoryError");
  EXPECT_EQ(Error("[0] * (1 << 30)"), "MemoryError");
}

/*
 * Capabilities
 */

// NOLINTNEXTLINE
TEST(Interpreter, DeniedNames) {
  EXPECT_EQ(Error("open('x')"), "CapabilityError");
  EXPECT_EQ(Error("eval('1')"), "CapabilityError");
  EXPECT_EQ(Error("__import__('os')"), "CapabilityError");
  EXPECT_EQ(Error("().__class__"), "CapabilityError");
}

// NOLINTNEXTLINE
TEST(Interpreter, DeniedModules) {
  EXPECT_EQ(Error("import os"), "CapabilityError");
  EXPECT_EQ(Error("from sys import exit"), "CapabilityError");
}

// NOLINTNEXTLINE
TEST(Interpreter, CapabilityErrorsCannotBeCaught) {
  EXPECT_EQ(Error("try:\n    import os\nexcept Exception:\n    pass"),
            "CapabilityError");
  EXPECT_EQ(Error("try:\n    open('x')\nexcept:\n    pass"),
            "CapabilityError");
  EXPECT_EQ(Error("try:\n    open('x')\nfinally:\n    pass"),
            "CapabilityError");
}

}  // namespace
