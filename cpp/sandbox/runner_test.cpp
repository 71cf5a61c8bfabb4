#include "sandbox/runner.hpp"
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <chrono>
#include <csignal>
#include <functional>
#include <kj/async-io.h>
#include <kj/vector.h>
#include "capnp/outcome.capnp.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/flags.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::StartsWith;

using namespace sandbox;  // NOLINT

static const constexpr int64_t kBudget = 2000;

SandboxResult Completed(const std::string& source) {
  SandboxResult result = Execute(source, kBudget);
  EXPECT_EQ(result.status, SandboxResult::Status::COMPLETED)
      << source << " raised " << result.exception.kind;
  return result;
}

int64_t ElapsedMillis(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

/*
 * Results
 */

// NOLINTNEXTLINE
TEST(Runner, Text) {
  SandboxResult result = Completed("print(1)");
  EXPECT_TRUE(result.has_text);
  EXPECT_EQ(result.text, "1\n");
  EXPECT_FALSE(result.text_truncated);
  EXPECT_FALSE(result.has_image);
  EXPECT_FALSE(result.HasException());
  EXPECT_GT(result.duration_nanos, 0);
}

// NOLINTNEXTLINE
TEST(Runner, NoText) {
  SandboxResult result = Completed("x = 1");
  EXPECT_FALSE(result.has_text);
  EXPECT_EQ(result.text, "");
}

// NOLINTNEXTLINE
TEST(Runner, FencesAreStripped) {
  SandboxResult result = Completed("  ```py\nprint(1)\n```  ");
  EXPECT_EQ(result.text, "1\n");
}

// NOLINTNEXTLINE
TEST(Runner, OutputOrder) {
  SandboxResult result =
      Completed("for c in 'abc':\n    print(c, end='')\nprint('d')");
  EXPECT_EQ(result.text, "abcd\n");
}

// NOLINTNEXTLINE
TEST(Runner, LongTextIsTruncated) {
  SandboxResult result = Completed("'\xC3\xA9' * 5000");
  EXPECT_TRUE(result.text_truncated);
  // Two bytes per character.
  EXPECT_EQ(result.text.size(), 2u * Flags::max_text_chars);
}

// NOLINTNEXTLINE
TEST(Runner, Image) {
  SandboxResult result =
      Completed("import draw\ns = draw.Surface(10, 20)\ns.fill('blue')");
  ASSERT_TRUE(result.has_image);
  EXPECT_EQ(result.image.width, 10u);
  EXPECT_EQ(result.image.height, 20u);
  EXPECT_THAT(result.image.png, StartsWith("\x89PNG"));
  EXPECT_FALSE(result.image_too_large);
}

// NOLINTNEXTLINE
TEST(Runner, ImageTooLarge) {
  uint32_t max_artifact_bytes = Flags::max_artifact_bytes;
  // Signature and header alone take 33 bytes.
  Flags::max_artifact_bytes = 32;
  SandboxResult result =
      Completed("import draw\ns = draw.Surface(10, 10)\n'drawn'");
  Flags::max_artifact_bytes = max_artifact_bytes;
  EXPECT_FALSE(result.has_image);
  EXPECT_TRUE(result.image_too_large);
  EXPECT_EQ(result.text, "drawn");
}

// NOLINTNEXTLINE
TEST(Runner, LargeImageFits) {
  SandboxResult result = Completed(
      "import draw\ns = draw.Surface(2000, 2000)\ns.fill((1, 2, 3))");
  EXPECT_TRUE(result.has_image);
  EXPECT_FALSE(result.image_too_large);
  EXPECT_EQ(result.image.width, 2000u);
}

/*
 * Failures
 */

// NOLINTNEXTLINE
TEST(Runner, SnippetError) {
  SandboxResult result = Execute("1 / 0", kBudget);
  EXPECT_EQ(result.status, SandboxResult::Status::FAILED);
  EXPECT_TRUE(result.HasException());
  EXPECT_EQ(result.exception.kind, "ZeroDivisionError");
  EXPECT_THAT(result.exception.args, ElementsAre("division by zero"));
  EXPECT_FALSE(result.has_text);
  EXPECT_FALSE(result.has_image);
}

// NOLINTNEXTLINE
TEST(Runner, PrintedTextIsDroppedOnError) {
  SandboxResult result = Execute("print('partial')\nraise KeyError('k')",
                                 kBudget);
  EXPECT_EQ(result.exception.kind, "KeyError");
  EXPECT_FALSE(result.has_text);
  EXPECT_EQ(result.text, "");
}

// NOLINTNEXTLINE
TEST(Runner, CapabilityError) {
  for (const char* source :
       {"open('/etc/passwd').read()", "import os\nos.system('ls')",
        "try:\n    import socket\nexcept Exception:\n    pass"}) {
    SandboxResult result = Execute(source, kBudget);
    EXPECT_EQ(result.status, SandboxResult::Status::FAILED) << source;
    EXPECT_EQ(result.exception.kind, "CapabilityError") << source;
  }
}

// NOLINTNEXTLINE
TEST(Runner, MemoryError) {
  SandboxResult result = Execute("[0] * (1 << 40)", kBudget);
  EXPECT_EQ(result.exception.kind, "MemoryError");

  result = Execute(
      "chunks = []\n"
      "while True:\n"
      "    chunks.append('x' * 1000000 + str(len(chunks)))",
      10000);
  EXPECT_EQ(result.status, SandboxResult::Status::FAILED);
  EXPECT_EQ(result.exception.kind, "MemoryError");
}

/*
 * Hostile snippets always get a result
 */

// NOLINTNEXTLINE
TEST(Runner, HugeErrorArgumentIsTruncated) {
  auto start = std::chrono::steady_clock::now();
  SandboxResult result =
      Execute("raise ValueError('x' * 20000000, 'dropped')", kBudget);
  EXPECT_LT(ElapsedMillis(start), kBudget);
  EXPECT_EQ(result.status, SandboxResult::Status::FAILED);
  EXPECT_EQ(result.exception.kind, "ValueError");
  ASSERT_EQ(result.exception.args.size(), 1u);
  EXPECT_EQ(result.exception.args[0],
            std::string(Flags::max_text_chars, 'x'));
}

// NOLINTNEXTLINE
TEST(Runner, ManyErrorArgumentsShareTheLimit) {
  std::string source = "raise ValueError(";
  for (int i = 0; i < 1500; i++) source += "'ab', ";
  SandboxResult result = Execute(source + ")", kBudget);
  EXPECT_EQ(result.exception.kind, "ValueError");
  EXPECT_EQ(result.exception.args.size(),
            static_cast<size_t>(Flags::max_text_chars / 2));
}

// NOLINTNEXTLINE
TEST(Runner, SelfReferentialContainers) {
  EXPECT_EQ(Completed("a = []\na.append(a)\na").text, "[[...]]");
  EXPECT_EQ(Completed("d = {}\nd['d'] = d\nd").text, "{'d': {...}}");
  SandboxResult result =
      Execute("a = []\na.append(a)\nb = []\nb.append(b)\na == b", kBudget);
  EXPECT_EQ(result.exception.kind, "RecursionError");
}

// NOLINTNEXTLINE
TEST(Runner, DeeplyNestedList) {
  SandboxResult result = Execute(
      "a = []\nfor i in range(1000000):\n    a = [a]\n'built'", 10000);
  EXPECT_EQ(result.status, SandboxResult::Status::COMPLETED);
  EXPECT_EQ(result.text, "built");
}

// NOLINTNEXTLINE
TEST(Runner, FormatIndexOverflow) {
  SandboxResult result =
      Execute("'{99999999999999999999999}'.format(1)", kBudget);
  EXPECT_EQ(result.exception.kind, "ValueError");
  EXPECT_THAT(result.exception.args,
              ElementsAre("Too many decimal digits in format string"));
}

/*
 * Deadlines
 */

void ExpectTimeout(int64_t budget_millis) {
  auto start = std::chrono::steady_clock::now();
  SandboxResult result = Execute("while True:\n    pass", budget_millis);
  int64_t elapsed = ElapsedMillis(start);
  EXPECT_EQ(result.status, SandboxResult::Status::TIMED_OUT);
  EXPECT_EQ(result.exception.kind, "TimeoutError");
  EXPECT_THAT(result.exception.args,
              ElementsAre("execution exceeded " +
                          std::to_string(budget_millis) + " ms"));
  EXPECT_EQ(result.duration_nanos, budget_millis * 1000 * 1000);
  EXPECT_GE(elapsed, budget_millis);
  EXPECT_LT(elapsed, budget_millis + 1000);
}

// NOLINTNEXTLINE
TEST(Runner, TimeoutShortBudget) { ExpectTimeout(10); }

// NOLINTNEXTLINE
TEST(Runner, TimeoutOneSecond) { ExpectTimeout(1000); }

// NOLINTNEXTLINE
TEST(Runner, TimeoutPrivilegedBudget) {
  ExpectTimeout(Flags::privileged_budget_millis);
}

// NOLINTNEXTLINE
TEST(Runner, TimeoutInRecursion) {
  SandboxResult result = Execute(
      "def f(n):\n"
      "    return 0 if n == 0 else f(n - 1) + f(n - 1)\n"
      "f(60)",
      200);
  EXPECT_EQ(result.status, SandboxResult::Status::TIMED_OUT);
}

/*
 * Isolation
 */

// NOLINTNEXTLINE
TEST(Runner, RunsDoNotShareState) {
  Completed("x = 42\nimport random\nrandom.seed(3)");
  SandboxResult result = Execute("x", kBudget);
  EXPECT_EQ(result.exception.kind, "NameError");
}

// NOLINTNEXTLINE
TEST(Runner, RepeatedHostileRunsLeaveNoTrace) {
  for (int i = 0; i < 3; i++) {
    Execute("while True:\n    pass", 50);
    Execute("open('x')", kBudget);
  }
  SandboxResult result = Completed("sum(range(10))");
  EXPECT_EQ(result.text, "45");
}

// NOLINTNEXTLINE
TEST(Runner, ConcurrentRuns) {
  auto io = kj::setupAsyncIo();
  Runner runner(&io.provider->getTimer(), io.lowLevelProvider.get());
  kj::Vector<kj::Promise<SandboxResult>> pending;
  for (int i = 0; i < 4; i++) {
    SandboxRequest request;
    request.source = "print(" + std::to_string(i) + ")";
    request.time_budget_millis = kBudget;
    pending.add(runner.Execute(kj::mv(request)));
  }
  SandboxRequest slow;
  slow.source = "while True:\n    pass";
  slow.time_budget_millis = 300;
  pending.add(runner.Execute(kj::mv(slow)));

  auto results = kj::joinPromises(pending.releaseAsArray()).wait(io.waitScope);
  ASSERT_EQ(results.size(), 5u);
  for (int i = 0; i < 4; i++) {
    EXPECT_EQ(results[i].text, std::to_string(i) + "\n");
  }
  EXPECT_EQ(results[4].status, SandboxResult::Status::TIMED_OUT);
}

/*
 * How units end
 */

Received Sent(const std::function<void(capnproto::Outcome::Builder)>& fill) {
  capnp::MallocMessageBuilder message;
  fill(message.initRoot<capnproto::Outcome>());
  auto words = capnp::messageToFlatArray(message);
  auto bytes = words.asBytes();
  Received received;
  received.data = kj::heapArray<kj::byte>(bytes.begin(), bytes.size());
  return received;
}

// NOLINTNEXTLINE
TEST(Interpret, Completed) {
  Received received = Sent([](capnproto::Outcome::Builder outcome) {
    outcome.setDurationNanos(42);
    auto completed = outcome.initCompleted();
    completed.setHasText(true);
    completed.setText("hi");
  });
  SandboxResult result = Interpret(received, ExecutionInfo(), kBudget);
  EXPECT_EQ(result.status, SandboxResult::Status::COMPLETED);
  EXPECT_EQ(result.text, "hi");
  EXPECT_EQ(result.duration_nanos, 42);
}

// NOLINTNEXTLINE
TEST(Interpret, Failed) {
  Received received = Sent([](capnproto::Outcome::Builder outcome) {
    auto failed = outcome.initFailed();
    failed.setKind("KeyError");
    failed.initArgs(1).set(0, "k");
  });
  SandboxResult result = Interpret(received, ExecutionInfo(), kBudget);
  EXPECT_EQ(result.status, SandboxResult::Status::FAILED);
  EXPECT_EQ(result.exception.kind, "KeyError");
  EXPECT_THAT(result.exception.args, ElementsAre("k"));
}

// NOLINTNEXTLINE
TEST(Interpret, Deadline) {
  Received received;
  received.expired = true;
  ExecutionInfo info;
  info.signal = SIGKILL;
  info.killed = true;
  EXPECT_EQ(Interpret(received, info, 10).status,
            SandboxResult::Status::TIMED_OUT);

  info = ExecutionInfo();
  info.signal = SIGXCPU;
  SandboxResult result = Interpret(Received(), info, 10);
  EXPECT_EQ(result.status, SandboxResult::Status::TIMED_OUT);
  EXPECT_EQ(result.exception.kind, "TimeoutError");
}

// NOLINTNEXTLINE
TEST(Interpret, ForbiddenSystemCall) {
  ExecutionInfo info;
  info.signal = SIGSYS;
  SandboxResult result = Interpret(Received(), info, kBudget);
  EXPECT_EQ(result.status, SandboxResult::Status::FAILED);
  EXPECT_EQ(result.exception.kind, "CapabilityError");
}

// NOLINTNEXTLINE
TEST(Interpret, Crash) {
  ExecutionInfo info;
  info.signal = SIGSEGV;
  info.message = "Segmentation fault";
  SandboxResult result = Interpret(Received(), info, kBudget);
  EXPECT_EQ(result.status, SandboxResult::Status::FAILED);
  EXPECT_EQ(result.exception.kind, "SandboxError");
  EXPECT_THAT(result.exception.args,
              ElementsAre("execution unit killed by signal " +
                          std::to_string(SIGSEGV) + " (Segmentation fault)"));
}

// NOLINTNEXTLINE
TEST(Interpret, NonZeroExit) {
  ExecutionInfo info;
  info.status_code = 3;
  SandboxResult result = Interpret(Received(), info, kBudget);
  EXPECT_EQ(result.exception.kind, "SandboxError");
  EXPECT_THAT(result.exception.args,
              ElementsAre("execution unit exited with status 3"));
}

// NOLINTNEXTLINE
TEST(Interpret, UnreadOutcome) {
  Received received;
  received.error = "read has exceeded limit";
  ExecutionInfo info;
  info.signal = SIGKILL;
  info.killed = true;
  SandboxResult result = Interpret(received, info, kBudget);
  EXPECT_EQ(result.exception.kind, "SandboxError");
  EXPECT_THAT(result.exception.args,
              ElementsAre("cannot read outcome: read has exceeded limit"));
}

// NOLINTNEXTLINE
TEST(Interpret, MalformedOutcome) {
  SandboxResult result = Interpret(Received(), ExecutionInfo(), kBudget);
  EXPECT_EQ(result.exception.kind, "SandboxError");
  EXPECT_THAT(result.exception.args,
              ElementsAre("malformed outcome of 0 bytes"));

  Received received;
  received.data = kj::heapArray<kj::byte>(5);
  result = Interpret(received, ExecutionInfo(), kBudget);
  EXPECT_THAT(result.exception.args,
              ElementsAre("malformed outcome of 5 bytes"));

  // One segment, which claims to be far longer than the message.
  received.data = kj::heapArray<kj::byte>(
      {0, 0, 0, 0, 0xff, 0xff, 0xff, 0x0f});
  result = Interpret(received, ExecutionInfo(), kBudget);
  EXPECT_EQ(result.status, SandboxResult::Status::FAILED);
  EXPECT_EQ(result.exception.kind, "SandboxError");
  ASSERT_EQ(result.exception.args.size(), 1u);
  EXPECT_THAT(result.exception.args[0], StartsWith("malformed outcome: "));
}

/*
 * Requests
 */

// NOLINTNEXTLINE
TEST(Runner, InvalidRequests) {
  EXPECT_ANY_THROW(Execute("1", 0));
  EXPECT_ANY_THROW(Execute("1", -1));
  EXPECT_ANY_THROW(Execute("", kBudget));
  EXPECT_ANY_THROW(Execute("  ``` ", kBudget));
}

// NOLINTNEXTLINE
TEST(Runner, Stats) {
  Runner::Stats before = Runner::GetStats();
  Execute("1", kBudget);
  Execute("1 / 0", kBudget);
  Execute("while True:\n    pass", 20);
  Runner::Stats after = Runner::GetStats();
  EXPECT_EQ(after.runs, before.runs + 3);
  EXPECT_EQ(after.completed, before.completed + 1);
  EXPECT_EQ(after.failed, before.failed + 1);
  EXPECT_EQ(after.timed_out, before.timed_out + 1);
}

// NOLINTNEXTLINE
TEST(Runner, StatusNames) {
  EXPECT_STREQ(StatusName(SandboxResult::Status::COMPLETED), "COMPLETED");
  EXPECT_STREQ(StatusName(SandboxResult::Status::FAILED), "FAILED");
  EXPECT_STREQ(StatusName(SandboxResult::Status::TIMED_OUT), "TIMED_OUT");
}

}  // namespace
