#include "sandbox/limiter.hpp"
#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>
#include <csignal>
#include <memory>
#include <string>
#include <kj/async-io.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/unix.hpp"
#include "util/flags.hpp"

namespace {

using namespace sandbox;  // NOLINT

void Spin() {
  volatile uint64_t counter = 0;
  while (true) counter = counter + 1;
}

int Spinner() {
  Spin();
  return 0;
}

rlim_t Current(int resource) {
  struct rlimit rlim {};
  if (getrlimit(resource, &rlim) == -1) return 0;
  return rlim.rlim_cur;
}

/*
 * Limits
 */

// NOLINTNEXTLINE
TEST(Limiter, LimitsForBudget) {
  ExecutionOptions options = LimitsFor(2000);
  EXPECT_GT(options.cpu_limit_millis, 2000);
  EXPECT_EQ(options.memory_limit_kb, Flags::memory_limit_kb);
  EXPECT_EQ(options.max_files, Flags::max_open_files);
  EXPECT_EQ(options.max_procs, 1);
  EXPECT_EQ(options.max_file_size_kb, 0);
  EXPECT_TRUE(options.inherited_fds.empty());
}

// NOLINTNEXTLINE
TEST(Limiter, InvalidBudget) {
  EXPECT_ANY_THROW(LimitsFor(0));
  EXPECT_ANY_THROW(LimitsFor(-5));
}

// NOLINTNEXTLINE
TEST(Limiter, LimitsAreApplied) {
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options = LimitsFor(1000);
  std::string error_msg;
  ASSERT_TRUE(sandbox->Start(options,
                             []() {
                               if (Current(RLIMIT_FSIZE) != 0) return 1;
                               if (Current(RLIMIT_CORE) != 0) return 2;
                               if (Current(RLIMIT_NOFILE) !=
                                   static_cast<rlim_t>(Flags::max_open_files))
                                 return 3;
                               if (Current(RLIMIT_CPU) != 2) return 4;
                               if (Current(RLIMIT_AS) == RLIM_INFINITY)
                                 return 5;
                               return 0;
                             },
                             &error_msg))
      << error_msg;
  ExecutionInfo info;
  sandbox->Wait(&info);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(info.signal, 0);
}

/*
 * Guard
 */

// NOLINTNEXTLINE
TEST(Limiter, GuardExpires) {
  auto io = kj::setupAsyncIo();
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  std::string error_msg;
  ASSERT_TRUE(sandbox->Start(options, Spinner, &error_msg));
  kj::Own<Guard> guard =
      Enforce(sandbox.get(), &io.provider->getTimer(), 100);
  EXPECT_EQ(guard->BudgetMillis(), 100);
  EXPECT_FALSE(guard->HasExpired());
  guard->Expired().wait(io.waitScope);
  EXPECT_TRUE(guard->HasExpired());
  EXPECT_FALSE(sandbox->Running());
  const ExecutionInfo& info = guard->Release();
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_TRUE(info.killed);
}

// NOLINTNEXTLINE
TEST(Limiter, GuardReleaseBeforeDeadline) {
  auto io = kj::setupAsyncIo();
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  std::string error_msg;
  ASSERT_TRUE(sandbox->Start(options, []() { return 4; }, &error_msg));
  kj::Own<Guard> guard =
      Enforce(sandbox.get(), &io.provider->getTimer(), 10000);
  const ExecutionInfo& info = guard->Release();
  EXPECT_FALSE(guard->HasExpired());
  EXPECT_EQ(info.status_code, 4);
  EXPECT_FALSE(info.killed);
  // A second release does not wait again.
  EXPECT_EQ(guard->Release().status_code, 4);
}

// NOLINTNEXTLINE
TEST(Limiter, GuardAbortsBlockedUnit) {
  auto io = kj::setupAsyncIo();
  int fds[2];
  ASSERT_EQ(pipe2(fds, O_CLOEXEC), 0);
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  options.inherited_fds.push_back(fds[1]);
  int write_fd = fds[1];
  std::string error_msg;
  // Nobody reads, so the unit blocks once the pipe is full.
  ASSERT_TRUE(sandbox->Start(options,
                             [write_fd]() {
                               std::string chunk(1 << 16, 'x');
                               while (write(write_fd, chunk.data(),
                                            chunk.size()) > 0) {
                               }
                               return 0;
                             },
                             &error_msg));
  close(fds[1]);
  kj::Own<Guard> guard =
      Enforce(sandbox.get(), &io.provider->getTimer(), 10000);
  const ExecutionInfo& info = guard->Abort();
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_TRUE(info.killed);
  EXPECT_FALSE(sandbox->Running());
  // Aborting a reaped unit only reports how it ended.
  EXPECT_EQ(guard->Abort().signal, SIGKILL);
  close(fds[0]);
}

// NOLINTNEXTLINE
TEST(Limiter, GuardKillsOnDestruction) {
  auto io = kj::setupAsyncIo();
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  std::string error_msg;
  ASSERT_TRUE(sandbox->Start(options, Spinner, &error_msg));
  pid_t pid = sandbox->Pid();
  {
    kj::Own<Guard> guard =
        Enforce(sandbox.get(), &io.provider->getTimer(), 10000);
  }
  EXPECT_FALSE(sandbox->Running());
  EXPECT_EQ(kill(pid, 0), -1);
}

// NOLINTNEXTLINE
TEST(Limiter, EnforceNeedsARunningUnit) {
  auto io = kj::setupAsyncIo();
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  EXPECT_ANY_THROW(Enforce(sandbox.get(), &io.provider->getTimer(), 100));
}

}  // namespace
