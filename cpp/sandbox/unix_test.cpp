#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>
#include <csignal>
#include <memory>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "sandbox/seccomp.hpp"
#include "sandbox/unix.hpp"

namespace {

using namespace sandbox;  // NOLINT

void Spin() {
  volatile uint64_t counter = 0;
  while (true) counter = counter + 1;
}

// Starts body and waits for it; returns false if it did not start.
bool Run(Sandbox* sandbox, const ExecutionOptions& options,
         const Sandbox::Body& body, ExecutionInfo* info,
         std::string* error_msg) {
  if (!sandbox->Start(options, body, error_msg)) return false;
  sandbox->Wait(info);
  return true;
}

/*
 * Unix
 */

// NOLINTNEXTLINE
TEST(UnixTest, TestCreate) {
  std::unique_ptr<Sandbox> sandbox = Sandbox::Create();
  ASSERT_TRUE(sandbox);
  EXPECT_FALSE(sandbox->Running());
}

// NOLINTNEXTLINE
TEST(UnixTest, TestReturnValue) {
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(
      ::Run(sandbox.get(), options, []() { return 15; }, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_EQ(info.message, "Non-zero return code");
  EXPECT_FALSE(sandbox->Running());
}

// NOLINTNEXTLINE
TEST(UnixTest, TestSignal) {
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(::Run(sandbox.get(), options,
                  []() {
                    raise(SIGABRT);
                    return 0;
                  },
                  &info, &error_msg));
  EXPECT_EQ(info.signal, SIGABRT);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestKill) {
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  std::string error_msg;
  ASSERT_TRUE(sandbox->Start(options,
                             []() {
                               Spin();
                               return 0;
                             },
                             &error_msg));
  EXPECT_TRUE(sandbox->Running());
  EXPECT_GT(sandbox->Pid(), 0);
  sandbox->Kill();
  ExecutionInfo info;
  sandbox->Wait(&info);
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_TRUE(info.killed);
  // Killing a reaped unit does nothing.
  sandbox->Kill();
}

// NOLINTNEXTLINE
TEST(UnixTest, TestDestructorReaps) {
  pid_t pid = 0;
  {
    std::unique_ptr<Sandbox> sandbox(Unix::Create());
    ExecutionOptions options;
    std::string error_msg;
    ASSERT_TRUE(sandbox->Start(options,
                               []() {
                                 Spin();
                                 return 0;
                               },
                               &error_msg));
    pid = sandbox->Pid();
  }
  // Neither running nor a zombie.
  EXPECT_EQ(kill(pid, 0), -1);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestCpuLimit) {
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  options.cpu_limit_millis = 1000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(::Run(sandbox.get(), options,
                  []() {
                    Spin();
                    return 0;
                  },
                  &info, &error_msg));
  EXPECT_EQ(info.signal, SIGXCPU);
  EXPECT_GE(info.cpu_time_millis, 900);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMemoryLimit) {
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  options.memory_limit_kb = 64 * 1024;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(::Run(sandbox.get(), options,
                  []() {
                    void* p = mmap(nullptr, 512 << 20, PROT_READ | PROT_WRITE,
                                   MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
                    return p == MAP_FAILED ? 7 : 0;
                  },
                  &info, &error_msg));
  EXPECT_EQ(info.status_code, 7);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestInheritedFds) {
  int kept[2];
  int dropped[2];
  ASSERT_EQ(pipe2(kept, O_CLOEXEC), 0);
  ASSERT_EQ(pipe2(dropped, O_CLOEXEC), 0);
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  options.inherited_fds.push_back(kept[1]);
  int kept_fd = kept[1];
  int dropped_fd = dropped[1];
  std::string error_msg;
  ASSERT_TRUE(sandbox->Start(options,
                             [kept_fd, dropped_fd]() {
                               if (fcntl(dropped_fd, F_GETFD) != -1) return 1;
                               if (write(kept_fd, "ok", 2) != 2) return 2;
                               return 0;
                             },
                             &error_msg));
  close(kept[1]);
  close(dropped[1]);
  ExecutionInfo info;
  sandbox->Wait(&info);
  EXPECT_EQ(info.status_code, 0);
  char buf[4] = {};
  EXPECT_EQ(read(kept[0], buf, sizeof(buf)), 2);
  EXPECT_EQ(std::string(buf), "ok");
  // The unit held the only other copy of the write end.
  char more = 0;
  EXPECT_EQ(read(dropped[0], &more, 1), 0);
  close(kept[0]);
  close(dropped[0]);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestStdioIsNull) {
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(::Run(sandbox.get(), options,
                  []() {
                    char c = 0;
                    return read(STDIN_FILENO, &c, 1) == 0 ? 0 : 1;
                  },
                  &info, &error_msg));
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestStartTwice) {
  std::unique_ptr<Sandbox> sandbox(Unix::Create());
  ExecutionOptions options;
  std::string error_msg;
  ASSERT_TRUE(sandbox->Start(options,
                             []() {
                               Spin();
                               return 0;
                             },
                             &error_msg));
  EXPECT_ANY_THROW(
      sandbox->Start(options, []() { return 0; }, &error_msg));
  sandbox->Kill();
  ExecutionInfo info;
  sandbox->Wait(&info);
}

/*
 * Seccomp
 */

class SeccompTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (Seccomp::Score() < 0) GTEST_SKIP() << "seccomp is not available";
    sandbox_.reset(Seccomp::Create());
  }
  std::unique_ptr<Sandbox> sandbox_;
};

// NOLINTNEXTLINE
TEST_F(SeccompTest, TestAllowedCalls) {
  ExecutionOptions options;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(::Run(sandbox_.get(), options,
                  []() {
                    void* p = mmap(nullptr, 1 << 20, PROT_READ | PROT_WRITE,
                                   MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
                    if (p == MAP_FAILED) return 1;
                    munmap(p, 1 << 20);
                    if (write(STDOUT_FILENO, "x", 1) != 1) return 2;
                    return 0;
                  },
                  &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST_F(SeccompTest, TestForbiddenCall) {
  ExecutionOptions options;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(::Run(sandbox_.get(), options,
                  []() {
                    getppid();
                    return 0;
                  },
                  &info, &error_msg));
  EXPECT_EQ(info.signal, SIGSYS);
}

// NOLINTNEXTLINE
TEST_F(SeccompTest, TestOpenIsForbidden) {
  ExecutionOptions options;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(::Run(sandbox_.get(), options,
                  []() {
                    int fd = open("/etc/hostname", O_RDONLY);
                    return fd == -1 ? 1 : 0;
                  },
                  &info, &error_msg));
  EXPECT_EQ(info.signal, SIGSYS);
}

// NOLINTNEXTLINE
TEST_F(SeccompTest, TestWriteOnlyToInheritedFds) {
  int fds[2];
  ASSERT_EQ(pipe2(fds, O_CLOEXEC), 0);
  ExecutionOptions options;
  ExecutionInfo info;
  std::string error_msg;
  int read_end = fds[0];
  // The read end is closed in the unit, but the filter stops the call
  // before the kernel could say so.
  EXPECT_TRUE(::Run(sandbox_.get(), options,
                  [read_end]() {
                    ssize_t r = write(read_end, "x", 1);
                    return r == -1 ? 1 : 0;
                  },
                  &info, &error_msg));
  EXPECT_EQ(info.signal, SIGSYS);
  close(fds[0]);
  close(fds[1]);
}

}  // namespace
