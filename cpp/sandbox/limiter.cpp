#include "sandbox/limiter.hpp"

#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>
#include <cerrno>

#include <kj/debug.h>

#include "util/flags.hpp"

namespace sandbox {

namespace {
static const constexpr int64_t kStackKb = 64 * 1024;
static const constexpr int32_t kMaxProcs = 1;

// Virtual memory size of the calling process, from /proc/self/statm.
// Returns 0 if it cannot be read.
int64_t CurrentVirtualMemoryKb() {
  int fd = open("/proc/self/statm", O_RDONLY | O_CLOEXEC);
  if (fd == -1) return 0;
  char buf[128] = {};
  ssize_t num_read = read(fd, buf, sizeof(buf) - 1);
  close(fd);
  if (num_read <= 0) return 0;
  int64_t pages = 0;
  for (ssize_t i = 0; i < num_read && buf[i] >= '0' && buf[i] <= '9'; i++) {
    pages = pages * 10 + (buf[i] - '0');
  }
  return pages * (sysconf(_SC_PAGESIZE) / 1024);
}
}  // namespace

ExecutionOptions LimitsFor(int64_t budget_millis) {
  KJ_REQUIRE(budget_millis > 0, budget_millis, "Invalid time budget");
  ExecutionOptions options;
  // The wall clock deadline comes first, CPU time is only a backstop.
  options.cpu_limit_millis = budget_millis + 1000;
  options.memory_limit_kb = Flags::memory_limit_kb;
  options.max_stack_kb = kStackKb;
  options.max_file_size_kb = 0;
  options.max_files = Flags::max_open_files;
  options.max_procs = kMaxProcs;
  return options;
}

int ApplyLimits(const ExecutionOptions& options, const char** what) {
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        *what = "setrlim " #res;                \
        return errno;                           \
      }                                         \
    }                                           \
  }

  if (options.memory_limit_kb) {
    SET_RLIM(AS,
             (CurrentVirtualMemoryKb() + options.memory_limit_kb) * 1024);
  }
  SET_RLIM(NOFILE, options.max_files);
  SET_RLIM(NPROC, options.max_procs);
  SET_RLIM(STACK, options.max_stack_kb * 1024);
#undef SET_RLIM

  // The hard limit kills with SIGKILL, so it stays one second past the soft
  // one that sends SIGXCPU.
  if (options.cpu_limit_millis) {
    rlim.rlim_cur = (options.cpu_limit_millis + 999) / 1000;
    rlim.rlim_max = rlim.rlim_cur + 1;
    if (setrlimit(RLIMIT_CPU, &rlim) < 0) {
      *what = "setrlim CPU";
      return errno;
    }
  }

  // Zero is meaningful for these two.
  rlim.rlim_cur = rlim.rlim_max = options.max_file_size_kb * 1024;
  if (setrlimit(RLIMIT_FSIZE, &rlim) < 0) {
    *what = "setrlim FSIZE";
    return errno;
  }
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) {
    *what = "setrlim CORE";
    return errno;
  }
  return 0;
}

Guard::~Guard() {
  if (released_) return;
  kj::UnwindDetector detector;
  detector.catchExceptionsIfUnwinding([this]() {
    if (sandbox_.Running()) {
      sandbox_.Kill();
      sandbox_.Wait(&info_);
    }
    released_ = true;
  });
}

kj::Promise<void> Guard::Expired() {
  return timer_.afterDelay(budget_millis_ * kj::MILLISECONDS).then([this]() {
    KJ_LOG(INFO, "Deadline reached, killing execution unit", sandbox_.Pid(),
           budget_millis_);
    expired_ = true;
    sandbox_.Kill();
    Release();
  });
}

const ExecutionInfo& Guard::Release() {
  if (!released_) {
    if (sandbox_.Running()) sandbox_.Wait(&info_);
    released_ = true;
  }
  return info_;
}

const ExecutionInfo& Guard::Abort() {
  if (!released_) sandbox_.Kill();
  return Release();
}

kj::Own<Guard> Enforce(Sandbox* sandbox, kj::Timer* timer,
                       int64_t budget_millis) {
  KJ_REQUIRE(sandbox->Running(), "The execution unit is not running");
  return kj::heap<Guard>(sandbox, timer, budget_millis);
}

}  // namespace sandbox
