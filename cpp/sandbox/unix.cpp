#include "sandbox/unix.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <kj/debug.h>

#include "sandbox/limiter.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

Unix::~Unix() {
  kj::UnwindDetector detector;
  detector.catchExceptionsIfUnwinding([this]() {
    if (Running()) {
      Kill();
      ExecutionInfo info;
      Wait(&info);
    }
  });
  for (int& fd : pipe_fds_) {
    if (fd != -1) close(fd);
    fd = -1;
  }
}

bool Unix::StartInternal(const ExecutionOptions& options, const Body& body,
                         std::string* error_msg) {
  KJ_REQUIRE(!Running(), child_pid_, "Execution unit already started");
  options_ = &options;
  killed_ = false;
  if (!Setup(error_msg)) return false;
  if (!DoFork(body, error_msg)) return false;
  return WaitSetup(error_msg);
}

bool Unix::Setup(std::string* error_msg) {
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    pipe_fds_[0] = pipe_fds_[1] = -1;
    return false;
  }
  return true;
}

bool Unix::DoFork(const Body& body, std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    for (int& fd : pipe_fds_) {
      close(fd);
      fd = -1;
    }
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child(body);
}

void Unix::Child(const Body& body) {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    KJ_SYSCALL(write(pipe_fds_[1], &len, sizeof(len)), "Failed to write to fd");
    KJ_SYSCALL(write(pipe_fds_[1], buf, len), "Failed to write to fd");
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // Die together with the host, and keep away from its terminal signals.
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) == -1) die("prctl", errno);
  if (setsid() == -1) die("setsid", errno);

  // Handlers installed by the host do not belong to the unit.
  sigset_t empty;
  sigemptyset(&empty);
  if (sigprocmask(SIG_SETMASK, &empty, nullptr) == -1) {
    die("sigprocmask", errno);
  }
  for (int sig = 1; sig < NSIG; sig++) {
    if (sig == SIGKILL || sig == SIGSTOP) continue;
    if (signal(sig, SIG_DFL) == SIG_ERR && errno != EINVAL) {
      die("signal", errno);
    }
  }

  int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
  if (null_fd == -1) die("open /dev/null", errno);
  for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
    if (dup2(null_fd, fd) == -1) die("redir", errno);
  }
  if (null_fd > STDERR_FILENO) close(null_fd);

  // Close everything the unit did not explicitly inherit.
  DIR* fds = opendir("/proc/self/fd");
  if (fds == nullptr) die("opendir", errno);
  while (struct dirent* entry = readdir(fds)) {  // NOLINT
    if (entry->d_name[0] < '0' || entry->d_name[0] > '9') continue;
    int fd = atoi(entry->d_name);  // NOLINT
    if (fd <= STDERR_FILENO || fd == pipe_fds_[1] || fd == dirfd(fds)) {
      continue;
    }
    const std::vector<int>& keep = options_->inherited_fds;
    if (std::find(keep.begin(), keep.end(), fd) != keep.end()) continue;
    close(fd);
  }
  closedir(fds);

  const char* what = nullptr;
  int err = ApplyLimits(*options_, &what);
  if (err != 0) die(what, err);

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {  // NOLINT
    die2("OnChild", buf);                 // NOLINT
  }

  // Tell the host the body is about to run.
  ssize_t len = 0;
  KJ_SYSCALL(write(pipe_fds_[1], &len, sizeof(len)), "Failed to write to fd");
  close(pipe_fds_[1]);
  _Exit(body());
}

bool Unix::WaitSetup(std::string* error_msg) {
  close(pipe_fds_[1]);
  pipe_fds_[1] = -1;
  ssize_t error_len = -1;
  ssize_t num_read = 0;
  KJ_SYSCALL(num_read = read(pipe_fds_[0], &error_len, sizeof(error_len)),
             "Failed to read from fd");
  if (num_read == sizeof(error_len) && error_len == 0) {
    close(pipe_fds_[0]);
    pipe_fds_[0] = -1;
    return true;
  }
  if (num_read == sizeof(error_len) && error_len > 0) {
    char error[PIPE_BUF] = {};
    KJ_SYSCALL(read(pipe_fds_[0], error,
                    std::min<size_t>(error_len, PIPE_BUF - 1)),
               "Failed to read from fd");
    *error_msg = error;
  } else {
    *error_msg = "execution unit exited during setup";
  }
  close(pipe_fds_[0]);
  pipe_fds_[0] = -1;
  ExecutionInfo info;
  Wait(&info);
  return false;
}

void Unix::Kill() {
  if (!Running()) return;
  // The unit leads its own process group.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    KJ_FAIL_SYSCALL("kill", errno, child_pid_);
  }
  killed_ = true;
}

void Unix::Wait(ExecutionInfo* info) {
  KJ_REQUIRE(Running(), "No execution unit to wait for");
  int child_status = 0;
  struct rusage rusage {};
  KJ_SYSCALL(wait4(child_pid_, &child_status, 0, &rusage), child_pid_);
  child_pid_ = 0;

  info->memory_usage_kb = rusage.ru_maxrss;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->killed = killed_;
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  } else {
    info->message.clear();
  }
  OnFinish(info);
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
