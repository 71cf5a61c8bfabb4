#include "sandbox/seccomp.hpp"

#include <seccomp.h>
#include <sys/prctl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

namespace sandbox {

namespace {
// Calls allowed with any argument.
const int kAllowed[] = {
    SCMP_SYS(read),         SCMP_SYS(close),        SCMP_SYS(fstat),
    SCMP_SYS(newfstatat),   SCMP_SYS(lseek),        SCMP_SYS(brk),
    SCMP_SYS(mmap),         SCMP_SYS(munmap),       SCMP_SYS(mremap),
    SCMP_SYS(mprotect),     SCMP_SYS(madvise),      SCMP_SYS(exit),
    SCMP_SYS(exit_group),   SCMP_SYS(rt_sigreturn), SCMP_SYS(rt_sigprocmask),
    SCMP_SYS(rt_sigaction), SCMP_SYS(futex),        SCMP_SYS(clock_gettime),
    SCMP_SYS(clock_getres), SCMP_SYS(gettimeofday), SCMP_SYS(getrandom),
    SCMP_SYS(sched_yield),  SCMP_SYS(getpid),       SCMP_SYS(gettid),
    SCMP_SYS(tgkill),
};

// Calls allowed only on the standard streams and the inherited descriptors.
const int kAllowedOnFd[] = {SCMP_SYS(write), SCMP_SYS(writev)};

bool Fail(const char* what, int err, char* error_msg, size_t buflen) {
  snprintf(error_msg, buflen, "%s: %s", what, strerror(err));  // NOLINT
  return false;
}
}  // namespace

int Seccomp::Score() {
  // PR_GET_SECCOMP fails with EINVAL if the kernel lacks seccomp.
  if (prctl(PR_GET_SECCOMP, 0, 0, 0, 0) == -1) return -1;
  return 3;
}

bool Seccomp::OnChild(char* error_msg, size_t buflen) {
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
    return Fail("prctl", errno, error_msg, buflen);
  }
  scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_KILL);
  if (ctx == nullptr) return Fail("seccomp_init", ENOMEM, error_msg, buflen);

  std::vector<int> fds = {STDOUT_FILENO, STDERR_FILENO};
  fds.insert(fds.end(), options_->inherited_fds.begin(),
             options_->inherited_fds.end());
  int ret = 0;
  for (int syscall : kAllowed) {
    ret = seccomp_rule_add(ctx, SCMP_ACT_ALLOW, syscall, 0);
    if (ret < 0) break;
  }
  for (int syscall : kAllowedOnFd) {
    for (int fd : fds) {
      if (ret < 0) break;
      ret = seccomp_rule_add(ctx, SCMP_ACT_ALLOW, syscall, 1,
                             SCMP_A0(SCMP_CMP_EQ, fd));
    }
  }
  if (ret < 0) {
    seccomp_release(ctx);
    return Fail("seccomp_rule_add", -ret, error_msg, buflen);
  }
  ret = seccomp_load(ctx);
  seccomp_release(ctx);
  if (ret < 0) return Fail("seccomp_load", -ret, error_msg, buflen);
  return true;
}

namespace {
Sandbox::Register<Seccomp> r;  // NOLINT
}  // namespace

}  // namespace sandbox
