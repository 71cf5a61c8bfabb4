#ifndef SANDBOX_SECCOMP_HPP
#define SANDBOX_SECCOMP_HPP
#include "sandbox/unix.hpp"

namespace sandbox {

// Unix execution units that, on top of the rlimits, may only use the few
// system calls an interpreter needs to compute and report its outcome.
// Any other system call kills the unit with SIGSYS.
class Seccomp : public Unix {
 public:
  static Sandbox* Create() { return new Seccomp(); }
  static int Score();

 protected:
  Seccomp() = default;

  bool OnChild(char* error_msg, size_t buflen) override;
};

}  // namespace sandbox
#endif
