#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Execution units as plain forked processes, in their own session and
// process group, with rlimits applied.
class Unix : public Sandbox {
 public:
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

  void Wait(ExecutionInfo* info) override;
  void Kill() override;
  bool Running() const override { return child_pid_ > 0; }
  pid_t Pid() const override { return child_pid_; }

  ~Unix() override;

 protected:
  Unix() = default;

  bool StartInternal(const ExecutionOptions& options, const Body& body,
                     std::string* error_msg) override;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child
  // process executes Child and never returns.
  bool DoFork(const Body& body, std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child(const Body& body);

  // Hook that is executed in the child after the limits are set, just
  // before the body runs. Returns false if something went wrong and the
  // body should not run. The error_msg string must not be longer than
  // buflen characters.
  virtual bool OnChild(char* error_msg, size_t buflen) { return true; }

  // Reads the setup report of the child. Returns false, after reaping the
  // child, if the body will not run.
  bool WaitSetup(std::string* error_msg);

  // Executed when the child exits. May change the execution info with
  // "better" values.
  virtual void OnFinish(ExecutionInfo* info) {}

  int pipe_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
  bool killed_ = false;
  const ExecutionOptions* options_ = nullptr;
};

}  // namespace sandbox
#endif
