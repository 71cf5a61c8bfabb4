#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <sys/types.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Limits applied inside an execution unit. Zero means "not limited", except
// for max_file_size_kb which is always applied.
struct ExecutionOptions {
  int64_t cpu_limit_millis = 0;
  // Address space the unit may grow by, on top of what it inherits.
  int64_t memory_limit_kb = 0;
  int64_t max_stack_kb = 0;
  int64_t max_file_size_kb = 0;
  int32_t max_files = 0;
  int32_t max_procs = 0;

  // Descriptors that stay open in the unit. Every other one is closed.
  std::vector<int> inherited_fds;
};

// How an execution unit ended.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // Set if the unit was terminated by Kill().
  bool killed = false;
  std::string message;
};

// Sandbox interface. An execution unit is a process forked from the caller
// that runs a body function under the given limits and exits with the
// value it returns.
// Implementations need to register themselves by creating a global object
// of type Sandbox::Register<SandboxImpl> and should define the Create and
// Score static functions. Create should return a pointer to a newly
// allocated instance of the given implementation, while Score should return
// a value that defines how "good" that sandbox is: negative if the sandbox
// cannot be used on this machine, positive otherwise (a bigger value means
// a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  using Body = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Starts body in a new execution unit. Returns true once the limits are
  // in place and body is about to run. Otherwise, returns false and sets
  // error_msg; no process is left behind in that case.
  bool Start(const ExecutionOptions& options, const Body& body,
             std::string* error_msg) {
    return StartInternal(options, body, error_msg);
  }

  // Blocks until the unit has exited and reaps it.
  virtual void Wait(ExecutionInfo* info) = 0;

  // Sends SIGKILL to the whole process group of the unit. Does not reap.
  virtual void Kill() = 0;

  // True between a successful Start and the reap in Wait.
  virtual bool Running() const = 0;

  virtual pid_t Pid() const = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 protected:
  virtual bool StartInternal(const ExecutionOptions& options,
                             const Body& body, std::string* error_msg) = 0;

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
