#ifndef SANDBOX_RUNNER_HPP
#define SANDBOX_RUNNER_HPP

#include <cstdint>
#include <string>

#include <kj/array.h>
#include <kj/async-io.h>

#include "sandbox/result.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs snippets in execution units on the event loop of the caller. Every
// request gets a fresh unit, so runs never see each other's state.
class Runner {
 public:
  struct Stats {
    uint64_t runs = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t timed_out = 0;
  };

  Runner(kj::Timer* timer, kj::LowLevelAsyncIoProvider* provider)
      : timer_(*timer), provider_(*provider) {}
  KJ_DISALLOW_COPY(Runner);

  // Executes request.source for at most request.time_budget_millis of wall
  // time. Always resolves to a result: problems with the execution unit
  // itself are reported as a SandboxError. Throws only if the budget is not
  // positive or the source is empty once normalized.
  kj::Promise<SandboxResult> Execute(SandboxRequest request);

  // Counters over every run of the process.
  static Stats GetStats();

 private:
  kj::Timer& timer_;
  kj::LowLevelAsyncIoProvider& provider_;
};

// What the host got from the outcome pipe of a unit.
struct Received {
  bool expired = false;
  kj::Array<kj::byte> data;
  // Set when the outcome could not be read to the end.
  std::string error;
};

// Maps how a unit ended, and the outcome it sent, to a result. Units killed
// by SIGSYS broke the system call filter and fail with a CapabilityError;
// other crashes fail with a SandboxError.
SandboxResult Interpret(const Received& received, const ExecutionInfo& info,
                        int64_t budget_millis);

// Synchronous variant of Runner::Execute, with a private event loop.
SandboxResult Execute(const std::string& source, int64_t time_budget_millis);

}  // namespace sandbox

#endif
