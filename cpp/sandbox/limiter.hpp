#ifndef SANDBOX_LIMITER_HPP
#define SANDBOX_LIMITER_HPP

#include <cstdint>

#include <kj/async-io.h>
#include <kj/memory.h>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Limits of an execution unit that runs for at most budget_millis of wall
// time, from the configured memory and file ceilings.
ExecutionOptions LimitsFor(int64_t budget_millis);

// Applies options to the calling process as rlimits. Returns 0, or the
// errno of the first limit that could not be set, whose name is stored in
// *what. Does not allocate.
int ApplyLimits(const ExecutionOptions& options, const char** what);

// Deadline of a running execution unit. The unit is killed and reaped
// before the guard goes away, whatever path the caller takes.
class Guard {
 public:
  Guard(Sandbox* sandbox, kj::Timer* timer, int64_t budget_millis)
      : sandbox_(*sandbox), timer_(*timer), budget_millis_(budget_millis) {}
  ~Guard();
  KJ_DISALLOW_COPY(Guard);

  // Resolves after the budget, once the unit has been killed and reaped.
  kj::Promise<void> Expired();

  // Reaps the unit and returns how it ended. Blocks until it exits.
  const ExecutionInfo& Release();

  // Kills the unit, then reaps it. For units the host stopped listening to.
  const ExecutionInfo& Abort();

  bool HasExpired() const { return expired_; }
  int64_t BudgetMillis() const { return budget_millis_; }

 private:
  Sandbox& sandbox_;
  kj::Timer& timer_;
  int64_t budget_millis_;
  bool expired_ = false;
  bool released_ = false;
  ExecutionInfo info_;
};

// Starts guarding a unit that was started by sandbox.
kj::Own<Guard> Enforce(Sandbox* sandbox, kj::Timer* timer,
                       int64_t budget_millis);

}  // namespace sandbox

#endif
