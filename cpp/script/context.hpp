#ifndef SCRIPT_CONTEXT_HPP
#define SCRIPT_CONTEXT_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "script/output.hpp"

namespace script {

// What running a snippet led to. Exactly one of completion and error is
// meaningful, as told by completed.
struct Outcome {
  bool completed = false;
  Completion completion;
  std::string error_kind;
  std::vector<std::string> error_args;
  // Time spent parsing and interpreting.
  int64_t duration_nanos = 0;
};

// Parses and runs source in a fresh interpreter whose only reachable names
// are the allow-listed ones. Errors raised by the snippet, including
// allocation failures, are reported in the outcome rather than thrown.
Outcome RunSnippet(const std::string& source, uint64_t seed);

}  // namespace script

#endif
