#ifndef SANDBOX_RESULT_HPP
#define SANDBOX_RESULT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace sandbox {

struct SandboxRequest {
  std::string source;
  int64_t time_budget_millis = 0;
};

// An image produced by a snippet, PNG encoded.
struct Artifact {
  uint32_t width = 0;
  uint32_t height = 0;
  std::string png;
};

// An error raised by a snippet, or the reason it did not finish.
struct ExceptionInfo {
  std::string kind;
  std::vector<std::string> args;
};

struct SandboxResult {
  enum class Status { COMPLETED, FAILED, TIMED_OUT };
  Status status = Status::FAILED;

  // Time the snippet itself ran for. The whole budget on timeouts.
  int64_t duration_nanos = 0;

  // Only meaningful on COMPLETED. has_text is false if the snippet printed
  // nothing and had no trailing value.
  bool has_text = false;
  std::string text;
  bool text_truncated = false;
  bool has_image = false;
  Artifact image;
  bool image_too_large = false;

  // Only meaningful on FAILED and TIMED_OUT.
  ExceptionInfo exception;

  bool HasException() const { return status != Status::COMPLETED; }
};

const char* StatusName(SandboxResult::Status status);

}  // namespace sandbox

#endif
