#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <ostream>
#include "backward.hpp"

namespace util {

// Writes KJ log lines to stderr, or to Flags::log_file when set. In
// verbose mode INFO lines are enabled and exceptions come with a stack
// trace.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext& context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  bool colors;
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
