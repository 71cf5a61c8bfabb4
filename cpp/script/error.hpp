#ifndef SCRIPT_ERROR_HPP
#define SCRIPT_ERROR_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "script/value.hpp"

namespace script {

// An error raised while parsing or running a snippet. The kind is the name
// the snippet sees (ValueError, NameError, ...) and the arguments are the
// values the error was raised with.
class ExecutionError : public std::runtime_error {
 public:
  ExecutionError(std::string kind, ValueList args);
  ExecutionError(std::string kind, const std::string& message)
      : ExecutionError(std::move(kind), ValueList{Value::Str(message)}) {}

  const std::string& Kind() const { return kind_; }
  const ValueList& ArgValues() const { return args_; }

  // Display strings of the arguments, in order.
  std::vector<std::string> Args() const;

  // Kinds that an "except <kind>" clause catches.
  static bool Matches(const std::string& kind, const std::string& handler);

 private:
  std::string kind_;
  ValueList args_;
};

// Raised when a snippet reaches for something outside the allow-list. It
// propagates through "except" clauses.
class CapabilityError : public ExecutionError {
 public:
  explicit CapabilityError(const std::string& message)
      : ExecutionError("CapabilityError", message) {}
};

// Names of the exception types snippets can raise and catch.
const std::vector<std::string>& ExceptionKinds();

}  // namespace script

#endif
