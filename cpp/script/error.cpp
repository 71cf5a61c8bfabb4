#include "script/error.hpp"

namespace script {

namespace {
std::string Describe(const std::string& kind, const ValueList& args) {
  std::string out = kind;
  for (size_t i = 0; i < args.size(); i++) {
    out += i == 0 ? ": " : ", ";
    out += Str(args[i]);
  }
  return out;
}

// Parent of each kind that has one; everything derives from Exception.
const std::vector<std::pair<std::string, std::string>>& Parents() {
  static const std::vector<std::pair<std::string, std::string>> parents = {
      {"ZeroDivisionError", "ArithmeticError"},
      {"OverflowError", "ArithmeticError"},
      {"IndexError", "LookupError"},
      {"KeyError", "LookupError"},
      {"RecursionError", "RuntimeError"},
      {"ModuleNotFoundError", "ImportError"},
  };
  return parents;
}
}  // namespace

ExecutionError::ExecutionError(std::string kind, ValueList args)
    : std::runtime_error(Describe(kind, args)),
      kind_(std::move(kind)),
      args_(std::move(args)) {}

std::vector<std::string> ExecutionError::Args() const {
  std::vector<std::string> out;
  out.reserve(args_.size());
  for (const Value& v : args_) out.push_back(Str(v));
  return out;
}

bool ExecutionError::Matches(const std::string& kind,
                             const std::string& handler) {
  if (kind == "CapabilityError") return false;
  if (handler == "Exception" || handler == kind) return true;
  for (const auto& p : Parents()) {
    if (p.first == kind) return Matches(p.second, handler);
  }
  return false;
}

const std::vector<std::string>& ExceptionKinds() {
  static const std::vector<std::string> kinds = {
      "Exception",      "ArithmeticError", "AssertionError",
      "AttributeError", "ImportError",     "IndexError",
      "KeyError",       "LookupError",     "MemoryError",
      "NameError",      "OverflowError",   "RecursionError",
      "RuntimeError",   "StopIteration",   "TypeError",
      "ValueError",     "ZeroDivisionError"};
  return kinds;
}

}  // namespace script
