#include "script/native.hpp"

#include "script/error.hpp"

namespace script {

void ExpectArgs(const std::string& fn, const ValueList& args, size_t min,
                size_t max) {
  if (args.size() >= min && args.size() <= max) return;
  std::string expected;
  if (min == max) {
    expected = "exactly " + std::to_string(min);
  } else if (args.size() < min) {
    expected = "at least " + std::to_string(min);
  } else {
    expected = "at most " + std::to_string(max);
  }
  throw ExecutionError("TypeError", fn + "() takes " + expected +
                                        " argument" + (max == 1 ? "" : "s") +
                                        " (" + std::to_string(args.size()) +
                                        " given)");
}

void ExpectNoKwargs(const std::string& fn, const Kwargs& kwargs) {
  if (!kwargs.empty()) {
    throw ExecutionError("TypeError",
                         fn + "() takes no keyword arguments");
  }
}

Value PopKwarg(Kwargs* kwargs, const std::string& name,
               const Value& fallback) {
  for (auto it = kwargs->begin(); it != kwargs->end(); ++it) {
    if (it->first == name) {
      Value v = it->second;
      kwargs->erase(it);
      return v;
    }
  }
  return fallback;
}

void ExpectKwargsConsumed(const std::string& fn, const Kwargs& kwargs) {
  if (kwargs.empty()) return;
  throw ExecutionError("TypeError", fn +
                                        "() got an unexpected keyword "
                                        "argument '" +
                                        kwargs.front().first + "'");
}

const std::string& ExpectStr(const std::string& fn, const Value& v) {
  if (!v.Is(Value::Type::STR)) {
    throw ExecutionError("TypeError", fn + "() argument must be str, not " +
                                          v.TypeName());
  }
  return v.AsStr();
}

}  // namespace script
