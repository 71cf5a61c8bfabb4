#ifndef SCRIPT_BUILTINS_HPP
#define SCRIPT_BUILTINS_HPP

#include <map>
#include <string>

#include "script/value.hpp"

namespace script {

// Builtin functions and exception constructors, by name. This map is the
// whole global namespace a snippet starts with.
std::map<std::string, Value> MakeBuiltins();

// A fresh instance of the allow-listed module called name, or None if there
// is no such module.
Value MakeModule(const std::string& name);

}  // namespace script

#endif
