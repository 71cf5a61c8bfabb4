#ifndef SCRIPT_NATIVE_HPP
#define SCRIPT_NATIVE_HPP

#include <cstddef>
#include <string>

#include "script/value.hpp"

namespace script {

// Argument checking for functions implemented in C++. All of them throw
// TypeError with the message a snippet would expect.

void ExpectArgs(const std::string& fn, const ValueList& args, size_t min,
                size_t max);
void ExpectNoKwargs(const std::string& fn, const Kwargs& kwargs);

// Removes the keyword argument called name from kwargs and returns it, or
// returns fallback if it is absent.
Value PopKwarg(Kwargs* kwargs, const std::string& name, const Value& fallback);

// Fails if kwargs still holds arguments nobody consumed.
void ExpectKwargsConsumed(const std::string& fn, const Kwargs& kwargs);

const std::string& ExpectStr(const std::string& fn, const Value& v);

}  // namespace script

#endif
