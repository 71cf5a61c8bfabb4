#ifndef SCRIPT_METHODS_HPP
#define SCRIPT_METHODS_HPP

#include <string>

#include "script/value.hpp"

namespace script {

// Looks up an allow-listed method of a str, list, tuple, dict or Surface
// and binds it to self. Returns false if there is no such method.
bool BindMethod(const Value& self, const std::string& name, Value* out);

// Stable sort shared by list.sort and sorted(). key may be None.
void SortValues(Interpreter& interp, ValueList* items, const Value& key,
                bool reverse);

}  // namespace script

#endif
