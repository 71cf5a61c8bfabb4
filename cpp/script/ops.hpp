#ifndef SCRIPT_OPS_HPP
#define SCRIPT_OPS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "script/ast.hpp"
#include "script/value.hpp"

namespace script {

// Largest list, tuple, dict or string a snippet may build.
static const constexpr int64_t kMaxSequenceSize = int64_t{1} << 26;

// Throws MemoryError if a sequence of the given size may not be built.
void CheckSequenceSize(int64_t size);

int64_t CheckedAdd(int64_t a, int64_t b);
int64_t CheckedMul(int64_t a, int64_t b);

Value BinaryOp(ast::BinOp op, const Value& a, const Value& b);
Value UnaryOp(ast::UnaryOp op, const Value& v);
bool CompareOp(ast::CmpOp op, const Value& a, const Value& b);
bool Contains(const Value& container, const Value& item);

// Converts an int or bool to a C++ integer, raising TypeError otherwise.
int64_t ToInt(const Value& v, const char* what);
// Converts a number to a double, raising TypeError otherwise.
double ToFloat(const Value& v, const char* what);

int64_t Length(const Value& v);

Value GetItem(const Value& object, const Value& index);
void SetItem(const Value& object, const Value& index, const Value& value);
void DeleteItem(const Value& object, const Value& index);

// Bounds are None when absent.
Value GetSlice(const Value& object, const Value& lower, const Value& upper,
               const Value& step);
void SetSlice(const Value& object, const Value& lower, const Value& upper,
              const Value& step, ValueList items);

// Strings are UTF-8; indexing, slicing and len() count code points.
std::vector<std::string> CodePoints(const std::string& s);
int64_t CodePointCount(const std::string& s);

// format(value, spec), as used by f-strings and str.format.
std::string FormatSpec(const Value& v, const std::string& spec);

// The "%" operator applied to a string.
std::string FormatPercent(const std::string& format, const Value& args);

}  // namespace script

#endif
