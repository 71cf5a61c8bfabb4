#ifndef SCRIPT_PARSER_HPP
#define SCRIPT_PARSER_HPP

#include <string>

#include "script/ast.hpp"

namespace script {

// Maximum nesting of expressions and blocks accepted by the parser.
static const constexpr int kMaxNestingDepth = 100;

// Parses a snippet. If the whole snippet is a single expression statement,
// Program::expression is set and Program::body is empty. Throws
// ExecutionError("SyntaxError") on invalid input.
Program Parse(const std::string& source);

}  // namespace script

#endif
