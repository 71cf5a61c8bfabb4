#ifndef SCRIPT_LEXER_HPP
#define SCRIPT_LEXER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace script {

enum class TokenType {
  NAME,
  INT,
  FLOAT,
  STRING,
  FSTRING,
  OP,
  NEWLINE,
  INDENT,
  DEDENT,
  END
};

struct Token {
  TokenType type;
  // Identifier, operator, decoded string literal, or the raw body of an
  // f-string.
  std::string text;
  int line = 0;
  int64_t int_value = 0;
  double float_value = 0;
};

// Splits the source into tokens, producing INDENT/DEDENT tokens for
// indentation changes. Throws ExecutionError("SyntaxError") on malformed
// input.
std::vector<Token> Tokenize(const std::string& source);

// Decodes backslash escapes in a string literal body.
std::string DecodeEscapes(const std::string& body, int line);

}  // namespace script

#endif
