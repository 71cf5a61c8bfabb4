#include "script/lexer.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include "script/error.hpp"
#include "util/misc.hpp"

namespace script {

namespace {

const char* const kOperators[] = {
    "**=", "//=", ">>=", "<<=", "**", "//", "==", "!=", "<=", ">=", "+=",
    "-=",  "*=",  "/=",  "%=",  "&=", "|=", "^=", "<<", ">>", "->", "+",
    "-",   "*",   "/",   "%",   "<",  ">",  "=",  "(",  ")",  "[",  "]",
    "{",   "}",   ",",   ":",   ".",  ";",  "&",  "|",  "^",  "~",  "@"};

ExecutionError SyntaxError(const std::string& message, int line) {
  return ExecutionError("SyntaxError",
                        message + " (line " + std::to_string(line) + ")");
}

bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsIdentChar(char c) {
  return IsIdentStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

int DigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return 99;
}

class Lexer {
 public:
  explicit Lexer(const std::string& source) : src_(source) {}

  std::vector<Token> Run() {
    std::vector<int> indents{0};
    bool at_line_start = true;
    while (pos_ < src_.size()) {
      if (at_line_start && depth_ == 0) {
        int width = 0;
        size_t p = pos_;
        while (p < src_.size() &&
               (src_[p] == ' ' || src_[p] == '\t' || src_[p] == '\f')) {
          width = src_[p] == '\t' ? (width / 8 + 1) * 8 : width + 1;
          p++;
        }
        if (p >= src_.size()) {
          pos_ = p;
          break;
        }
        if (src_[p] == '\n' || src_[p] == '\r' || src_[p] == '#') {
          // Blank or comment-only line.
          while (p < src_.size() && src_[p] != '\n') p++;
          if (p < src_.size()) {
            p++;
            line_++;
          }
          pos_ = p;
          continue;
        }
        pos_ = p;
        if (width > indents.back()) {
          indents.push_back(width);
          Emit(TokenType::INDENT, "");
        } else {
          while (width < indents.back()) {
            indents.pop_back();
            Emit(TokenType::DEDENT, "");
          }
          if (width != indents.back()) {
            throw SyntaxError(
                "unindent does not match any outer indentation level", line_);
          }
        }
        at_line_start = false;
      }

      char c = src_[pos_];
      if (c == '\n') {
        pos_++;
        if (depth_ == 0) {
          Emit(TokenType::NEWLINE, "");
          at_line_start = true;
        }
        line_++;
        continue;
      }
      if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
        pos_++;
        continue;
      }
      if (c == '#') {
        while (pos_ < src_.size() && src_[pos_] != '\n') pos_++;
        continue;
      }
      if (c == '\\') {
        if (Peek(1) == '\n') {
          pos_ += 2;
          line_++;
          continue;
        }
        throw SyntaxError("unexpected character after line continuation",
                          line_);
      }
      if (IsIdentStart(c)) {
        size_t start = pos_;
        while (pos_ < src_.size() && IsIdentChar(src_[pos_])) pos_++;
        std::string word = src_.substr(start, pos_ - start);
        if ((Peek(0) == '\'' || Peek(0) == '"') && IsStringPrefix(word)) {
          ReadString(word);
        } else {
          Emit(TokenType::NAME, word);
        }
        continue;
      }
      if (std::isdigit(static_cast<unsigned char>(c)) ||
          (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
        ReadNumber();
        continue;
      }
      if (c == '\'' || c == '"') {
        ReadString("");
        continue;
      }
      ReadOperator();
    }
    if (depth_ > 0) {
      throw SyntaxError("unexpected EOF in multi-line statement", line_);
    }
    if (!tokens_.empty() && tokens_.back().type != TokenType::NEWLINE &&
        tokens_.back().type != TokenType::DEDENT) {
      Emit(TokenType::NEWLINE, "");
    }
    while (indents.size() > 1) {
      indents.pop_back();
      Emit(TokenType::DEDENT, "");
    }
    Emit(TokenType::END, "");
    return std::move(tokens_);
  }

 private:
  char Peek(size_t offset) const {
    return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
  }

  Token& Emit(TokenType type, std::string text) {
    Token token;
    token.type = type;
    token.text = std::move(text);
    token.line = line_;
    tokens_.push_back(std::move(token));
    return tokens_.back();
  }

  static bool IsStringPrefix(const std::string& word) {
    static const char* const prefixes[] = {"r", "R", "f", "F", "u", "U",
                                           "rf", "fr", "Rf", "fR", "rF",
                                           "Fr", "RF", "FR"};
    for (const char* p : prefixes) {
      if (word == p) return true;
    }
    return false;
  }

  void ReadString(const std::string& prefix) {
    bool raw = prefix.find_first_of("rR") != std::string::npos;
    bool format = prefix.find_first_of("fF") != std::string::npos;
    int start_line = line_;
    char quote = src_[pos_];
    bool triple = Peek(1) == quote && Peek(2) == quote;
    pos_ += triple ? 3 : 1;
    std::string body;
    while (true) {
      if (pos_ >= src_.size()) {
        throw SyntaxError("unterminated string literal", start_line);
      }
      char c = src_[pos_];
      if (c == '\\') {
        body += c;
        if (pos_ + 1 < src_.size()) {
          if (src_[pos_ + 1] == '\n') line_++;
          body += src_[pos_ + 1];
        }
        pos_ += 2;
        continue;
      }
      if (c == quote) {
        if (!triple) {
          pos_++;
          break;
        }
        if (Peek(1) == quote && Peek(2) == quote) {
          pos_ += 3;
          break;
        }
      }
      if (c == '\n') {
        if (!triple) {
          throw SyntaxError("unterminated string literal", start_line);
        }
        line_++;
      }
      body += c;
      pos_++;
    }
    if (format) {
      if (raw) {
        // Literal parts are decoded later; double the backslashes so that
        // decoding gives them back unchanged.
        std::string doubled;
        for (char c : body) {
          doubled += c;
          if (c == '\\') doubled += c;
        }
        body = std::move(doubled);
      }
      Emit(TokenType::FSTRING, std::move(body)).line = start_line;
    } else {
      Emit(TokenType::STRING, raw ? body : DecodeEscapes(body, start_line))
          .line = start_line;
    }
  }

  void ReadNumber() {
    size_t start = pos_;
    int base = 10;
    if (src_[pos_] == '0') {
      char p = Peek(1);
      if (p == 'x' || p == 'X') base = 16;
      if (p == 'o' || p == 'O') base = 8;
      if (p == 'b' || p == 'B') base = 2;
    }
    bool is_float = false;
    std::string digits;
    if (base != 10) {
      pos_ += 2;
      while (pos_ < src_.size() &&
             (DigitValue(src_[pos_]) < base || src_[pos_] == '_')) {
        if (src_[pos_] != '_') digits += src_[pos_];
        pos_++;
      }
      if (digits.empty()) throw SyntaxError("invalid number literal", line_);
    } else {
      auto read_digits = [&]() {
        while (pos_ < src_.size() &&
               (std::isdigit(static_cast<unsigned char>(src_[pos_])) ||
                src_[pos_] == '_')) {
          if (src_[pos_] != '_') digits += src_[pos_];
          pos_++;
        }
      };
      read_digits();
      if (Peek(0) == '.') {
        is_float = true;
        digits += '.';
        pos_++;
        read_digits();
      }
      if (Peek(0) == 'e' || Peek(0) == 'E') {
        char sign = Peek(1);
        size_t skip = (sign == '+' || sign == '-') ? 2 : 1;
        if (std::isdigit(static_cast<unsigned char>(Peek(skip)))) {
          is_float = true;
          digits += 'e';
          if (skip == 2) digits += sign;
          pos_ += skip;
          read_digits();
        }
      }
    }
    if (pos_ < src_.size() && IsIdentChar(src_[pos_])) {
      throw SyntaxError("invalid number literal", line_);
    }
    Token& token = Emit(is_float ? TokenType::FLOAT : TokenType::INT,
                        src_.substr(start, pos_ - start));
    if (is_float) {
      token.float_value = strtod(digits.c_str(), nullptr);
      return;
    }
    uint64_t value = 0;
    for (char c : digits) {
      uint64_t next = value * base + DigitValue(c);
      if (next > static_cast<uint64_t>(INT64_MAX) ||
          value > static_cast<uint64_t>(INT64_MAX) / base) {
        throw ExecutionError("OverflowError", "integer literal is too large");
      }
      value = next;
    }
    token.int_value = static_cast<int64_t>(value);
  }

  void ReadOperator() {
    for (const char* op : kOperators) {
      size_t len = strlen(op);
      if (src_.compare(pos_, len, op) != 0) continue;
      pos_ += len;
      char c = op[0];
      if (len == 1 && (c == '(' || c == '[' || c == '{')) depth_++;
      if (len == 1 && (c == ')' || c == ']' || c == '}')) {
        if (depth_ == 0) {
          throw SyntaxError("unmatched '" + std::string(op) + "'", line_);
        }
        depth_--;
      }
      Emit(TokenType::OP, op);
      return;
    }
    throw SyntaxError("invalid character '" + std::string(1, src_[pos_]) + "'",
                      line_);
  }

  const std::string& src_;
  size_t pos_ = 0;
  int line_ = 1;
  int depth_ = 0;
  std::vector<Token> tokens_;
};

}  // namespace

std::vector<Token> Tokenize(const std::string& source) {
  return Lexer(source).Run();
}

std::string DecodeEscapes(const std::string& body, int line) {
  std::string out;
  for (size_t i = 0; i < body.size(); i++) {
    char c = body[i];
    if (c != '\\' || i + 1 >= body.size()) {
      out += c;
      continue;
    }
    char e = body[++i];
    switch (e) {
      case '\n':
        break;
      case '\\':
      case '\'':
      case '"':
        out += e;
        break;
      case 'n':
        out += '\n';
        break;
      case 't':
        out += '\t';
        break;
      case 'r':
        out += '\r';
        break;
      case 'a':
        out += '\a';
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case 'v':
        out += '\v';
        break;
      case 'x':
      case 'u':
      case 'U': {
        size_t len = e == 'x' ? 2 : (e == 'u' ? 4 : 8);
        uint32_t code = 0;
        for (size_t k = 0; k < len; k++) {
          if (i + 1 >= body.size() || DigitValue(body[i + 1]) >= 16) {
            throw SyntaxError("truncated \\" + std::string(1, e) + " escape",
                              line);
          }
          code = code * 16 + DigitValue(body[++i]);
        }
        if (code > 0x10FFFF) {
          throw SyntaxError("illegal Unicode character", line);
        }
        util::AppendUtf8(&out, code);
        break;
      }
      default:
        if (e >= '0' && e <= '7') {
          uint32_t code = e - '0';
          for (int k = 0; k < 2 && i + 1 < body.size() && body[i + 1] >= '0' &&
                          body[i + 1] <= '7';
               k++) {
            code = code * 8 + (body[++i] - '0');
          }
          util::AppendUtf8(&out, code);
        } else {
          out += '\\';
          out += e;
        }
    }
  }
  return out;
}

}  // namespace script
