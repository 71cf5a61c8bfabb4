#ifndef SCRIPT_AST_HPP
#define SCRIPT_AST_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "script/value.hpp"

namespace script {
namespace ast {

enum class BinOp {
  ADD,
  SUB,
  MUL,
  DIV,
  FLOOR_DIV,
  MOD,
  POW,
  LSHIFT,
  RSHIFT,
  BIT_AND,
  BIT_OR,
  BIT_XOR
};

enum class CmpOp { EQ, NE, LT, LE, GT, GE, IN, NOT_IN, IS, IS_NOT };

enum class UnaryOp { NEG, POS, NOT, INVERT };

struct Expr {
  enum class Kind {
    CONSTANT,
    NAME,
    FSTRING,
    LIST,
    TUPLE,
    DICT,
    UNARY,
    BINARY,
    AND,
    OR,
    COMPARE,
    CONDITIONAL,
    CALL,
    ATTRIBUTE,
    SUBSCRIPT,
    SLICE,
    LAMBDA,
    LIST_COMP,
    DICT_COMP
  };
  Expr(Kind kind, int line) : kind(kind), line(line) {}
  virtual ~Expr() = default;
  Kind kind;
  int line;
};

using ExprPtr = std::unique_ptr<Expr>;
using ExprList = std::vector<ExprPtr>;

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

struct Constant : Expr {
  Constant(Value value, int line)
      : Expr(Kind::CONSTANT, line), value(std::move(value)) {}
  Value value;
};

struct Name : Expr {
  Name(std::string id, int line) : Expr(Kind::NAME, line), id(std::move(id)) {}
  std::string id;
};

struct FString : Expr {
  struct Part {
    std::string literal;
    ExprPtr value;  // Null for literal parts.
    char conversion = 0;  // 'r', 's' or 0.
    std::string spec;
  };
  explicit FString(int line) : Expr(Kind::FSTRING, line) {}
  std::vector<Part> parts;
};

// LIST and TUPLE.
struct Sequence : Expr {
  Sequence(Kind kind, int line) : Expr(kind, line) {}
  ExprList items;
};

struct Dict : Expr {
  explicit Dict(int line) : Expr(Kind::DICT, line) {}
  ExprList keys;
  ExprList values;
};

struct Unary : Expr {
  Unary(UnaryOp op, ExprPtr operand, int line)
      : Expr(Kind::UNARY, line), op(op), operand(std::move(operand)) {}
  UnaryOp op;
  ExprPtr operand;
};

struct Binary : Expr {
  Binary(BinOp op, ExprPtr left, ExprPtr right, int line)
      : Expr(Kind::BINARY, line),
        op(op),
        left(std::move(left)),
        right(std::move(right)) {}
  BinOp op;
  ExprPtr left;
  ExprPtr right;
};

// AND and OR.
struct Logical : Expr {
  Logical(Kind kind, ExprPtr left, ExprPtr right, int line)
      : Expr(kind, line), left(std::move(left)), right(std::move(right)) {}
  ExprPtr left;
  ExprPtr right;
};

// a < b <= c is one Compare with two operators.
struct Compare : Expr {
  explicit Compare(int line) : Expr(Kind::COMPARE, line) {}
  ExprPtr first;
  std::vector<CmpOp> ops;
  ExprList rest;
};

struct Conditional : Expr {
  explicit Conditional(int line) : Expr(Kind::CONDITIONAL, line) {}
  ExprPtr test;
  ExprPtr body;
  ExprPtr orelse;
};

struct Call : Expr {
  explicit Call(int line) : Expr(Kind::CALL, line) {}
  ExprPtr func;
  ExprList args;
  std::vector<std::pair<std::string, ExprPtr>> kwargs;
};

struct Attribute : Expr {
  Attribute(ExprPtr object, std::string name, int line)
      : Expr(Kind::ATTRIBUTE, line),
        object(std::move(object)),
        name(std::move(name)) {}
  ExprPtr object;
  std::string name;
};

struct Subscript : Expr {
  Subscript(ExprPtr object, ExprPtr index, int line)
      : Expr(Kind::SUBSCRIPT, line),
        object(std::move(object)),
        index(std::move(index)) {}
  ExprPtr object;
  ExprPtr index;
};

// Only valid as a subscript index. Missing bounds are null.
struct Slice : Expr {
  explicit Slice(int line) : Expr(Kind::SLICE, line) {}
  ExprPtr lower;
  ExprPtr upper;
  ExprPtr step;
};

struct Parameters {
  std::vector<std::string> names;
  ExprList defaults;  // Aligned to the last names.
};

struct Lambda : Expr {
  explicit Lambda(int line) : Expr(Kind::LAMBDA, line) {}
  Parameters params;
  ExprPtr body;
};

struct ComprehensionClause {
  ExprPtr target;
  ExprPtr iter;
  ExprList conditions;
};

// LIST_COMP (also used for generator expressions) and DICT_COMP.
struct Comprehension : Expr {
  Comprehension(Kind kind, int line) : Expr(kind, line) {}
  ExprPtr element;  // The key for DICT_COMP.
  ExprPtr value;    // DICT_COMP only.
  std::vector<ComprehensionClause> clauses;
};

struct Stmt {
  enum class Kind {
    EXPR,
    ASSIGN,
    AUG_ASSIGN,
    IF,
    WHILE,
    FOR,
    BREAK,
    CONTINUE,
    PASS,
    DEF,
    RETURN,
    IMPORT,
    FROM_IMPORT,
    TRY,
    RAISE,
    GLOBAL,
    DEL,
    ASSERT
  };
  Stmt(Kind kind, int line) : kind(kind), line(line) {}
  virtual ~Stmt() = default;
  Kind kind;
  int line;
};

struct ExprStmt : Stmt {
  ExprStmt(ExprPtr value, int line)
      : Stmt(Kind::EXPR, line), value(std::move(value)) {}
  ExprPtr value;
};

// a = b = value
struct Assign : Stmt {
  explicit Assign(int line) : Stmt(Kind::ASSIGN, line) {}
  ExprList targets;
  ExprPtr value;
};

struct AugAssign : Stmt {
  AugAssign(ExprPtr target, BinOp op, ExprPtr value, int line)
      : Stmt(Kind::AUG_ASSIGN, line),
        target(std::move(target)),
        op(op),
        value(std::move(value)) {}
  ExprPtr target;
  BinOp op;
  ExprPtr value;
};

// IF and WHILE.
struct Branch : Stmt {
  Branch(Kind kind, int line) : Stmt(kind, line) {}
  ExprPtr test;
  Block body;
  Block orelse;
};

struct For : Stmt {
  explicit For(int line) : Stmt(Kind::FOR, line) {}
  ExprPtr target;
  ExprPtr iter;
  Block body;
  Block orelse;
};

struct Def : Stmt {
  explicit Def(int line) : Stmt(Kind::DEF, line) {}
  std::string name;
  Parameters params;
  Block body;
};

// RETURN, RAISE and ASSERT; value may be null.
struct Valued : Stmt {
  Valued(Kind kind, int line) : Stmt(kind, line) {}
  ExprPtr value;
  ExprPtr message;  // ASSERT only.
};

struct Import : Stmt {
  Import(Kind kind, int line) : Stmt(kind, line) {}
  std::string module;  // FROM_IMPORT only.
  // (name, alias); the alias is empty when absent.
  std::vector<std::pair<std::string, std::string>> names;
};

struct Handler {
  std::vector<std::string> kinds;  // Empty for a bare "except:".
  std::string alias;
  Block body;
  int line = 0;
};

struct Try : Stmt {
  explicit Try(int line) : Stmt(Kind::TRY, line) {}
  Block body;
  std::vector<Handler> handlers;
  Block orelse;
  Block finally;
};

// GLOBAL and DEL.
struct Names : Stmt {
  Names(Kind kind, int line) : Stmt(kind, line) {}
  std::vector<std::string> names;
  ExprList targets;  // DEL only.
};

// Stateless marker statements: BREAK, CONTINUE, PASS.
struct Simple : Stmt {
  Simple(Kind kind, int line) : Stmt(kind, line) {}
};

}  // namespace ast

// A parsed snippet.
struct Program {
  ast::Block body;
  // Set when the whole snippet is one expression.
  ast::ExprPtr expression;
};

}  // namespace script

#endif
