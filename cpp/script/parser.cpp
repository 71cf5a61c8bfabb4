#include "script/parser.hpp"

#include <initializer_list>
#include <set>
#include <utility>

#include "script/error.hpp"
#include "script/lexer.hpp"

namespace script {

namespace {

using ast::Expr;
using ast::ExprList;
using ast::ExprPtr;
using ast::Stmt;
using ast::StmtPtr;

const std::set<std::string>& Keywords() {
  static const std::set<std::string> keywords = {
      "False",  "None",   "True",     "and",    "as",     "assert",
      "async",  "await",  "break",    "class",  "continue", "def",
      "del",    "elif",   "else",     "except", "finally", "for",
      "from",   "global", "if",       "import", "in",     "is",
      "lambda", "nonlocal", "not",    "or",     "pass",   "raise",
      "return", "try",    "while",    "with",   "yield"};
  return keywords;
}

ExecutionError SyntaxError(const std::string& message, int line) {
  return ExecutionError("SyntaxError",
                        message + " (line " + std::to_string(line) + ")");
}

class Parser {
 public:
  Parser(std::vector<Token> tokens, int depth)
      : tokens_(std::move(tokens)), depth_(depth) {}

  ast::Block ParseFile() {
    ast::Block body;
    while (!At(TokenType::END)) {
      if (Accept(TokenType::NEWLINE)) continue;
      ParseStatement(&body);
    }
    return body;
  }

  // Parses the tokens of an f-string replacement field.
  ExprPtr ParseFieldExpression() {
    while (Accept(TokenType::NEWLINE)) {
    }
    ExprPtr expr = ParseTestList();
    while (Accept(TokenType::NEWLINE)) {
    }
    if (!At(TokenType::END)) throw Error("invalid f-string expression");
    return expr;
  }

 private:
  // RAII nesting counter.
  class Nested {
   public:
    explicit Nested(Parser* parser) : parser_(parser) {
      if (++parser_->depth_ > kMaxNestingDepth) {
        throw parser_->Error("too many nested expressions or blocks");
      }
    }
    ~Nested() { parser_->depth_--; }

   private:
    Parser* parser_;
  };

  const Token& Current() const { return tokens_[pos_]; }
  int Line() const { return Current().line; }

  bool At(TokenType type) const { return Current().type == type; }
  bool AtOp(const char* op) const {
    return At(TokenType::OP) && Current().text == op;
  }
  bool AtKeyword(const char* word) const {
    return At(TokenType::NAME) && Current().text == word;
  }

  bool Accept(TokenType type) {
    if (!At(type)) return false;
    pos_++;
    return true;
  }
  bool AcceptOp(const char* op) {
    if (!AtOp(op)) return false;
    pos_++;
    return true;
  }
  bool AcceptKeyword(const char* word) {
    if (!AtKeyword(word)) return false;
    pos_++;
    return true;
  }

  void ExpectOp(const char* op) {
    if (!AcceptOp(op)) throw Error("expected '" + std::string(op) + "'");
  }
  void ExpectKeyword(const char* word) {
    if (!AcceptKeyword(word)) {
      throw Error("expected '" + std::string(word) + "'");
    }
  }
  std::string ExpectName() {
    if (!At(TokenType::NAME) || Keywords().count(Current().text)) {
      throw Error("expected a name");
    }
    return tokens_[pos_++].text;
  }

  ExecutionError Error(const std::string& message) const {
    return SyntaxError(message, Line());
  }

  // Statements.

  void ParseStatement(ast::Block* out) {
    Nested nested(this);
    if (At(TokenType::INDENT)) throw Error("unexpected indent");
    if (AtKeyword("if")) {
      out->push_back(ParseIf());
    } else if (AtKeyword("while")) {
      out->push_back(ParseWhile());
    } else if (AtKeyword("for")) {
      out->push_back(ParseFor());
    } else if (AtKeyword("def")) {
      out->push_back(ParseDef());
    } else if (AtKeyword("try")) {
      out->push_back(ParseTry());
    } else {
      ParseSimpleStatements(out);
    }
  }

  void ParseSimpleStatements(ast::Block* out) {
    out->push_back(ParseSmallStatement());
    while (AcceptOp(";")) {
      if (At(TokenType::NEWLINE)) break;
      out->push_back(ParseSmallStatement());
    }
    if (!Accept(TokenType::NEWLINE)) throw Error("invalid syntax");
  }

  ast::Block ParseBlock() {
    ExpectOp(":");
    ast::Block body;
    if (!Accept(TokenType::NEWLINE)) {
      ParseSimpleStatements(&body);
      return body;
    }
    if (!Accept(TokenType::INDENT)) throw Error("expected an indented block");
    while (!Accept(TokenType::DEDENT)) {
      if (At(TokenType::END)) throw Error("unexpected end of input");
      ParseStatement(&body);
    }
    return body;
  }

  StmtPtr ParseIf() {
    auto stmt = std::make_unique<ast::Branch>(Stmt::Kind::IF, Line());
    pos_++;  // "if" or "elif"
    stmt->test = ParseTest();
    stmt->body = ParseBlock();
    if (AtKeyword("elif")) {
      stmt->orelse.push_back(ParseIf());
    } else if (AcceptKeyword("else")) {
      stmt->orelse = ParseBlock();
    }
    return std::move(stmt);
  }

  StmtPtr ParseWhile() {
    auto stmt = std::make_unique<ast::Branch>(Stmt::Kind::WHILE, Line());
    ExpectKeyword("while");
    stmt->test = ParseTest();
    loops_++;
    stmt->body = ParseBlock();
    loops_--;
    if (AcceptKeyword("else")) stmt->orelse = ParseBlock();
    return std::move(stmt);
  }

  StmtPtr ParseFor() {
    auto stmt = std::make_unique<ast::For>(Line());
    ExpectKeyword("for");
    stmt->target = ParseTargetList();
    ExpectKeyword("in");
    stmt->iter = ParseTestList();
    loops_++;
    stmt->body = ParseBlock();
    loops_--;
    if (AcceptKeyword("else")) stmt->orelse = ParseBlock();
    return std::move(stmt);
  }

  StmtPtr ParseDef() {
    auto stmt = std::make_unique<ast::Def>(Line());
    ExpectKeyword("def");
    stmt->name = ExpectName();
    ExpectOp("(");
    while (!AcceptOp(")")) {
      ParseParameter(&stmt->params, /*annotations=*/true);
      if (!AtOp(")")) ExpectOp(",");
    }
    if (AcceptOp("->")) ParseTest();
    // Loops around a definition do not extend into its body.
    int loops = loops_;
    bool in_function = in_function_;
    loops_ = 0;
    in_function_ = true;
    stmt->body = ParseBlock();
    loops_ = loops;
    in_function_ = in_function;
    return std::move(stmt);
  }

  void ParseParameter(ast::Parameters* params, bool annotations) {
    if (AtOp("*") || AtOp("**")) {
      throw Error("variadic parameters are not supported");
    }
    std::string name = ExpectName();
    for (const std::string& existing : params->names) {
      if (existing == name) throw Error("duplicate argument '" + name + "'");
    }
    params->names.push_back(name);
    if (annotations && AcceptOp(":")) ParseTest();
    if (AcceptOp("=")) {
      params->defaults.push_back(ParseTest());
    } else if (!params->defaults.empty()) {
      throw Error("non-default argument follows default argument");
    }
  }

  StmtPtr ParseTry() {
    auto stmt = std::make_unique<ast::Try>(Line());
    ExpectKeyword("try");
    stmt->body = ParseBlock();
    while (AtKeyword("except")) {
      ast::Handler handler;
      handler.line = Line();
      pos_++;
      if (!AtOp(":")) {
        if (AcceptOp("(")) {
          do {
            if (AtOp(")")) break;
            handler.kinds.push_back(ExpectName());
          } while (AcceptOp(","));
          ExpectOp(")");
        } else {
          handler.kinds.push_back(ExpectName());
        }
        if (AcceptKeyword("as")) handler.alias = ExpectName();
      }
      handler.body = ParseBlock();
      stmt->handlers.push_back(std::move(handler));
    }
    if (!stmt->handlers.empty() && AcceptKeyword("else")) {
      stmt->orelse = ParseBlock();
    }
    if (AcceptKeyword("finally")) stmt->finally = ParseBlock();
    if (stmt->handlers.empty() && stmt->finally.empty()) {
      throw Error("expected 'except' or 'finally' block");
    }
    return std::move(stmt);
  }

  StmtPtr ParseSmallStatement() {
    int line = Line();
    if (AcceptKeyword("pass")) {
      return std::make_unique<ast::Simple>(Stmt::Kind::PASS, line);
    }
    if (AcceptKeyword("break")) {
      if (loops_ == 0) throw Error("'break' outside loop");
      return std::make_unique<ast::Simple>(Stmt::Kind::BREAK, line);
    }
    if (AcceptKeyword("continue")) {
      if (loops_ == 0) throw Error("'continue' not properly in loop");
      return std::make_unique<ast::Simple>(Stmt::Kind::CONTINUE, line);
    }
    if (AcceptKeyword("return")) {
      if (!in_function_) throw Error("'return' outside function");
      auto stmt = std::make_unique<ast::Valued>(Stmt::Kind::RETURN, line);
      if (!AtStatementEnd()) stmt->value = ParseTestList();
      return std::move(stmt);
    }
    if (AcceptKeyword("raise")) {
      auto stmt = std::make_unique<ast::Valued>(Stmt::Kind::RAISE, line);
      if (!AtStatementEnd()) stmt->value = ParseTest();
      if (AcceptKeyword("from")) ParseTest();
      return std::move(stmt);
    }
    if (AcceptKeyword("assert")) {
      auto stmt = std::make_unique<ast::Valued>(Stmt::Kind::ASSERT, line);
      stmt->value = ParseTest();
      if (AcceptOp(",")) stmt->message = ParseTest();
      return std::move(stmt);
    }
    if (AcceptKeyword("global")) {
      auto stmt = std::make_unique<ast::Names>(Stmt::Kind::GLOBAL, line);
      do {
        stmt->names.push_back(ExpectName());
      } while (AcceptOp(","));
      return std::move(stmt);
    }
    if (AcceptKeyword("del")) {
      auto stmt = std::make_unique<ast::Names>(Stmt::Kind::DEL, line);
      do {
        ExprPtr target = ParseBitOr();
        CheckTarget(*target);
        stmt->targets.push_back(std::move(target));
      } while (AcceptOp(","));
      return std::move(stmt);
    }
    if (AcceptKeyword("import")) {
      auto stmt = std::make_unique<ast::Import>(Stmt::Kind::IMPORT, line);
      do {
        std::string module = ParseDottedName();
        std::string alias;
        if (AcceptKeyword("as")) alias = ExpectName();
        stmt->names.emplace_back(module, alias);
      } while (AcceptOp(","));
      return std::move(stmt);
    }
    if (AcceptKeyword("from")) {
      auto stmt = std::make_unique<ast::Import>(Stmt::Kind::FROM_IMPORT, line);
      stmt->module = ParseDottedName();
      ExpectKeyword("import");
      if (AcceptOp("*")) {
        stmt->names.emplace_back("*", "");
        return std::move(stmt);
      }
      bool parens = AcceptOp("(");
      do {
        if (parens && AtOp(")")) break;
        std::string name = ExpectName();
        std::string alias;
        if (AcceptKeyword("as")) alias = ExpectName();
        stmt->names.emplace_back(name, alias);
      } while (AcceptOp(","));
      if (parens) ExpectOp(")");
      return std::move(stmt);
    }
    for (const char* word : {"class", "with", "yield", "nonlocal", "async",
                             "await"}) {
      if (AtKeyword(word)) {
        throw Error("'" + std::string(word) + "' is not supported");
      }
    }
    return ParseExpressionStatement();
  }

  bool AtStatementEnd() const {
    return At(TokenType::NEWLINE) || AtOp(";") || At(TokenType::END);
  }

  std::string ParseDottedName() {
    std::string name = ExpectName();
    while (AcceptOp(".")) name += "." + ExpectName();
    return name;
  }

  StmtPtr ParseExpressionStatement() {
    int line = Line();
    ExprPtr first = ParseTestList();
    static const std::pair<const char*, ast::BinOp> aug_ops[] = {
        {"+=", ast::BinOp::ADD},        {"-=", ast::BinOp::SUB},
        {"*=", ast::BinOp::MUL},        {"/=", ast::BinOp::DIV},
        {"//=", ast::BinOp::FLOOR_DIV}, {"%=", ast::BinOp::MOD},
        {"**=", ast::BinOp::POW},       {"<<=", ast::BinOp::LSHIFT},
        {">>=", ast::BinOp::RSHIFT},    {"&=", ast::BinOp::BIT_AND},
        {"|=", ast::BinOp::BIT_OR},     {"^=", ast::BinOp::BIT_XOR}};
    for (const auto& op : aug_ops) {
      if (AcceptOp(op.first)) {
        if (first->kind != Expr::Kind::NAME &&
            first->kind != Expr::Kind::ATTRIBUTE &&
            first->kind != Expr::Kind::SUBSCRIPT) {
          throw Error("illegal expression for augmented assignment");
        }
        return std::make_unique<ast::AugAssign>(std::move(first), op.second,
                                                ParseTestList(), line);
      }
    }
    if (AtOp(":")) {
      // Annotated assignment; the annotation is ignored.
      pos_++;
      ParseTest();
      if (!AtOp("=")) {
        return std::make_unique<ast::Simple>(Stmt::Kind::PASS, line);
      }
    }
    if (!AtOp("=")) {
      return std::make_unique<ast::ExprStmt>(std::move(first), line);
    }
    auto stmt = std::make_unique<ast::Assign>(line);
    CheckTarget(*first);
    stmt->targets.push_back(std::move(first));
    while (AcceptOp("=")) {
      ExprPtr next = ParseTestList();
      if (AtOp("=")) {
        CheckTarget(*next);
        stmt->targets.push_back(std::move(next));
      } else {
        stmt->value = std::move(next);
      }
    }
    return std::move(stmt);
  }

  void CheckTarget(const Expr& target) {
    switch (target.kind) {
      case Expr::Kind::NAME:
        if (Keywords().count(static_cast<const ast::Name&>(target).id)) {
          throw Error("cannot assign to keyword");
        }
        return;
      case Expr::Kind::ATTRIBUTE:
      case Expr::Kind::SUBSCRIPT:
        return;
      case Expr::Kind::LIST:
      case Expr::Kind::TUPLE:
        for (const ExprPtr& item :
             static_cast<const ast::Sequence&>(target).items) {
          CheckTarget(*item);
        }
        return;
      default:
        throw Error("cannot assign to expression");
    }
  }

  // Expressions.

  // Targets of "for" loops and comprehensions stop before "in".
  ExprPtr ParseTargetList() {
    int line = Line();
    ExprPtr first = ParseBitOr();
    if (!AtOp(",")) {
      CheckTarget(*first);
      return first;
    }
    auto tuple = std::make_unique<ast::Sequence>(Expr::Kind::TUPLE, line);
    tuple->items.push_back(std::move(first));
    while (AcceptOp(",")) {
      if (AtKeyword("in")) break;
      tuple->items.push_back(ParseBitOr());
    }
    CheckTarget(*tuple);
    return std::move(tuple);
  }

  // test (',' test)* [','], a tuple when a comma is present.
  ExprPtr ParseTestList() {
    int line = Line();
    ExprPtr first = ParseTest();
    if (!AtOp(",")) return first;
    auto tuple = std::make_unique<ast::Sequence>(Expr::Kind::TUPLE, line);
    tuple->items.push_back(std::move(first));
    while (AcceptOp(",")) {
      if (AtTestListEnd()) break;
      tuple->items.push_back(ParseTest());
    }
    return std::move(tuple);
  }

  bool AtTestListEnd() const {
    return AtStatementEnd() || AtOp("=") || AtOp(")") || AtOp("]") ||
           AtOp("}") || AtOp(":") || At(TokenType::DEDENT);
  }

  ExprPtr ParseTest() {
    Nested nested(this);
    if (AtKeyword("lambda")) return ParseLambda();
    int line = Line();
    ExprPtr value = ParseOrTest();
    if (!AcceptKeyword("if")) return value;
    auto cond = std::make_unique<ast::Conditional>(line);
    cond->body = std::move(value);
    cond->test = ParseOrTest();
    ExpectKeyword("else");
    cond->orelse = ParseTest();
    return std::move(cond);
  }

  ExprPtr ParseLambda() {
    auto lambda = std::make_unique<ast::Lambda>(Line());
    ExpectKeyword("lambda");
    while (!AtOp(":")) {
      ParseParameter(&lambda->params, /*annotations=*/false);
      if (!AtOp(":")) ExpectOp(",");
    }
    ExpectOp(":");
    lambda->body = ParseTest();
    return std::move(lambda);
  }

  ExprPtr ParseOrTest() {
    ExprPtr left = ParseAndTest();
    while (AtKeyword("or")) {
      int line = Line();
      pos_++;
      left = std::make_unique<ast::Logical>(Expr::Kind::OR, std::move(left),
                                            ParseAndTest(), line);
    }
    return left;
  }

  ExprPtr ParseAndTest() {
    ExprPtr left = ParseNotTest();
    while (AtKeyword("and")) {
      int line = Line();
      pos_++;
      left = std::make_unique<ast::Logical>(Expr::Kind::AND, std::move(left),
                                            ParseNotTest(), line);
    }
    return left;
  }

  ExprPtr ParseNotTest() {
    int line = Line();
    if (AcceptKeyword("not")) {
      Nested nested(this);
      return std::make_unique<ast::Unary>(ast::UnaryOp::NOT, ParseNotTest(),
                                          line);
    }
    return ParseComparison();
  }

  bool AcceptComparison(ast::CmpOp* op) {
    static const std::pair<const char*, ast::CmpOp> ops[] = {
        {"==", ast::CmpOp::EQ}, {"!=", ast::CmpOp::NE},
        {"<", ast::CmpOp::LT},  {"<=", ast::CmpOp::LE},
        {">", ast::CmpOp::GT},  {">=", ast::CmpOp::GE}};
    for (const auto& candidate : ops) {
      if (AcceptOp(candidate.first)) {
        *op = candidate.second;
        return true;
      }
    }
    if (AcceptKeyword("in")) {
      *op = ast::CmpOp::IN;
      return true;
    }
    if (AtKeyword("not") && tokens_[pos_ + 1].type == TokenType::NAME &&
        tokens_[pos_ + 1].text == "in") {
      pos_ += 2;
      *op = ast::CmpOp::NOT_IN;
      return true;
    }
    if (AcceptKeyword("is")) {
      *op = AcceptKeyword("not") ? ast::CmpOp::IS_NOT : ast::CmpOp::IS;
      return true;
    }
    return false;
  }

  ExprPtr ParseComparison() {
    int line = Line();
    ExprPtr first = ParseBitOr();
    ast::CmpOp op;
    if (!AcceptComparison(&op)) return first;
    auto compare = std::make_unique<ast::Compare>(line);
    compare->first = std::move(first);
    do {
      compare->ops.push_back(op);
      compare->rest.push_back(ParseBitOr());
    } while (AcceptComparison(&op));
    return std::move(compare);
  }

  using Level = ExprPtr (Parser::*)();

  // One left-associative binary precedence level.
  ExprPtr ParseBinaryLevel(
      std::initializer_list<std::pair<const char*, ast::BinOp>> ops,
      Level next) {
    ExprPtr left = (this->*next)();
    while (true) {
      bool matched = false;
      for (const auto& op : ops) {
        if (!AtOp(op.first)) continue;
        int line = Line();
        pos_++;
        left = std::make_unique<ast::Binary>(op.second, std::move(left),
                                             (this->*next)(), line);
        matched = true;
        break;
      }
      if (!matched) return left;
    }
  }

  ExprPtr ParseBitOr() {
    return ParseBinaryLevel({{"|", ast::BinOp::BIT_OR}}, &Parser::ParseBitXor);
  }
  ExprPtr ParseBitXor() {
    return ParseBinaryLevel({{"^", ast::BinOp::BIT_XOR}},
                            &Parser::ParseBitAnd);
  }
  ExprPtr ParseBitAnd() {
    return ParseBinaryLevel({{"&", ast::BinOp::BIT_AND}}, &Parser::ParseShift);
  }
  ExprPtr ParseShift() {
    return ParseBinaryLevel(
        {{"<<", ast::BinOp::LSHIFT}, {">>", ast::BinOp::RSHIFT}},
        &Parser::ParseArith);
  }
  ExprPtr ParseArith() {
    return ParseBinaryLevel({{"+", ast::BinOp::ADD}, {"-", ast::BinOp::SUB}},
                            &Parser::ParseTerm);
  }
  ExprPtr ParseTerm() {
    return ParseBinaryLevel(
        {{"*", ast::BinOp::MUL},
         {"/", ast::BinOp::DIV},
         {"//", ast::BinOp::FLOOR_DIV},
         {"%", ast::BinOp::MOD}},
        &Parser::ParseFactor);
  }

  ExprPtr ParseFactor() {
    int line = Line();
    ast::UnaryOp op;
    if (AtOp("-")) {
      op = ast::UnaryOp::NEG;
    } else if (AtOp("+")) {
      op = ast::UnaryOp::POS;
    } else if (AtOp("~")) {
      op = ast::UnaryOp::INVERT;
    } else {
      return ParsePower();
    }
    pos_++;
    Nested nested(this);
    ExprPtr operand = ParseFactor();
    return std::make_unique<ast::Unary>(op, std::move(operand), line);
  }

  ExprPtr ParsePower() {
    int line = Line();
    ExprPtr base = ParsePrimary();
    if (!AcceptOp("**")) return base;
    Nested nested(this);
    return std::make_unique<ast::Binary>(ast::BinOp::POW, std::move(base),
                                         ParseFactor(), line);
  }

  ExprPtr ParsePrimary() {
    ExprPtr expr = ParseAtom();
    while (true) {
      int line = Line();
      if (AcceptOp("(")) {
        Nested nested(this);
        expr = ParseCall(std::move(expr), line);
      } else if (AcceptOp("[")) {
        Nested nested(this);
        ExprPtr index = ParseSubscriptIndex();
        ExpectOp("]");
        expr = std::make_unique<ast::Subscript>(std::move(expr),
                                                std::move(index), line);
      } else if (AcceptOp(".")) {
        expr = std::make_unique<ast::Attribute>(std::move(expr), ExpectName(),
                                                line);
      } else {
        return expr;
      }
    }
  }

  ExprPtr ParseCall(ExprPtr func, int line) {
    auto call = std::make_unique<ast::Call>(line);
    call->func = std::move(func);
    while (!AcceptOp(")")) {
      if (AtOp("*") || AtOp("**")) {
        throw Error("argument unpacking is not supported");
      }
      if (At(TokenType::NAME) && tokens_[pos_ + 1].type == TokenType::OP &&
          tokens_[pos_ + 1].text == "=") {
        std::string name = ExpectName();
        pos_++;
        for (const auto& kw : call->kwargs) {
          if (kw.first == name) throw Error("keyword argument repeated");
        }
        call->kwargs.emplace_back(name, ParseTest());
      } else {
        if (!call->kwargs.empty()) {
          throw Error("positional argument follows keyword argument");
        }
        int arg_line = Line();
        ExprPtr arg = ParseTest();
        if (AtKeyword("for")) {
          // A bare generator expression, materialized as a list.
          arg = ParseComprehension(Expr::Kind::LIST_COMP, std::move(arg),
                                   nullptr, arg_line);
        }
        call->args.push_back(std::move(arg));
      }
      if (!AtOp(")")) ExpectOp(",");
    }
    return std::move(call);
  }

  ExprPtr ParseSubscriptIndex() {
    int line = Line();
    ExprPtr first = ParseSliceOrTest();
    if (!AtOp(",")) return first;
    auto tuple = std::make_unique<ast::Sequence>(Expr::Kind::TUPLE, line);
    tuple->items.push_back(std::move(first));
    while (AcceptOp(",")) {
      if (AtOp("]")) break;
      tuple->items.push_back(ParseSliceOrTest());
    }
    return std::move(tuple);
  }

  ExprPtr ParseSliceOrTest() {
    int line = Line();
    ExprPtr lower;
    if (!AtOp(":")) {
      lower = ParseTest();
      if (!AtOp(":")) return lower;
    }
    auto slice = std::make_unique<ast::Slice>(line);
    slice->lower = std::move(lower);
    ExpectOp(":");
    if (!AtOp(":") && !AtOp("]") && !AtOp(",")) slice->upper = ParseTest();
    if (AcceptOp(":")) {
      if (!AtOp("]") && !AtOp(",")) slice->step = ParseTest();
    }
    return std::move(slice);
  }

  ExprPtr ParseComprehension(Expr::Kind kind, ExprPtr element, ExprPtr value,
                             int line) {
    auto comp = std::make_unique<ast::Comprehension>(kind, line);
    comp->element = std::move(element);
    comp->value = std::move(value);
    while (AcceptKeyword("for")) {
      ast::ComprehensionClause clause;
      clause.target = ParseTargetList();
      ExpectKeyword("in");
      clause.iter = ParseOrTest();
      while (AcceptKeyword("if")) clause.conditions.push_back(ParseOrTest());
      comp->clauses.push_back(std::move(clause));
    }
    return std::move(comp);
  }

  ExprPtr ParseAtom() {
    int line = Line();
    const Token& token = Current();
    switch (token.type) {
      case TokenType::INT:
        pos_++;
        return std::make_unique<ast::Constant>(Value::Int(token.int_value),
                                               line);
      case TokenType::FLOAT:
        pos_++;
        return std::make_unique<ast::Constant>(
            Value::Float(token.float_value), line);
      case TokenType::STRING:
      case TokenType::FSTRING:
        return ParseStrings();
      case TokenType::NAME:
        break;
      case TokenType::OP:
        if (token.text == "(") return ParseParenthesized();
        if (token.text == "[") return ParseListDisplay();
        if (token.text == "{") return ParseDictDisplay();
        throw Error("invalid syntax");
      default:
        throw Error("invalid syntax");
    }
    if (AcceptKeyword("None")) {
      return std::make_unique<ast::Constant>(Value::None(), line);
    }
    if (AcceptKeyword("True")) {
      return std::make_unique<ast::Constant>(Value::Bool(true), line);
    }
    if (AcceptKeyword("False")) {
      return std::make_unique<ast::Constant>(Value::Bool(false), line);
    }
    return std::make_unique<ast::Name>(ExpectName(), line);
  }

  ExprPtr ParseParenthesized() {
    int line = Line();
    ExpectOp("(");
    Nested nested(this);
    if (AcceptOp(")")) {
      return std::make_unique<ast::Sequence>(Expr::Kind::TUPLE, line);
    }
    ExprPtr first = ParseTest();
    if (AtKeyword("for")) {
      ExprPtr comp = ParseComprehension(Expr::Kind::LIST_COMP,
                                        std::move(first), nullptr, line);
      ExpectOp(")");
      return comp;
    }
    if (AcceptOp(")")) return first;
    auto tuple = std::make_unique<ast::Sequence>(Expr::Kind::TUPLE, line);
    tuple->items.push_back(std::move(first));
    while (AcceptOp(",")) {
      if (AtOp(")")) break;
      tuple->items.push_back(ParseTest());
    }
    ExpectOp(")");
    return std::move(tuple);
  }

  ExprPtr ParseListDisplay() {
    int line = Line();
    ExpectOp("[");
    Nested nested(this);
    auto list = std::make_unique<ast::Sequence>(Expr::Kind::LIST, line);
    if (AcceptOp("]")) return std::move(list);
    ExprPtr first = ParseTest();
    if (AtKeyword("for")) {
      ExprPtr comp = ParseComprehension(Expr::Kind::LIST_COMP,
                                        std::move(first), nullptr, line);
      ExpectOp("]");
      return comp;
    }
    list->items.push_back(std::move(first));
    while (AcceptOp(",")) {
      if (AtOp("]")) break;
      list->items.push_back(ParseTest());
    }
    ExpectOp("]");
    return std::move(list);
  }

  ExprPtr ParseDictDisplay() {
    int line = Line();
    ExpectOp("{");
    Nested nested(this);
    auto dict = std::make_unique<ast::Dict>(line);
    if (AcceptOp("}")) return std::move(dict);
    ExprPtr key = ParseTest();
    if (!AtOp(":")) throw Error("set displays are not supported");
    ExpectOp(":");
    ExprPtr value = ParseTest();
    if (AtKeyword("for")) {
      ExprPtr comp = ParseComprehension(Expr::Kind::DICT_COMP, std::move(key),
                                        std::move(value), line);
      ExpectOp("}");
      return comp;
    }
    dict->keys.push_back(std::move(key));
    dict->values.push_back(std::move(value));
    while (AcceptOp(",")) {
      if (AtOp("}")) break;
      dict->keys.push_back(ParseTest());
      ExpectOp(":");
      dict->values.push_back(ParseTest());
    }
    ExpectOp("}");
    return std::move(dict);
  }

  // Adjacent string literals are concatenated; any f-string among them makes
  // the result an f-string.
  ExprPtr ParseStrings() {
    int line = Line();
    auto fstring = std::make_unique<ast::FString>(line);
    bool formatted = false;
    while (At(TokenType::STRING) || At(TokenType::FSTRING)) {
      const Token& token = tokens_[pos_++];
      if (token.type == TokenType::STRING) {
        ast::FString::Part part;
        part.literal = token.text;
        fstring->parts.push_back(std::move(part));
      } else {
        formatted = true;
        ParseFStringBody(token.text, token.line, &fstring->parts);
      }
    }
    if (formatted) return std::move(fstring);
    std::string text;
    for (const auto& part : fstring->parts) text += part.literal;
    return std::make_unique<ast::Constant>(Value::Str(std::move(text)), line);
  }

  void ParseFStringBody(const std::string& body, int line,
                        std::vector<ast::FString::Part>* parts) {
    std::string literal;
    auto flush = [&]() {
      if (literal.empty()) return;
      ast::FString::Part part;
      part.literal = DecodeEscapes(literal, line);
      parts->push_back(std::move(part));
      literal.clear();
    };
    size_t i = 0;
    while (i < body.size()) {
      char c = body[i];
      if (c == '{' && i + 1 < body.size() && body[i + 1] == '{') {
        literal += '{';
        i += 2;
        continue;
      }
      if (c == '}') {
        if (i + 1 < body.size() && body[i + 1] == '}') {
          literal += '}';
          i += 2;
          continue;
        }
        throw SyntaxError("f-string: single '}' is not allowed", line);
      }
      if (c != '{') {
        literal += c;
        i++;
        continue;
      }
      flush();
      // Find the end of the replacement field, the conversion and the spec.
      size_t start = ++i;
      int nesting = 0;
      char quote = 0;
      size_t expr_end = std::string::npos;
      size_t conversion_pos = std::string::npos;
      for (; i < body.size(); i++) {
        char d = body[i];
        if (quote) {
          if (d == quote) quote = 0;
          continue;
        }
        if (d == '\'' || d == '"') {
          quote = d;
        } else if (d == '(' || d == '[' || d == '{') {
          nesting++;
        } else if ((d == ')' || d == ']' || d == '}') && nesting > 0) {
          nesting--;
        } else if (nesting == 0 && d == '!' && i + 1 < body.size() &&
                   body[i + 1] != '=' && conversion_pos == std::string::npos) {
          conversion_pos = i;
        } else if (nesting == 0 && (d == ':' || d == '}')) {
          expr_end = i;
          break;
        }
      }
      if (expr_end == std::string::npos) {
        throw SyntaxError("f-string: expecting '}'", line);
      }
      ast::FString::Part part;
      size_t expr_stop = expr_end;
      if (conversion_pos != std::string::npos) {
        expr_stop = conversion_pos;
        std::string conv = body.substr(conversion_pos + 1,
                                       expr_end - conversion_pos - 1);
        if (conv != "r" && conv != "s" && conv != "a") {
          throw SyntaxError("f-string: invalid conversion character", line);
        }
        part.conversion = conv == "s" ? 's' : 'r';
      }
      std::string source = body.substr(start, expr_stop - start);
      if (source.find_first_not_of(" \t\n") == std::string::npos) {
        throw SyntaxError("f-string: empty expression not allowed", line);
      }
      std::vector<Token> tokens = Tokenize("(" + source + ")");
      for (Token& token : tokens) token.line = line;
      part.value = Parser(std::move(tokens), depth_).ParseFieldExpression();
      i = expr_end;
      if (body[i] == ':') {
        size_t spec_end = body.find('}', i);
        if (spec_end == std::string::npos) {
          throw SyntaxError("f-string: expecting '}'", line);
        }
        part.spec = body.substr(i + 1, spec_end - i - 1);
        i = spec_end;
      }
      i++;  // '}'
      parts->push_back(std::move(part));
    }
    flush();
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  int depth_;
  int loops_ = 0;
  bool in_function_ = false;
};

}  // namespace

Program Parse(const std::string& source) {
  Program program;
  program.body = Parser(Tokenize(source), 0).ParseFile();
  if (program.body.size() == 1 &&
      program.body[0]->kind == Stmt::Kind::EXPR) {
    program.expression =
        std::move(static_cast<ast::ExprStmt&>(*program.body[0]).value);
    program.body.clear();
  }
  return program;
}

}  // namespace script
