#ifndef SCRIPT_INTERPRETER_HPP
#define SCRIPT_INTERPRETER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "script/ast.hpp"
#include "script/error.hpp"
#include "script/value.hpp"

namespace script {

class OutputChannel;

// Variables of the module or of a function call.
struct Scope {
  std::map<std::string, Value> vars;
  // Scope the function was defined in. Null for the module scope.
  std::shared_ptr<Scope> parent;
};

// Tree-walking evaluator. Every name a snippet can reach is either defined
// by the snippet itself or comes from the allow-listed builtins and modules.
class Interpreter {
 public:
  static const constexpr int kMaxCallDepth = 200;

  Interpreter(OutputChannel* output, uint64_t seed);
  ~Interpreter();
  Interpreter(const Interpreter&) = delete;
  Interpreter& operator=(const Interpreter&) = delete;

  // Runs the program and returns its trailing value: the value of the
  // expression for single-expression programs, or of a final expression
  // statement. None if there is no trailing value.
  Value Run(const Program& program);

  Value Call(const Value& callee, ValueList& args, Kwargs& kwargs);
  Value Call(const Value& callee, ValueList args);

  // Calls fn on each element of iterable, until fn returns false.
  void ForEach(const Value& iterable,
               const std::function<bool(const Value&)>& fn);
  ValueList Materialize(const Value& iterable);

  Value GetAttribute(const Value& object, const std::string& name);

  OutputChannel& Output() { return *output_; }
  std::mt19937_64& Random() { return random_; }

 private:
  enum class Flow { NORMAL, BREAK, CONTINUE, RETURN };

  struct Frame {
    std::shared_ptr<Scope> scope;
    std::set<std::string> global_names;
    Value return_value;
  };

  class FrameSwap;

  Flow Exec(const ast::Block& block);
  Flow Exec(const ast::Stmt& stmt);
  Flow ExecFor(const ast::For& stmt);
  Flow ExecWhile(const ast::Branch& stmt);
  Flow ExecTry(const ast::Try& stmt);
  Flow ExecHandlers(const ast::Try& stmt);
  void ExecImport(const ast::Import& stmt);
  void ExecDelete(const ast::Expr& target);
  void ExecRaise(const ast::Valued& stmt);
  bool HandlerMatches(const ast::Handler& handler, const ExecutionError& e);

  Value Eval(const ast::Expr& expr);
  Value EvalCall(const ast::Call& call);
  Value EvalCompare(const ast::Compare& compare);
  Value EvalSubscript(const ast::Subscript& subscript);
  Value EvalFString(const ast::FString& fstring);
  Value EvalComprehension(const ast::Comprehension& comp);
  void RunClauses(const ast::Comprehension& comp, size_t index,
                  const Value& result);
  Value MakeFunction(const std::string& name, const ast::Parameters& params,
                     const ast::Block* body, const ast::Expr* expression);
  Value CallFunction(const FunctionObject& fn, ValueList& args,
                     Kwargs& kwargs);

  void Assign(const ast::Expr& target, const Value& value);
  void AugAssign(const ast::AugAssign& stmt);

  Value Lookup(const std::string& name);
  void Store(const std::string& name, const Value& value);
  Value ImportModule(const std::string& name);

  OutputChannel* output_;
  std::mt19937_64 random_;
  std::shared_ptr<Scope> globals_;
  std::map<std::string, Value> builtins_;
  std::map<std::string, Value> modules_;
  Frame* frame_ = nullptr;
  int call_depth_ = 0;
  // Exceptions being handled, innermost last, for a bare "raise".
  std::vector<ExecutionError> handling_;
  // Call scopes captured by closures. Functions and the scopes they close
  // over reference each other, so the destructor breaks the cycles.
  std::vector<std::weak_ptr<Scope>> closures_;
};

}  // namespace script

#endif
