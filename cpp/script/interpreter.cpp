#include "script/interpreter.hpp"

#include <algorithm>

#include "script/builtins.hpp"
#include "script/capabilities.hpp"
#include "script/methods.hpp"
#include "script/native.hpp"
#include "script/ops.hpp"
#include "script/output.hpp"

namespace script {

using ast::Expr;
using ast::Stmt;

namespace {

// Number of recorded closure scopes above which expired ones are pruned.
const size_t kClosurePruneThreshold = 1024;

bool IsAscii(const std::string& s) {
  for (unsigned char c : s) {
    if (c >= 0x80) return false;
  }
  return true;
}

Value ExceptionValue(const ExecutionError& e) {
  auto exception = std::make_shared<ExceptionObject>();
  exception->kind = e.Kind();
  exception->args = e.ArgValues();
  return Value::FromObject(Value::Type::EXCEPTION, std::move(exception));
}

}  // namespace

class Interpreter::FrameSwap {
 public:
  FrameSwap(Interpreter* interp, Frame* frame)
      : interp_(interp), saved_(interp->frame_) {
    interp_->frame_ = frame;
  }
  ~FrameSwap() { interp_->frame_ = saved_; }

 private:
  Interpreter* interp_;
  Frame* saved_;
};

Interpreter::Interpreter(OutputChannel* output, uint64_t seed)
    : output_(output),
      random_(seed),
      globals_(std::make_shared<Scope>()),
      builtins_(MakeBuiltins()) {}

Interpreter::~Interpreter() {
  for (const auto& weak : closures_) {
    std::shared_ptr<Scope> scope = weak.lock();
    if (scope) scope->vars.clear();
  }
  globals_->vars.clear();
}

Value Interpreter::Run(const Program& program) {
  Frame frame;
  frame.scope = globals_;
  FrameSwap swap(this, &frame);
  if (program.expression) return Eval(*program.expression);
  const ast::Block& body = program.body;
  for (size_t i = 0; i < body.size(); i++) {
    const Stmt& stmt = *body[i];
    if (i + 1 == body.size() && stmt.kind == Stmt::Kind::EXPR) {
      return Eval(*static_cast<const ast::ExprStmt&>(stmt).value);
    }
    Exec(stmt);
  }
  return Value::None();
}

/*
 * Statements
 */

Interpreter::Flow Interpreter::Exec(const ast::Block& block) {
  for (const ast::StmtPtr& stmt : block) {
    Flow flow = Exec(*stmt);
    if (flow != Flow::NORMAL) return flow;
  }
  return Flow::NORMAL;
}

Interpreter::Flow Interpreter::Exec(const Stmt& stmt) {
  switch (stmt.kind) {
    case Stmt::Kind::EXPR:
      Eval(*static_cast<const ast::ExprStmt&>(stmt).value);
      return Flow::NORMAL;
    case Stmt::Kind::ASSIGN: {
      const auto& assign = static_cast<const ast::Assign&>(stmt);
      Value value = Eval(*assign.value);
      for (const ast::ExprPtr& target : assign.targets) Assign(*target, value);
      return Flow::NORMAL;
    }
    case Stmt::Kind::AUG_ASSIGN:
      AugAssign(static_cast<const ast::AugAssign&>(stmt));
      return Flow::NORMAL;
    case Stmt::Kind::IF: {
      const auto& branch = static_cast<const ast::Branch&>(stmt);
      return Exec(Truthy(Eval(*branch.test)) ? branch.body : branch.orelse);
    }
    case Stmt::Kind::WHILE:
      return ExecWhile(static_cast<const ast::Branch&>(stmt));
    case Stmt::Kind::FOR:
      return ExecFor(static_cast<const ast::For&>(stmt));
    case Stmt::Kind::BREAK:
      return Flow::BREAK;
    case Stmt::Kind::CONTINUE:
      return Flow::CONTINUE;
    case Stmt::Kind::PASS:
      return Flow::NORMAL;
    case Stmt::Kind::DEF: {
      const auto& def = static_cast<const ast::Def&>(stmt);
      Store(def.name, MakeFunction(def.name, def.params, &def.body, nullptr));
      return Flow::NORMAL;
    }
    case Stmt::Kind::RETURN: {
      const auto& ret = static_cast<const ast::Valued&>(stmt);
      frame_->return_value = ret.value ? Eval(*ret.value) : Value::None();
      return Flow::RETURN;
    }
    case Stmt::Kind::IMPORT:
    case Stmt::Kind::FROM_IMPORT:
      ExecImport(static_cast<const ast::Import&>(stmt));
      return Flow::NORMAL;
    case Stmt::Kind::TRY:
      return ExecTry(static_cast<const ast::Try&>(stmt));
    case Stmt::Kind::RAISE:
      ExecRaise(static_cast<const ast::Valued&>(stmt));
      return Flow::NORMAL;
    case Stmt::Kind::GLOBAL:
      if (frame_->scope != globals_) {
        for (const std::string& name :
             static_cast<const ast::Names&>(stmt).names) {
          frame_->global_names.insert(name);
        }
      }
      return Flow::NORMAL;
    case Stmt::Kind::DEL:
      for (const ast::ExprPtr& target :
           static_cast<const ast::Names&>(stmt).targets) {
        ExecDelete(*target);
      }
      return Flow::NORMAL;
    case Stmt::Kind::ASSERT: {
      const auto& check = static_cast<const ast::Valued&>(stmt);
      if (Truthy(Eval(*check.value))) return Flow::NORMAL;
      ValueList args;
      if (check.message) args.push_back(Eval(*check.message));
      throw ExecutionError("AssertionError", std::move(args));
    }
  }
  return Flow::NORMAL;
}

Interpreter::Flow Interpreter::ExecWhile(const ast::Branch& stmt) {
  while (Truthy(Eval(*stmt.test))) {
    Flow flow = Exec(stmt.body);
    if (flow == Flow::BREAK) return Flow::NORMAL;
    if (flow == Flow::RETURN) return flow;
  }
  return Exec(stmt.orelse);
}

Interpreter::Flow Interpreter::ExecFor(const ast::For& stmt) {
  Value iterable = Eval(*stmt.iter);
  Flow result = Flow::NORMAL;
  ForEach(iterable, [&](const Value& item) {
    Assign(*stmt.target, item);
    Flow flow = Exec(stmt.body);
    if (flow == Flow::BREAK || flow == Flow::RETURN) {
      result = flow;
      return false;
    }
    return true;
  });
  if (result == Flow::RETURN) return result;
  if (result == Flow::BREAK) return Flow::NORMAL;
  return Exec(stmt.orelse);
}

Interpreter::Flow Interpreter::ExecTry(const ast::Try& stmt) {
  Flow flow = Flow::NORMAL;
  try {
    flow = ExecHandlers(stmt);
  } catch (const CapabilityError&) {
    throw;
  } catch (const ExecutionError&) {
    // A break or return in the finally block discards the error.
    Flow finally = Exec(stmt.finally);
    if (finally != Flow::NORMAL) return finally;
    throw;
  }
  Flow finally = Exec(stmt.finally);
  return finally != Flow::NORMAL ? finally : flow;
}

Interpreter::Flow Interpreter::ExecHandlers(const ast::Try& stmt) {
  try {
    Flow flow = Exec(stmt.body);
    if (flow != Flow::NORMAL) return flow;
  } catch (const CapabilityError&) {
    throw;
  } catch (const ExecutionError& e) {
    for (const ast::Handler& handler : stmt.handlers) {
      if (!HandlerMatches(handler, e)) continue;
      struct Handled {
        std::vector<ExecutionError>& handling;
        ~Handled() { handling.pop_back(); }
      };
      handling_.push_back(e);
      Handled handled{handling_};
      if (!handler.alias.empty()) Store(handler.alias, ExceptionValue(e));
      return Exec(handler.body);
    }
    throw;
  }
  return Exec(stmt.orelse);
}

bool Interpreter::HandlerMatches(const ast::Handler& handler,
                                 const ExecutionError& e) {
  if (handler.kinds.empty()) return true;
  for (const std::string& kind : handler.kinds) {
    Value type = Lookup(kind);
    if (!type.Is(Value::Type::EXCEPTION_TYPE)) {
      throw ExecutionError("TypeError",
                           "catching classes that do not inherit from "
                           "BaseException is not allowed");
    }
    if (ExecutionError::Matches(e.Kind(),
                                type.As<ExceptionTypeObject>().kind)) {
      return true;
    }
  }
  return false;
}

void Interpreter::ExecRaise(const ast::Valued& stmt) {
  if (!stmt.value) {
    if (handling_.empty()) {
      throw ExecutionError("RuntimeError", "No active exception to reraise");
    }
    throw handling_.back();
  }
  Value value = Eval(*stmt.value);
  if (value.Is(Value::Type::EXCEPTION_TYPE)) {
    throw ExecutionError(value.As<ExceptionTypeObject>().kind, ValueList{});
  }
  if (value.Is(Value::Type::EXCEPTION)) {
    const ExceptionObject& exception = value.As<ExceptionObject>();
    throw ExecutionError(exception.kind, exception.args);
  }
  throw ExecutionError("TypeError",
                       "exceptions must derive from BaseException");
}

void Interpreter::ExecImport(const ast::Import& stmt) {
  if (stmt.kind == Stmt::Kind::IMPORT) {
    for (const auto& name : stmt.names) {
      Value module = ImportModule(name.first);
      Store(name.second.empty() ? name.first : name.second, module);
    }
    return;
  }
  Value module = ImportModule(stmt.module);
  const ModuleObject& m = module.As<ModuleObject>();
  for (const auto& name : stmt.names) {
    if (name.first == "*") {
      for (const auto& member : m.members) Store(member.first, member.second);
      continue;
    }
    if (name.first[0] == '_') {
      throw CapabilityError("access to '" + name.first + "' is not allowed");
    }
    auto it = m.members.find(name.first);
    if (it == m.members.end()) {
      throw ExecutionError("ImportError", "cannot import name '" +
                                              name.first + "' from '" +
                                              stmt.module + "'");
    }
    Store(name.second.empty() ? name.first : name.second, it->second);
  }
}

void Interpreter::ExecDelete(const Expr& target) {
  switch (target.kind) {
    case Expr::Kind::NAME: {
      const std::string& id = static_cast<const ast::Name&>(target).id;
      Scope& scope =
          frame_->global_names.count(id) ? *globals_ : *frame_->scope;
      if (scope.vars.erase(id) == 0) {
        throw ExecutionError("NameError",
                             "name '" + id + "' is not defined");
      }
      return;
    }
    case Expr::Kind::LIST:
    case Expr::Kind::TUPLE:
      for (const ast::ExprPtr& item :
           static_cast<const ast::Sequence&>(target).items) {
        ExecDelete(*item);
      }
      return;
    case Expr::Kind::SUBSCRIPT: {
      const auto& subscript = static_cast<const ast::Subscript&>(target);
      Value object = Eval(*subscript.object);
      if (subscript.index->kind == Expr::Kind::SLICE) {
        const auto& slice = static_cast<const ast::Slice&>(*subscript.index);
        SetSlice(object, slice.lower ? Eval(*slice.lower) : Value::None(),
                 slice.upper ? Eval(*slice.upper) : Value::None(),
                 slice.step ? Eval(*slice.step) : Value::None(), {});
        return;
      }
      DeleteItem(object, Eval(*subscript.index));
      return;
    }
    case Expr::Kind::ATTRIBUTE: {
      const auto& attribute = static_cast<const ast::Attribute&>(target);
      Value object = Eval(*attribute.object);
      GetAttribute(object, attribute.name);
      throw ExecutionError("AttributeError", "'" + object.TypeName() +
                                                 "' object attribute '" +
                                                 attribute.name +
                                                 "' is read-only");
    }
    default:
      throw ExecutionError("SyntaxError", "cannot delete expression");
  }
}

/*
 * Assignment
 */

void Interpreter::Assign(const Expr& target, const Value& value) {
  switch (target.kind) {
    case Expr::Kind::NAME:
      Store(static_cast<const ast::Name&>(target).id, value);
      return;
    case Expr::Kind::LIST:
    case Expr::Kind::TUPLE: {
      const ast::ExprList& targets =
          static_cast<const ast::Sequence&>(target).items;
      ValueList items = Materialize(value);
      if (items.size() > targets.size()) {
        throw ExecutionError("ValueError",
                             "too many values to unpack (expected " +
                                 std::to_string(targets.size()) + ")");
      }
      if (items.size() < targets.size()) {
        throw ExecutionError("ValueError",
                             "not enough values to unpack (expected " +
                                 std::to_string(targets.size()) + ", got " +
                                 std::to_string(items.size()) + ")");
      }
      for (size_t i = 0; i < items.size(); i++) Assign(*targets[i], items[i]);
      return;
    }
    case Expr::Kind::SUBSCRIPT: {
      const auto& subscript = static_cast<const ast::Subscript&>(target);
      Value object = Eval(*subscript.object);
      if (subscript.index->kind == Expr::Kind::SLICE) {
        const auto& slice = static_cast<const ast::Slice&>(*subscript.index);
        SetSlice(object, slice.lower ? Eval(*slice.lower) : Value::None(),
                 slice.upper ? Eval(*slice.upper) : Value::None(),
                 slice.step ? Eval(*slice.step) : Value::None(),
                 Materialize(value));
        return;
      }
      SetItem(object, Eval(*subscript.index), value);
      return;
    }
    case Expr::Kind::ATTRIBUTE: {
      const auto& attribute = static_cast<const ast::Attribute&>(target);
      Value object = Eval(*attribute.object);
      if (attribute.name[0] == '_') {
        throw CapabilityError("access to '" + attribute.name +
                              "' is not allowed");
      }
      throw ExecutionError("AttributeError", "'" + object.TypeName() +
                                                 "' object attribute '" +
                                                 attribute.name +
                                                 "' is read-only");
    }
    default:
      throw ExecutionError("SyntaxError", "cannot assign to expression");
  }
}

void Interpreter::AugAssign(const ast::AugAssign& stmt) {
  // list += iterable extends the list in place.
  auto combine = [this, &stmt](const Value& current, const Value& operand) {
    if (stmt.op == ast::BinOp::ADD && current.Is(Value::Type::LIST)) {
      ValueList more = Materialize(operand);
      ValueList& items = current.AsList().items;
      CheckSequenceSize(items.size() + more.size());
      items.insert(items.end(), more.begin(), more.end());
      return current;
    }
    return BinaryOp(stmt.op, current, operand);
  };
  const Expr& target = *stmt.target;
  switch (target.kind) {
    case Expr::Kind::NAME: {
      const std::string& id = static_cast<const ast::Name&>(target).id;
      Value current = Lookup(id);
      Store(id, combine(current, Eval(*stmt.value)));
      return;
    }
    case Expr::Kind::SUBSCRIPT: {
      const auto& subscript = static_cast<const ast::Subscript&>(target);
      if (subscript.index->kind == Expr::Kind::SLICE) {
        throw ExecutionError("SyntaxError",
                             "illegal expression for augmented assignment");
      }
      Value object = Eval(*subscript.object);
      Value index = Eval(*subscript.index);
      Value current = GetItem(object, index);
      SetItem(object, index, combine(current, Eval(*stmt.value)));
      return;
    }
    case Expr::Kind::ATTRIBUTE: {
      const auto& attribute = static_cast<const ast::Attribute&>(target);
      Value object = Eval(*attribute.object);
      GetAttribute(object, attribute.name);
      throw ExecutionError("AttributeError", "'" + object.TypeName() +
                                                 "' object attribute '" +
                                                 attribute.name +
                                                 "' is read-only");
    }
    default:
      throw ExecutionError("SyntaxError",
                           "illegal expression for augmented assignment");
  }
}

Value Interpreter::Lookup(const std::string& name) {
  if (frame_->global_names.count(name)) {
    auto it = globals_->vars.find(name);
    if (it != globals_->vars.end()) return it->second;
  } else {
    for (Scope* scope = frame_->scope.get(); scope != nullptr;
         scope = scope->parent.get()) {
      auto it = scope->vars.find(name);
      if (it != scope->vars.end()) return it->second;
    }
  }
  auto builtin = builtins_.find(name);
  if (builtin != builtins_.end()) return builtin->second;
  if (IsDeniedName(name)) {
    throw CapabilityError("'" + name + "' is not available in the sandbox");
  }
  throw ExecutionError("NameError", "name '" + name + "' is not defined");
}

void Interpreter::Store(const std::string& name, const Value& value) {
  if (frame_->global_names.count(name)) {
    globals_->vars[name] = value;
  } else {
    frame_->scope->vars[name] = value;
  }
}

Value Interpreter::ImportModule(const std::string& name) {
  if (!IsAllowedModule(name)) {
    throw CapabilityError("import of module '" + name + "' is not allowed");
  }
  auto it = modules_.find(name);
  if (it != modules_.end()) return it->second;
  Value module = MakeModule(name);
  if (module.IsNone()) {
    throw ExecutionError("ImportError", "No module named '" + name + "'");
  }
  modules_[name] = module;
  return module;
}

/*
 * Expressions
 */

Value Interpreter::Eval(const Expr& expr) {
  switch (expr.kind) {
    case Expr::Kind::CONSTANT:
      return static_cast<const ast::Constant&>(expr).value;
    case Expr::Kind::NAME:
      return Lookup(static_cast<const ast::Name&>(expr).id);
    case Expr::Kind::FSTRING:
      return EvalFString(static_cast<const ast::FString&>(expr));
    case Expr::Kind::LIST:
    case Expr::Kind::TUPLE: {
      ValueList items;
      for (const ast::ExprPtr& item :
           static_cast<const ast::Sequence&>(expr).items) {
        items.push_back(Eval(*item));
      }
      return expr.kind == Expr::Kind::LIST ? Value::List(std::move(items))
                                           : Value::Tuple(std::move(items));
    }
    case Expr::Kind::DICT: {
      const auto& dict = static_cast<const ast::Dict&>(expr);
      Value result = Value::Dict();
      for (size_t i = 0; i < dict.keys.size(); i++) {
        Value key = Eval(*dict.keys[i]);
        CheckHashable(key);
        result.AsDict().Set(key, Eval(*dict.values[i]));
      }
      return result;
    }
    case Expr::Kind::UNARY: {
      const auto& unary = static_cast<const ast::Unary&>(expr);
      return UnaryOp(unary.op, Eval(*unary.operand));
    }
    case Expr::Kind::BINARY: {
      const auto& binary = static_cast<const ast::Binary&>(expr);
      Value left = Eval(*binary.left);
      return BinaryOp(binary.op, left, Eval(*binary.right));
    }
    case Expr::Kind::AND: {
      const auto& logical = static_cast<const ast::Logical&>(expr);
      Value left = Eval(*logical.left);
      return Truthy(left) ? Eval(*logical.right) : left;
    }
    case Expr::Kind::OR: {
      const auto& logical = static_cast<const ast::Logical&>(expr);
      Value left = Eval(*logical.left);
      return Truthy(left) ? left : Eval(*logical.right);
    }
    case Expr::Kind::COMPARE:
      return EvalCompare(static_cast<const ast::Compare&>(expr));
    case Expr::Kind::CONDITIONAL: {
      const auto& cond = static_cast<const ast::Conditional&>(expr);
      return Truthy(Eval(*cond.test)) ? Eval(*cond.body) : Eval(*cond.orelse);
    }
    case Expr::Kind::CALL:
      return EvalCall(static_cast<const ast::Call&>(expr));
    case Expr::Kind::ATTRIBUTE: {
      const auto& attribute = static_cast<const ast::Attribute&>(expr);
      return GetAttribute(Eval(*attribute.object), attribute.name);
    }
    case Expr::Kind::SUBSCRIPT:
      return EvalSubscript(static_cast<const ast::Subscript&>(expr));
    case Expr::Kind::SLICE:
      throw ExecutionError("SyntaxError", "invalid syntax");
    case Expr::Kind::LAMBDA: {
      const auto& lambda = static_cast<const ast::Lambda&>(expr);
      return MakeFunction("<lambda>", lambda.params, nullptr,
                          lambda.body.get());
    }
    case Expr::Kind::LIST_COMP:
    case Expr::Kind::DICT_COMP:
      return EvalComprehension(static_cast<const ast::Comprehension&>(expr));
  }
  throw ExecutionError("SyntaxError", "invalid syntax");
}

Value Interpreter::EvalCompare(const ast::Compare& compare) {
  Value left = Eval(*compare.first);
  for (size_t i = 0; i < compare.ops.size(); i++) {
    Value right = Eval(*compare.rest[i]);
    if (!CompareOp(compare.ops[i], left, right)) return Value::Bool(false);
    left = std::move(right);
  }
  return Value::Bool(true);
}

Value Interpreter::EvalCall(const ast::Call& call) {
  Value callee = Eval(*call.func);
  ValueList args;
  args.reserve(call.args.size());
  for (const ast::ExprPtr& arg : call.args) args.push_back(Eval(*arg));
  Kwargs kwargs;
  for (const auto& kw : call.kwargs) {
    for (const auto& seen : kwargs) {
      if (seen.first == kw.first) {
        throw ExecutionError("SyntaxError",
                             "keyword argument repeated: " + kw.first);
      }
    }
    kwargs.emplace_back(kw.first, Eval(*kw.second));
  }
  return Call(callee, args, kwargs);
}

Value Interpreter::EvalSubscript(const ast::Subscript& subscript) {
  Value object = Eval(*subscript.object);
  if (subscript.index->kind == Expr::Kind::SLICE) {
    const auto& slice = static_cast<const ast::Slice&>(*subscript.index);
    return GetSlice(object, slice.lower ? Eval(*slice.lower) : Value::None(),
                    slice.upper ? Eval(*slice.upper) : Value::None(),
                    slice.step ? Eval(*slice.step) : Value::None());
  }
  return GetItem(object, Eval(*subscript.index));
}

Value Interpreter::EvalFString(const ast::FString& fstring) {
  std::string out;
  for (const ast::FString::Part& part : fstring.parts) {
    if (!part.value) {
      out += part.literal;
      continue;
    }
    Value value = Eval(*part.value);
    if (part.conversion == 'r') {
      value = Value::Str(Repr(value));
    } else if (part.conversion == 's') {
      value = Value::Str(Str(value));
    }
    out += part.spec.empty() ? Str(value) : FormatSpec(value, part.spec);
    CheckSequenceSize(out.size());
  }
  return Value::Str(std::move(out));
}

Value Interpreter::EvalComprehension(const ast::Comprehension& comp) {
  Value result =
      comp.kind == Expr::Kind::DICT_COMP ? Value::Dict() : Value::List();
  // Comprehension variables do not leak into the enclosing scope.
  Frame frame;
  frame.scope = std::make_shared<Scope>();
  frame.scope->parent = frame_->scope;
  FrameSwap swap(this, &frame);
  RunClauses(comp, 0, result);
  return result;
}

void Interpreter::RunClauses(const ast::Comprehension& comp, size_t index,
                             const Value& result) {
  if (index == comp.clauses.size()) {
    if (comp.kind == Expr::Kind::DICT_COMP) {
      Value key = Eval(*comp.element);
      CheckHashable(key);
      DictObject& dict = result.AsDict();
      dict.Set(key, Eval(*comp.value));
      CheckSequenceSize(dict.items.size());
    } else {
      ValueList& items = result.AsList().items;
      Value element = Eval(*comp.element);
      CheckSequenceSize(items.size() + 1);
      items.push_back(std::move(element));
    }
    return;
  }
  const ast::ComprehensionClause& clause = comp.clauses[index];
  Value iterable = Eval(*clause.iter);
  ForEach(iterable, [&](const Value& item) {
    Assign(*clause.target, item);
    for (const ast::ExprPtr& condition : clause.conditions) {
      if (!Truthy(Eval(*condition))) return true;
    }
    RunClauses(comp, index + 1, result);
    return true;
  });
}

/*
 * Calls
 */

Value Interpreter::MakeFunction(const std::string& name,
                                const ast::Parameters& params,
                                const ast::Block* body,
                                const ast::Expr* expression) {
  auto fn = std::make_shared<FunctionObject>();
  fn->name = name;
  fn->params = &params.names;
  for (const ast::ExprPtr& value : params.defaults) {
    fn->defaults.push_back(Eval(*value));
  }
  fn->body = body;
  fn->expression = expression;
  fn->closure = frame_->scope;
  if (frame_->scope != globals_) {
    if (closures_.size() >= kClosurePruneThreshold) {
      closures_.erase(
          std::remove_if(closures_.begin(), closures_.end(),
                         [](const std::weak_ptr<Scope>& scope) {
                           return scope.expired();
                         }),
          closures_.end());
    }
    closures_.push_back(frame_->scope);
  }
  return Value::FromObject(Value::Type::FUNCTION, std::move(fn));
}

Value Interpreter::Call(const Value& callee, ValueList args) {
  Kwargs kwargs;
  return Call(callee, args, kwargs);
}

Value Interpreter::Call(const Value& callee, ValueList& args,
                        Kwargs& kwargs) {
  // The callee may live in a container the call modifies.
  Value keep = callee;
  switch (keep.type()) {
    case Value::Type::BUILTIN:
      return keep.As<BuiltinObject>().fn(*this, args, kwargs);
    case Value::Type::FUNCTION:
      return CallFunction(keep.As<FunctionObject>(), args, kwargs);
    case Value::Type::EXCEPTION_TYPE: {
      const std::string& kind = keep.As<ExceptionTypeObject>().kind;
      ExpectNoKwargs(kind, kwargs);
      auto exception = std::make_shared<ExceptionObject>();
      exception->kind = kind;
      exception->args = args;
      return Value::FromObject(Value::Type::EXCEPTION, std::move(exception));
    }
    default:
      throw ExecutionError("TypeError", "'" + keep.TypeName() +
                                            "' object is not callable");
  }
}

Value Interpreter::CallFunction(const FunctionObject& fn, ValueList& args,
                                Kwargs& kwargs) {
  if (call_depth_ >= kMaxCallDepth) {
    throw ExecutionError("RecursionError",
                         "maximum recursion depth exceeded");
  }
  const std::vector<std::string>& params = *fn.params;
  if (args.size() > params.size()) {
    throw ExecutionError("TypeError",
                         fn.name + "() takes " +
                             std::to_string(params.size()) +
                             " positional argument" +
                             (params.size() == 1 ? "" : "s") + " but " +
                             std::to_string(args.size()) +
                             (args.size() == 1 ? " was" : " were") +
                             " given");
  }
  auto scope = std::make_shared<Scope>();
  scope->parent = fn.closure;
  std::vector<bool> bound(params.size(), false);
  for (size_t i = 0; i < args.size(); i++) {
    scope->vars[params[i]] = args[i];
    bound[i] = true;
  }
  for (const auto& kw : kwargs) {
    auto it = std::find(params.begin(), params.end(), kw.first);
    if (it == params.end()) {
      throw ExecutionError("TypeError", fn.name +
                                            "() got an unexpected keyword "
                                            "argument '" +
                                            kw.first + "'");
    }
    size_t i = it - params.begin();
    if (bound[i]) {
      throw ExecutionError("TypeError", fn.name +
                                            "() got multiple values for "
                                            "argument '" +
                                            kw.first + "'");
    }
    scope->vars[params[i]] = kw.second;
    bound[i] = true;
  }
  size_t first_default = params.size() - fn.defaults.size();
  std::vector<std::string> missing;
  for (size_t i = 0; i < params.size(); i++) {
    if (bound[i]) continue;
    if (i >= first_default) {
      scope->vars[params[i]] = fn.defaults[i - first_default];
    } else {
      missing.push_back("'" + params[i] + "'");
    }
  }
  if (!missing.empty()) {
    std::string names = missing[0];
    for (size_t i = 1; i < missing.size(); i++) {
      names += (i + 1 == missing.size() ? " and " : ", ") + missing[i];
    }
    throw ExecutionError("TypeError",
                         fn.name + "() missing " +
                             std::to_string(missing.size()) +
                             " required positional argument" +
                             (missing.size() == 1 ? "" : "s") + ": " + names);
  }

  struct Depth {
    int& depth;
    ~Depth() { depth--; }
  };
  call_depth_++;
  Depth depth{call_depth_};
  Frame frame;
  frame.scope = std::move(scope);
  FrameSwap swap(this, &frame);
  if (fn.expression != nullptr) return Eval(*fn.expression);
  if (Exec(*fn.body) == Flow::RETURN) return frame.return_value;
  return Value::None();
}

/*
 * Iteration and attributes
 */

void Interpreter::ForEach(const Value& iterable,
                          const std::function<bool(const Value&)>& fn) {
  Value keep = iterable;
  switch (keep.type()) {
    case Value::Type::LIST:
    case Value::Type::TUPLE: {
      // Indexed so that appending while iterating is observed.
      const ValueList& items = keep.AsList().items;
      for (size_t i = 0; i < items.size(); i++) {
        Value item = items[i];
        if (!fn(item)) return;
      }
      return;
    }
    case Value::Type::STR: {
      const std::string& s = keep.AsStr();
      if (IsAscii(s)) {
        for (char c : s) {
          if (!fn(Value::Str(std::string(1, c)))) return;
        }
        return;
      }
      for (const std::string& c : CodePoints(s)) {
        if (!fn(Value::Str(c))) return;
      }
      return;
    }
    case Value::Type::DICT: {
      ValueList keys;
      for (const auto& item : keep.AsDict().items) keys.push_back(item.first);
      for (const Value& key : keys) {
        if (!fn(key)) return;
      }
      return;
    }
    case Value::Type::RANGE: {
      const RangeObject& range = keep.As<RangeObject>();
      int64_t size = range.Size();
      for (int64_t i = 0; i < size; i++) {
        if (!fn(Value::Int(range.At(i)))) return;
      }
      return;
    }
    default:
      throw ExecutionError("TypeError", "'" + keep.TypeName() +
                                            "' object is not iterable");
  }
}

ValueList Interpreter::Materialize(const Value& iterable) {
  if (iterable.IsSequence()) return iterable.AsList().items;
  if (iterable.Is(Value::Type::RANGE)) {
    CheckSequenceSize(iterable.As<RangeObject>().Size());
  }
  ValueList items;
  ForEach(iterable, [&items](const Value& item) {
    CheckSequenceSize(items.size() + 1);
    items.push_back(item);
    return true;
  });
  return items;
}

Value Interpreter::GetAttribute(const Value& object, const std::string& name) {
  if (!name.empty() && name[0] == '_') {
    throw CapabilityError("access to '" + name + "' is not allowed");
  }
  if (object.Is(Value::Type::MODULE)) {
    const ModuleObject& module = object.As<ModuleObject>();
    auto it = module.members.find(name);
    if (it == module.members.end()) {
      throw ExecutionError("AttributeError", "module '" + module.name +
                                                 "' has no attribute '" +
                                                 name + "'");
    }
    return it->second;
  }
  if (object.Is(Value::Type::EXCEPTION) && name == "args") {
    return Value::Tuple(object.As<ExceptionObject>().args);
  }
  Value method;
  if (BindMethod(object, name, &method)) return method;
  throw ExecutionError("AttributeError", "'" + object.TypeName() +
                                             "' object has no attribute '" +
                                             name + "'");
}

}  // namespace script
