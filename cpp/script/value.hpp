#ifndef SCRIPT_VALUE_HPP
#define SCRIPT_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace script {

namespace ast {
struct Expr;
struct Stmt;
}  // namespace ast

class Interpreter;
class Value;
struct Scope;

struct StrObject;
struct ListObject;

// Deepest container nesting that repr, comparisons and hashing walk through
// before raising RecursionError.
static const constexpr size_t kMaxValueDepth = 1000;
struct DictObject;

// Base class for heap-allocated values. Values share objects by reference,
// exactly like names in the snippet language do.
struct Object {
  virtual ~Object() = default;
};

class Value {
 public:
  enum class Type {
    NONE,
    BOOL,
    INT,
    FLOAT,
    STR,
    LIST,
    TUPLE,
    DICT,
    RANGE,
    FUNCTION,
    BUILTIN,
    MODULE,
    EXCEPTION_TYPE,
    EXCEPTION,
    SURFACE
  };

  Value() = default;

  static Value None() { return Value(); }
  static Value Bool(bool b);
  static Value Int(int64_t i);
  static Value Float(double d);
  static Value Str(std::string s);
  static Value List(std::vector<Value> items = {});
  static Value Tuple(std::vector<Value> items = {});
  static Value Dict();
  static Value FromObject(Type type, std::shared_ptr<Object> object);

  Type type() const { return type_; }
  bool Is(Type t) const { return type_ == t; }
  bool IsNone() const { return type_ == Type::NONE; }
  bool IsNumber() const {
    return type_ == Type::BOOL || type_ == Type::INT || type_ == Type::FLOAT;
  }
  bool IsSequence() const {
    return type_ == Type::LIST || type_ == Type::TUPLE;
  }

  bool AsBool() const { return int_ != 0; }
  int64_t AsInt() const { return int_; }
  double AsFloat() const {
    return type_ == Type::FLOAT ? float_ : static_cast<double>(int_);
  }
  const std::string& AsStr() const;
  ListObject& AsList() const;
  DictObject& AsDict() const;

  template <typename T>
  T& As() const {
    return static_cast<T&>(*object_);
  }
  template <typename T>
  std::shared_ptr<T> Share() const {
    return std::static_pointer_cast<T>(object_);
  }

  // Identity, used by the "is" operator.
  bool SameObject(const Value& other) const;

  // True if no other value refers to the same object.
  bool SoleOwner() const { return object_ && object_.use_count() == 1; }

  // Name of the type as the snippet sees it ("int", "list", ...).
  std::string TypeName() const;

 private:
  Type type_ = Type::NONE;
  int64_t int_ = 0;
  double float_ = 0;
  std::shared_ptr<Object> object_;
};

using ValueList = std::vector<Value>;
using Kwargs = std::vector<std::pair<std::string, Value>>;

// Signature of every native callable exposed to snippets.
using NativeFn = std::function<Value(Interpreter&, ValueList&, Kwargs&)>;

struct StrObject : Object {
  explicit StrObject(std::string v) : value(std::move(v)) {}
  std::string value;
};

// Backs both lists and tuples.
struct ListObject : Object {
  ~ListObject() override;
  ValueList items;
};

struct DictObject : Object {
  ~DictObject() override;
  // Insertion ordered. Lookups are linear, snippets are small.
  std::vector<std::pair<Value, Value>> items;
  Value* Find(const Value& key);
  void Set(const Value& key, Value value);
};

struct RangeObject : Object {
  RangeObject(int64_t start, int64_t stop, int64_t step)
      : start(start), stop(stop), step(step) {}
  int64_t Size() const;
  int64_t At(int64_t i) const { return start + i * step; }
  int64_t start;
  int64_t stop;
  int64_t step;
};

struct FunctionObject : Object {
  std::string name;
  const std::vector<std::string>* params = nullptr;
  ValueList defaults;  // Aligned to the last parameters.
  const std::vector<std::unique_ptr<ast::Stmt>>* body = nullptr;
  const ast::Expr* expression = nullptr;  // Set for lambdas.
  std::shared_ptr<Scope> closure;
};

struct BuiltinObject : Object {
  BuiltinObject(std::string name, NativeFn fn, std::string help_key)
      : name(std::move(name)),
        fn(std::move(fn)),
        help_key(std::move(help_key)) {}
  std::string name;
  NativeFn fn;
  // Entry of the capability index describing this function, e.g.
  // "math.sqrt". Empty when it is the name itself.
  std::string help_key;
};

struct ModuleObject : Object {
  ModuleObject(std::string name, std::string doc)
      : name(std::move(name)), doc(std::move(doc)) {}
  std::string name;
  std::string doc;
  std::map<std::string, Value> members;
};

// The callable that creates an exception, e.g. ValueError.
struct ExceptionTypeObject : Object {
  explicit ExceptionTypeObject(std::string kind) : kind(std::move(kind)) {}
  std::string kind;
};

struct ExceptionObject : Object {
  ~ExceptionObject() override;
  std::string kind;
  ValueList args;
};

inline const std::string& Value::AsStr() const {
  return static_cast<StrObject&>(*object_).value;
}
inline ListObject& Value::AsList() const {
  return static_cast<ListObject&>(*object_);
}
inline DictObject& Value::AsDict() const {
  return static_cast<DictObject&>(*object_);
}

Value MakeBuiltin(std::string name, NativeFn fn, std::string help_key = "");

// Display form, as produced by str().
std::string Str(const Value& v);

// Unambiguous form, as produced by repr().
std::string Repr(const Value& v);

bool Truthy(const Value& v);

bool Equals(const Value& a, const Value& b);

// Three-way ordering comparison. Throws TypeError for unordered operands.
int Compare(const Value& a, const Value& b);

// Throws TypeError if v cannot be used as a dict key.
void CheckHashable(const Value& v);

// Python-compatible shortest round-trip rendering of a double.
std::string FormatFloat(double d);

}  // namespace script

#endif
