#include "script/value.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "script/error.hpp"
#include "script/surface.hpp"

namespace script {

Value Value::Bool(bool b) {
  Value v;
  v.type_ = Type::BOOL;
  v.int_ = b ? 1 : 0;
  return v;
}

Value Value::Int(int64_t i) {
  Value v;
  v.type_ = Type::INT;
  v.int_ = i;
  return v;
}

Value Value::Float(double d) {
  Value v;
  v.type_ = Type::FLOAT;
  v.float_ = d;
  return v;
}

Value Value::Str(std::string s) {
  return FromObject(Type::STR, std::make_shared<StrObject>(std::move(s)));
}

Value Value::List(ValueList items) {
  auto list = std::make_shared<ListObject>();
  list->items = std::move(items);
  return FromObject(Type::LIST, std::move(list));
}

Value Value::Tuple(ValueList items) {
  auto list = std::make_shared<ListObject>();
  list->items = std::move(items);
  return FromObject(Type::TUPLE, std::move(list));
}

Value Value::Dict() {
  return FromObject(Type::DICT, std::make_shared<DictObject>());
}

Value Value::FromObject(Type type, std::shared_ptr<Object> object) {
  Value v;
  v.type_ = type;
  v.object_ = std::move(object);
  return v;
}

bool Value::SameObject(const Value& other) const {
  if (type_ != other.type_) return false;
  if (object_ || other.object_) return object_ == other.object_;
  if (type_ == Type::FLOAT) return float_ == other.float_;
  return int_ == other.int_;
}

std::string Value::TypeName() const {
  switch (type_) {
    case Type::NONE:
      return "NoneType";
    case Type::BOOL:
      return "bool";
    case Type::INT:
      return "int";
    case Type::FLOAT:
      return "float";
    case Type::STR:
      return "str";
    case Type::LIST:
      return "list";
    case Type::TUPLE:
      return "tuple";
    case Type::DICT:
      return "dict";
    case Type::RANGE:
      return "range";
    case Type::FUNCTION:
      return "function";
    case Type::BUILTIN:
      return "builtin_function_or_method";
    case Type::MODULE:
      return "module";
    case Type::EXCEPTION_TYPE:
      return "type";
    case Type::EXCEPTION:
      return As<ExceptionObject>().kind;
    case Type::SURFACE:
      return "Surface";
  }
  return "object";
}

Value MakeBuiltin(std::string name, NativeFn fn, std::string help_key) {
  return Value::FromObject(
      Value::Type::BUILTIN,
      std::make_shared<BuiltinObject>(std::move(name), std::move(fn),
                                      std::move(help_key)));
}

Value* DictObject::Find(const Value& key) {
  for (auto& item : items) {
    if (Equals(item.first, key)) return &item.second;
  }
  return nullptr;
}

void DictObject::Set(const Value& key, Value value) {
  Value* existing = Find(key);
  if (existing != nullptr) {
    *existing = std::move(value);
    return;
  }
  items.emplace_back(key, std::move(value));
}

namespace {
// Moves the values held by v into pending when v is the last reference to
// its container, so that the container is destroyed empty.
void TakeChildren(Value* v, ValueList* pending) {
  if (!v->SoleOwner()) return;
  switch (v->type()) {
    case Value::Type::LIST:
    case Value::Type::TUPLE: {
      ValueList& items = v->AsList().items;
      for (Value& item : items) pending->push_back(std::move(item));
      items.clear();
      break;
    }
    case Value::Type::DICT: {
      auto& items = v->AsDict().items;
      for (auto& item : items) {
        pending->push_back(std::move(item.first));
        pending->push_back(std::move(item.second));
      }
      items.clear();
      break;
    }
    case Value::Type::EXCEPTION: {
      ValueList& args = v->As<ExceptionObject>().args;
      for (Value& arg : args) pending->push_back(std::move(arg));
      args.clear();
      break;
    }
    default:
      break;
  }
}

// Releases nested containers one level at a time, so that destroying a
// deeply nested structure does not recurse.
void Dismantle(ValueList pending) {
  while (!pending.empty()) {
    Value v = std::move(pending.back());
    pending.pop_back();
    TakeChildren(&v, &pending);
  }
}
}  // namespace

ListObject::~ListObject() { Dismantle(std::move(items)); }

DictObject::~DictObject() {
  ValueList pending;
  pending.reserve(items.size() * 2);
  for (auto& item : items) {
    pending.push_back(std::move(item.first));
    pending.push_back(std::move(item.second));
  }
  items.clear();
  Dismantle(std::move(pending));
}

ExceptionObject::~ExceptionObject() { Dismantle(std::move(args)); }

int64_t RangeObject::Size() const {
  if (step > 0 && start < stop) return (stop - start - 1) / step + 1;
  if (step < 0 && start > stop) return (start - stop - 1) / (-step) + 1;
  return 0;
}

std::string FormatFloat(double d) {
  if (std::isnan(d)) return "nan";
  if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
  char buf[64];
  for (int precision = 1; precision <= 17; precision++) {
    snprintf(buf, sizeof(buf), "%.*e", precision - 1, d);
    if (strtod(buf, nullptr) == d) break;
  }
  std::string s(buf);
  bool negative = s[0] == '-';
  if (negative) s.erase(0, 1);
  size_t e = s.find('e');
  int exponent = atoi(s.c_str() + e + 1);
  std::string digits = s.substr(0, e);
  if (digits.size() > 1) digits.erase(1, 1);  // The decimal point.
  while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

  std::string out;
  if (exponent >= -4 && exponent < 16) {
    if (exponent < 0) {
      out = "0." + std::string(-exponent - 1, '0') + digits;
    } else if (static_cast<int>(digits.size()) <= exponent + 1) {
      out = digits + std::string(exponent + 1 - digits.size(), '0') + ".0";
    } else {
      out = digits.substr(0, exponent + 1) + "." + digits.substr(exponent + 1);
    }
  } else {
    out = digits.substr(0, 1);
    if (digits.size() > 1) out += "." + digits.substr(1);
    char exp_buf[16];
    snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+',
             std::abs(exponent));
    out += exp_buf;
  }
  return negative ? "-" + out : out;
}

namespace {
std::string QuoteString(const std::string& s) {
  char quote = '\'';
  if (s.find('\'') != std::string::npos && s.find('"') == std::string::npos) {
    quote = '"';
  }
  std::string out(1, quote);
  for (unsigned char c : s) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c == static_cast<unsigned char>(quote)) {
          out += '\\';
          out += static_cast<char>(c);
        } else if (c < 0x20 || c == 0x7f) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\x%02x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  out += quote;
  return out;
}

// Containers whose repr is being built, outermost first.
using ReprStack = std::vector<const Object*>;

std::string ReprIn(const Value& v, ReprStack* active);

std::string JoinRepr(const ValueList& items, ReprStack* active) {
  std::string out;
  for (size_t i = 0; i < items.size(); i++) {
    if (i) out += ", ";
    out += ReprIn(items[i], active);
  }
  return out;
}

// Pushes a container for the lifetime of the entry. Refuses containers
// that are already being printed.
class ReprEntry {
 public:
  ReprEntry(const Object* object, ReprStack* active) : active_(*active) {
    for (const Object* o : active_) {
      if (o == object) return;
    }
    if (active_.size() >= kMaxValueDepth) {
      throw ExecutionError(
          "RecursionError",
          "maximum recursion depth exceeded while getting the repr of an "
          "object");
    }
    active_.push_back(object);
    entered_ = true;
  }
  ~ReprEntry() {
    if (entered_) active_.pop_back();
  }
  ReprEntry(const ReprEntry&) = delete;
  ReprEntry& operator=(const ReprEntry&) = delete;

  bool Cycle() const { return !entered_; }

 private:
  ReprStack& active_;
  bool entered_ = false;
};

std::string ReprIn(const Value& v, ReprStack* active) {
  switch (v.type()) {
    case Value::Type::STR:
      return QuoteString(v.AsStr());
    case Value::Type::LIST: {
      ReprEntry entry(&v.AsList(), active);
      if (entry.Cycle()) return "[...]";
      return "[" + JoinRepr(v.AsList().items, active) + "]";
    }
    case Value::Type::TUPLE: {
      ReprEntry entry(&v.AsList(), active);
      if (entry.Cycle()) return "(...)";
      const ValueList& items = v.AsList().items;
      if (items.size() == 1) return "(" + ReprIn(items[0], active) + ",)";
      return "(" + JoinRepr(items, active) + ")";
    }
    case Value::Type::DICT: {
      ReprEntry entry(&v.AsDict(), active);
      if (entry.Cycle()) return "{...}";
      std::string out = "{";
      bool first = true;
      for (const auto& item : v.AsDict().items) {
        if (!first) out += ", ";
        first = false;
        out += ReprIn(item.first, active) + ": " + ReprIn(item.second, active);
      }
      return out + "}";
    }
    case Value::Type::EXCEPTION: {
      const ExceptionObject& e = v.As<ExceptionObject>();
      ReprEntry entry(&e, active);
      if (entry.Cycle()) return e.kind + "(...)";
      return e.kind + "(" + JoinRepr(e.args, active) + ")";
    }
    default:
      return Str(v);
  }
}
}  // namespace

std::string Repr(const Value& v) {
  ReprStack active;
  return ReprIn(v, &active);
}

std::string Str(const Value& v) {
  switch (v.type()) {
    case Value::Type::NONE:
      return "None";
    case Value::Type::BOOL:
      return v.AsBool() ? "True" : "False";
    case Value::Type::INT:
      return std::to_string(v.AsInt());
    case Value::Type::FLOAT:
      return FormatFloat(v.AsFloat());
    case Value::Type::STR:
      return v.AsStr();
    case Value::Type::RANGE: {
      const RangeObject& r = v.As<RangeObject>();
      std::string out = "range(" + std::to_string(r.start) + ", " +
                        std::to_string(r.stop);
      if (r.step != 1) out += ", " + std::to_string(r.step);
      return out + ")";
    }
    case Value::Type::FUNCTION:
      return "<function " + v.As<FunctionObject>().name + ">";
    case Value::Type::BUILTIN:
      return "<built-in function " + v.As<BuiltinObject>().name + ">";
    case Value::Type::MODULE:
      return "<module '" + v.As<ModuleObject>().name + "'>";
    case Value::Type::EXCEPTION_TYPE:
      return "<class '" + v.As<ExceptionTypeObject>().kind + "'>";
    case Value::Type::EXCEPTION: {
      const ExceptionObject& e = v.As<ExceptionObject>();
      if (e.args.empty()) return "";
      if (e.args.size() == 1) return Str(e.args[0]);
      return Repr(Value::Tuple(e.args));
    }
    case Value::Type::SURFACE: {
      const Surface& s = v.As<Surface>();
      return "<Surface(" + std::to_string(s.Width()) + "x" +
             std::to_string(s.Height()) + ")>";
    }
    default:
      return Repr(v);
  }
}

bool Truthy(const Value& v) {
  switch (v.type()) {
    case Value::Type::NONE:
      return false;
    case Value::Type::BOOL:
    case Value::Type::INT:
      return v.AsInt() != 0;
    case Value::Type::FLOAT:
      return v.AsFloat() != 0;
    case Value::Type::STR:
      return !v.AsStr().empty();
    case Value::Type::LIST:
    case Value::Type::TUPLE:
      return !v.AsList().items.empty();
    case Value::Type::DICT:
      return !v.AsDict().items.empty();
    case Value::Type::RANGE:
      return v.As<RangeObject>().Size() != 0;
    default:
      return true;
  }
}

namespace {
void EnterComparison(size_t depth) {
  if (depth >= kMaxValueDepth) {
    throw ExecutionError("RecursionError",
                         "maximum recursion depth exceeded in comparison");
  }
}

bool EqualsAt(const Value& a, const Value& b, size_t depth) {
  if (a.IsNumber() && b.IsNumber()) {
    if (a.Is(Value::Type::FLOAT) || b.Is(Value::Type::FLOAT)) {
      return a.AsFloat() == b.AsFloat();
    }
    return a.AsInt() == b.AsInt();
  }
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case Value::Type::NONE:
      return true;
    case Value::Type::STR:
      return a.AsStr() == b.AsStr();
    case Value::Type::LIST:
    case Value::Type::TUPLE: {
      const ValueList& x = a.AsList().items;
      const ValueList& y = b.AsList().items;
      if (x.size() != y.size()) return false;
      if (a.SameObject(b)) return true;
      EnterComparison(depth);
      for (size_t i = 0; i < x.size(); i++) {
        if (!EqualsAt(x[i], y[i], depth + 1)) return false;
      }
      return true;
    }
    case Value::Type::DICT: {
      DictObject& x = a.AsDict();
      DictObject& y = b.AsDict();
      if (x.items.size() != y.items.size()) return false;
      if (a.SameObject(b)) return true;
      EnterComparison(depth);
      for (const auto& item : x.items) {
        Value* other = y.Find(item.first);
        if (other == nullptr || !EqualsAt(item.second, *other, depth + 1)) {
          return false;
        }
      }
      return true;
    }
    case Value::Type::RANGE: {
      const RangeObject& x = a.As<RangeObject>();
      const RangeObject& y = b.As<RangeObject>();
      return x.start == y.start && x.stop == y.stop && x.step == y.step;
    }
    default:
      return a.SameObject(b);
  }
}

int CompareAt(const Value& a, const Value& b, size_t depth) {
  if (a.IsNumber() && b.IsNumber()) {
    if (a.Is(Value::Type::FLOAT) || b.Is(Value::Type::FLOAT)) {
      double x = a.AsFloat();
      double y = b.AsFloat();
      return x < y ? -1 : (x > y ? 1 : 0);
    }
    return a.AsInt() < b.AsInt() ? -1 : (a.AsInt() > b.AsInt() ? 1 : 0);
  }
  if (a.Is(Value::Type::STR) && b.Is(Value::Type::STR)) {
    int c = a.AsStr().compare(b.AsStr());
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
  }
  if (a.IsSequence() && a.type() == b.type()) {
    const ValueList& x = a.AsList().items;
    const ValueList& y = b.AsList().items;
    EnterComparison(depth);
    for (size_t i = 0; i < x.size() && i < y.size(); i++) {
      if (!EqualsAt(x[i], y[i], depth + 1)) {
        return CompareAt(x[i], y[i], depth + 1);
      }
    }
    return x.size() < y.size() ? -1 : (x.size() > y.size() ? 1 : 0);
  }
  throw ExecutionError("TypeError", "'<' not supported between instances of '" +
                                        a.TypeName() + "' and '" +
                                        b.TypeName() + "'");
}

void CheckHashableAt(const Value& v, size_t depth) {
  switch (v.type()) {
    case Value::Type::LIST:
    case Value::Type::DICT:
    case Value::Type::SURFACE:
      throw ExecutionError("TypeError",
                           "unhashable type: '" + v.TypeName() + "'");
    case Value::Type::TUPLE:
      EnterComparison(depth);
      for (const Value& item : v.AsList().items) {
        CheckHashableAt(item, depth + 1);
      }
      return;
    default:
      return;
  }
}

}  // namespace

bool Equals(const Value& a, const Value& b) { return EqualsAt(a, b, 0); }

int Compare(const Value& a, const Value& b) { return CompareAt(a, b, 0); }

void CheckHashable(const Value& v) { CheckHashableAt(v, 0); }

}  // namespace script
