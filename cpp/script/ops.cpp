#include "script/ops.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>

#include "script/error.hpp"
#include "util/misc.hpp"

namespace script {

namespace {

std::string OperandError(const char* op, const Value& a, const Value& b) {
  return std::string("unsupported operand type(s) for ") + op + ": '" +
         a.TypeName() + "' and '" + b.TypeName() + "'";
}

const char* OpSymbol(ast::BinOp op) {
  switch (op) {
    case ast::BinOp::ADD:
      return "+";
    case ast::BinOp::SUB:
      return "-";
    case ast::BinOp::MUL:
      return "*";
    case ast::BinOp::DIV:
      return "/";
    case ast::BinOp::FLOOR_DIV:
      return "//";
    case ast::BinOp::MOD:
      return "%";
    case ast::BinOp::POW:
      return "**";
    case ast::BinOp::LSHIFT:
      return "<<";
    case ast::BinOp::RSHIFT:
      return ">>";
    case ast::BinOp::BIT_AND:
      return "&";
    case ast::BinOp::BIT_OR:
      return "|";
    case ast::BinOp::BIT_XOR:
      return "^";
  }
  return "?";
}

bool IsInt(const Value& v) {
  return v.Is(Value::Type::INT) || v.Is(Value::Type::BOOL);
}

ExecutionError Overflow() {
  return ExecutionError("OverflowError", "integer overflow");
}

int64_t FloorDiv(int64_t a, int64_t b) {
  if (b == 0) {
    throw ExecutionError("ZeroDivisionError",
                         "integer division or modulo by zero");
  }
  if (a == std::numeric_limits<int64_t>::min() && b == -1) throw Overflow();
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
  return q;
}

int64_t FloorMod(int64_t a, int64_t b) {
  if (b == 0) {
    throw ExecutionError("ZeroDivisionError",
                         "integer division or modulo by zero");
  }
  if (b == -1) return 0;
  int64_t r = a % b;
  if (r != 0 && ((r < 0) != (b < 0))) r += b;
  return r;
}

double FloatMod(double a, double b) {
  if (b == 0) throw ExecutionError("ZeroDivisionError", "float modulo");
  double r = std::fmod(a, b);
  if (r != 0 && ((r < 0) != (b < 0))) r += b;
  return r;
}

int64_t IntPow(int64_t base, int64_t exp) {
  int64_t result = 1;
  while (exp > 0) {
    if (exp & 1) result = CheckedMul(result, base);
    exp >>= 1;
    if (exp > 0) base = CheckedMul(base, base);
  }
  return result;
}

Value FloatPow(double a, double b) {
  if (a == 0 && b < 0) {
    throw ExecutionError("ZeroDivisionError",
                         "0.0 cannot be raised to a negative power");
  }
  if (a < 0 && b != std::floor(b)) {
    throw ExecutionError("ValueError", "math domain error");
  }
  double r = std::pow(a, b);
  if (std::isinf(r) && std::isfinite(a) && std::isfinite(b)) {
    throw ExecutionError("OverflowError", "numerical result out of range");
  }
  return Value::Float(r);
}

Value Repeat(const Value& seq, int64_t times) {
  if (times < 0) times = 0;
  if (seq.Is(Value::Type::STR)) {
    const std::string& s = seq.AsStr();
    CheckSequenceSize(CheckedMul(static_cast<int64_t>(s.size()), times));
    std::string out;
    out.reserve(s.size() * times);
    for (int64_t i = 0; i < times; i++) out += s;
    return Value::Str(std::move(out));
  }
  const ValueList& items = seq.AsList().items;
  CheckSequenceSize(CheckedMul(static_cast<int64_t>(items.size()), times));
  ValueList out;
  out.reserve(items.size() * times);
  for (int64_t i = 0; i < times; i++) {
    out.insert(out.end(), items.begin(), items.end());
  }
  return seq.Is(Value::Type::LIST) ? Value::List(std::move(out))
                                   : Value::Tuple(std::move(out));
}

Value Arithmetic(ast::BinOp op, const Value& a, const Value& b) {
  bool ints = IsInt(a) && IsInt(b);
  switch (op) {
    case ast::BinOp::ADD:
      if (ints) return Value::Int(CheckedAdd(a.AsInt(), b.AsInt()));
      return Value::Float(a.AsFloat() + b.AsFloat());
    case ast::BinOp::SUB:
      if (ints) {
        int64_t r;
        if (__builtin_sub_overflow(a.AsInt(), b.AsInt(), &r)) throw Overflow();
        return Value::Int(r);
      }
      return Value::Float(a.AsFloat() - b.AsFloat());
    case ast::BinOp::MUL:
      if (ints) return Value::Int(CheckedMul(a.AsInt(), b.AsInt()));
      return Value::Float(a.AsFloat() * b.AsFloat());
    case ast::BinOp::DIV:
      if (b.AsFloat() == 0) {
        throw ExecutionError("ZeroDivisionError", "division by zero");
      }
      return Value::Float(a.AsFloat() / b.AsFloat());
    case ast::BinOp::FLOOR_DIV:
      if (ints) return Value::Int(FloorDiv(a.AsInt(), b.AsInt()));
      if (b.AsFloat() == 0) {
        throw ExecutionError("ZeroDivisionError",
                             "float floor division by zero");
      }
      return Value::Float(std::floor(a.AsFloat() / b.AsFloat()));
    case ast::BinOp::MOD:
      if (ints) return Value::Int(FloorMod(a.AsInt(), b.AsInt()));
      return Value::Float(FloatMod(a.AsFloat(), b.AsFloat()));
    case ast::BinOp::POW:
      if (ints && b.AsInt() >= 0) {
        return Value::Int(IntPow(a.AsInt(), b.AsInt()));
      }
      return FloatPow(a.AsFloat(), b.AsFloat());
    default:
      break;
  }
  if (!ints) {
    throw ExecutionError("TypeError", OperandError(OpSymbol(op), a, b));
  }
  int64_t x = a.AsInt();
  int64_t y = b.AsInt();
  bool bools = a.Is(Value::Type::BOOL) && b.Is(Value::Type::BOOL);
  switch (op) {
    case ast::BinOp::LSHIFT:
    case ast::BinOp::RSHIFT:
      if (y < 0) throw ExecutionError("ValueError", "negative shift count");
      if (op == ast::BinOp::RSHIFT) {
        return Value::Int(y >= 64 ? (x < 0 ? -1 : 0) : (x >> y));
      }
      if (x == 0) return Value::Int(0);
      if (y >= 63 || (x << y) >> y != x) throw Overflow();
      return Value::Int(x << y);
    case ast::BinOp::BIT_AND:
      return bools ? Value::Bool(x & y) : Value::Int(x & y);
    case ast::BinOp::BIT_OR:
      return bools ? Value::Bool(x | y) : Value::Int(x | y);
    case ast::BinOp::BIT_XOR:
      return bools ? Value::Bool(x ^ y) : Value::Int(x ^ y);
    default:
      break;
  }
  throw ExecutionError("TypeError", OperandError(OpSymbol(op), a, b));
}

// Resolves slice bounds against a sequence length, with the semantics of
// Python's slice.indices().
void SliceIndices(int64_t length, const Value& lower, const Value& upper,
                  const Value& step_value, int64_t* start, int64_t* stop,
                  int64_t* step) {
  *step = step_value.IsNone() ? 1 : ToInt(step_value, "slice indices");
  if (*step == 0) {
    throw ExecutionError("ValueError", "slice step cannot be zero");
  }
  if (*step < -std::numeric_limits<int64_t>::max()) {
    *step = -std::numeric_limits<int64_t>::max();
  }
  auto adjust = [&](const Value& v, int64_t fallback) {
    if (v.IsNone()) return fallback;
    int64_t i = ToInt(v, "slice indices");
    if (i < 0) {
      i = i < -length ? (*step < 0 ? -1 : 0) : i + length;
    } else if (i >= length) {
      i = *step < 0 ? length - 1 : length;
    }
    return i;
  };
  *start = adjust(lower, *step < 0 ? length - 1 : 0);
  *stop = adjust(upper, *step < 0 ? -1 : length);
}

int64_t SliceCount(int64_t start, int64_t stop, int64_t step) {
  if (step > 0) return start < stop ? (stop - start - 1) / step + 1 : 0;
  return start > stop ? (start - stop - 1) / (-step) + 1 : 0;
}

int64_t NormalizeIndex(int64_t index, int64_t size, const char* what) {
  if (index < 0) index += size;
  if (index < 0 || index >= size) {
    throw ExecutionError("IndexError", std::string(what) + " out of range");
  }
  return index;
}

bool IsAscii(const std::string& s) {
  for (unsigned char c : s) {
    if (c >= 0x80) return false;
  }
  return true;
}

std::string IntToBase(int64_t value, int base, bool upper) {
  const char* digits = upper ? "0123456789ABCDEF" : "0123456789abcdef";
  uint64_t magnitude = value < 0 ? -static_cast<uint64_t>(value)
                                 : static_cast<uint64_t>(value);
  std::string out;
  do {
    out += digits[magnitude % base];
    magnitude /= base;
  } while (magnitude > 0);
  std::reverse(out.begin(), out.end());
  return out;
}

std::string Group(const std::string& digits) {
  std::string out;
  int count = 0;
  for (size_t i = digits.size(); i > 0; i--) {
    if (count && count % 3 == 0) out += ',';
    out += digits[i - 1];
    count++;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

struct ParsedSpec {
  std::string fill = " ";
  char align = 0;
  char sign = '-';
  bool alternate = false;
  bool zero = false;
  int64_t width = 0;
  bool grouping = false;
  int precision = -1;
  char type = 0;
};

ParsedSpec ParseSpec(const std::string& spec) {
  ParsedSpec parsed;
  size_t i = 0;
  auto is_align = [](char c) {
    return c == '<' || c == '>' || c == '^' || c == '=';
  };
  if (spec.size() >= 2 && is_align(spec[1])) {
    parsed.fill = spec.substr(0, 1);
    parsed.align = spec[1];
    i = 2;
  } else if (!spec.empty() && is_align(spec[0])) {
    parsed.align = spec[0];
    i = 1;
  }
  if (i < spec.size() && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) {
    parsed.sign = spec[i++];
  }
  if (i < spec.size() && spec[i] == '#') {
    parsed.alternate = true;
    i++;
  }
  if (i < spec.size() && spec[i] == '0') {
    parsed.zero = true;
    i++;
  }
  while (i < spec.size() && isdigit(static_cast<unsigned char>(spec[i]))) {
    parsed.width = parsed.width * 10 + (spec[i++] - '0');
    if (parsed.width > kMaxSequenceSize) {
      throw ExecutionError("ValueError", "too many decimal digits in format");
    }
  }
  if (i < spec.size() && (spec[i] == ',' || spec[i] == '_')) {
    parsed.grouping = true;
    i++;
  }
  if (i < spec.size() && spec[i] == '.') {
    i++;
    if (i >= spec.size() || !isdigit(static_cast<unsigned char>(spec[i]))) {
      throw ExecutionError("ValueError", "Format specifier missing precision");
    }
    parsed.precision = 0;
    while (i < spec.size() && isdigit(static_cast<unsigned char>(spec[i]))) {
      parsed.precision = parsed.precision * 10 + (spec[i++] - '0');
      if (parsed.precision > 1000) {
        throw ExecutionError("ValueError", "precision too big");
      }
    }
  }
  if (i < spec.size()) parsed.type = spec[i++];
  if (i != spec.size()) {
    throw ExecutionError("ValueError", "Invalid format specifier");
  }
  return parsed;
}

ExecutionError UnknownFormat(char type, const Value& v) {
  return ExecutionError("ValueError", std::string("Unknown format code '") +
                                          type + "' for object of type '" +
                                          v.TypeName() + "'");
}

std::string Pad(const std::string& sign, const std::string& body,
                const ParsedSpec& spec, char default_align) {
  char align = spec.align ? spec.align : default_align;
  std::string fill = spec.fill;
  if (spec.zero && !spec.align) {
    fill = "0";
    align = '=';
  }
  int64_t length = CodePointCount(sign) + CodePointCount(body);
  if (length >= spec.width) return sign + body;
  int64_t padding = spec.width - length;
  auto repeat = [&](int64_t n) {
    std::string out;
    for (int64_t i = 0; i < n; i++) out += fill;
    return out;
  };
  switch (align) {
    case '<':
      return sign + body + repeat(padding);
    case '^':
      return repeat(padding / 2) + sign + body + repeat(padding - padding / 2);
    case '=':
      return sign + repeat(padding) + body;
    default:
      return repeat(padding) + sign + body;
  }
}

}  // namespace

void CheckSequenceSize(int64_t size) {
  if (size > kMaxSequenceSize) {
    throw ExecutionError("MemoryError", ValueList{});
  }
}

int64_t CheckedAdd(int64_t a, int64_t b) {
  int64_t r;
  if (__builtin_add_overflow(a, b, &r)) throw Overflow();
  return r;
}

int64_t CheckedMul(int64_t a, int64_t b) {
  int64_t r;
  if (__builtin_mul_overflow(a, b, &r)) throw Overflow();
  return r;
}

int64_t ToInt(const Value& v, const char* what) {
  if (!IsInt(v)) {
    throw ExecutionError("TypeError", std::string(what) +
                                          " must be integers, not '" +
                                          v.TypeName() + "'");
  }
  return v.AsInt();
}

double ToFloat(const Value& v, const char* what) {
  if (!v.IsNumber()) {
    throw ExecutionError("TypeError", std::string(what) +
                                          " must be a real number, not '" +
                                          v.TypeName() + "'");
  }
  return v.AsFloat();
}

Value BinaryOp(ast::BinOp op, const Value& a, const Value& b) {
  if (a.IsNumber() && b.IsNumber()) return Arithmetic(op, a, b);
  using Type = Value::Type;
  if (op == ast::BinOp::ADD && a.type() == b.type()) {
    if (a.Is(Type::STR)) {
      CheckSequenceSize(a.AsStr().size() + b.AsStr().size());
      return Value::Str(a.AsStr() + b.AsStr());
    }
    if (a.IsSequence()) {
      const ValueList& x = a.AsList().items;
      const ValueList& y = b.AsList().items;
      CheckSequenceSize(x.size() + y.size());
      ValueList out;
      out.reserve(x.size() + y.size());
      out.insert(out.end(), x.begin(), x.end());
      out.insert(out.end(), y.begin(), y.end());
      return a.Is(Type::LIST) ? Value::List(std::move(out))
                              : Value::Tuple(std::move(out));
    }
  }
  if (op == ast::BinOp::MUL) {
    if ((a.Is(Type::STR) || a.IsSequence()) && IsInt(b)) {
      return Repeat(a, b.AsInt());
    }
    if (IsInt(a) && (b.Is(Type::STR) || b.IsSequence())) {
      return Repeat(b, a.AsInt());
    }
  }
  if (op == ast::BinOp::MOD && a.Is(Type::STR)) {
    return Value::Str(FormatPercent(a.AsStr(), b));
  }
  throw ExecutionError("TypeError", OperandError(OpSymbol(op), a, b));
}

Value UnaryOp(ast::UnaryOp op, const Value& v) {
  if (op == ast::UnaryOp::NOT) return Value::Bool(!Truthy(v));
  if (!v.IsNumber() || (op == ast::UnaryOp::INVERT && !IsInt(v))) {
    const char* symbol = op == ast::UnaryOp::NEG
                             ? "-"
                             : (op == ast::UnaryOp::POS ? "+" : "~");
    throw ExecutionError("TypeError",
                         std::string("bad operand type for unary ") + symbol +
                             ": '" + v.TypeName() + "'");
  }
  switch (op) {
    case ast::UnaryOp::NEG:
      if (v.Is(Value::Type::FLOAT)) return Value::Float(-v.AsFloat());
      if (v.AsInt() == std::numeric_limits<int64_t>::min()) throw Overflow();
      return Value::Int(-v.AsInt());
    case ast::UnaryOp::POS:
      if (v.Is(Value::Type::FLOAT)) return v;
      return Value::Int(v.AsInt());
    default:
      return Value::Int(~v.AsInt());
  }
}

bool CompareOp(ast::CmpOp op, const Value& a, const Value& b) {
  switch (op) {
    case ast::CmpOp::EQ:
      return Equals(a, b);
    case ast::CmpOp::NE:
      return !Equals(a, b);
    case ast::CmpOp::LT:
      return Compare(a, b) < 0;
    case ast::CmpOp::LE:
      return Compare(a, b) <= 0;
    case ast::CmpOp::GT:
      return Compare(a, b) > 0;
    case ast::CmpOp::GE:
      return Compare(a, b) >= 0;
    case ast::CmpOp::IN:
      return Contains(b, a);
    case ast::CmpOp::NOT_IN:
      return !Contains(b, a);
    case ast::CmpOp::IS:
      return a.SameObject(b);
    case ast::CmpOp::IS_NOT:
      return !a.SameObject(b);
  }
  return false;
}

bool Contains(const Value& container, const Value& item) {
  switch (container.type()) {
    case Value::Type::STR:
      if (!item.Is(Value::Type::STR)) {
        throw ExecutionError("TypeError",
                             "'in <string>' requires string as left operand, "
                             "not " +
                                 item.TypeName());
      }
      return container.AsStr().find(item.AsStr()) != std::string::npos;
    case Value::Type::LIST:
    case Value::Type::TUPLE:
      for (const Value& v : container.AsList().items) {
        if (Equals(v, item)) return true;
      }
      return false;
    case Value::Type::DICT:
      CheckHashable(item);
      return container.AsDict().Find(item) != nullptr;
    case Value::Type::RANGE: {
      if (!IsInt(item)) return false;
      const RangeObject& r = container.As<RangeObject>();
      int64_t i = item.AsInt();
      if (r.step > 0 && (i < r.start || i >= r.stop)) return false;
      if (r.step < 0 && (i > r.start || i <= r.stop)) return false;
      return (i - r.start) % r.step == 0;
    }
    default:
      throw ExecutionError("TypeError", "argument of type '" +
                                            container.TypeName() +
                                            "' is not iterable");
  }
}

int64_t Length(const Value& v) {
  switch (v.type()) {
    case Value::Type::STR:
      return CodePointCount(v.AsStr());
    case Value::Type::LIST:
    case Value::Type::TUPLE:
      return v.AsList().items.size();
    case Value::Type::DICT:
      return v.AsDict().items.size();
    case Value::Type::RANGE:
      return v.As<RangeObject>().Size();
    default:
      throw ExecutionError("TypeError", "object of type '" + v.TypeName() +
                                            "' has no len()");
  }
}

Value GetItem(const Value& object, const Value& index) {
  switch (object.type()) {
    case Value::Type::LIST:
    case Value::Type::TUPLE: {
      const ValueList& items = object.AsList().items;
      if (!IsInt(index)) {
        throw ExecutionError("TypeError", object.TypeName() +
                                              " indices must be integers or "
                                              "slices, not " +
                                              index.TypeName());
      }
      std::string what = object.TypeName() + " index";
      return items[NormalizeIndex(index.AsInt(), items.size(), what.c_str())];
    }
    case Value::Type::STR: {
      if (!IsInt(index)) {
        throw ExecutionError("TypeError", "string indices must be integers");
      }
      const std::string& s = object.AsStr();
      if (IsAscii(s)) {
        return Value::Str(std::string(
            1, s[NormalizeIndex(index.AsInt(), s.size(), "string index")]));
      }
      std::vector<std::string> chars = CodePoints(s);
      return Value::Str(
          chars[NormalizeIndex(index.AsInt(), chars.size(), "string index")]);
    }
    case Value::Type::DICT: {
      CheckHashable(index);
      Value* found = object.AsDict().Find(index);
      if (found == nullptr) throw ExecutionError("KeyError", ValueList{index});
      return *found;
    }
    case Value::Type::RANGE: {
      const RangeObject& r = object.As<RangeObject>();
      if (!IsInt(index)) {
        throw ExecutionError("TypeError", "range indices must be integers");
      }
      return Value::Int(
          r.At(NormalizeIndex(index.AsInt(), r.Size(), "range object index")));
    }
    default:
      throw ExecutionError("TypeError", "'" + object.TypeName() +
                                            "' object is not subscriptable");
  }
}

void SetItem(const Value& object, const Value& index, const Value& value) {
  if (object.Is(Value::Type::LIST)) {
    ValueList& items = object.AsList().items;
    if (!IsInt(index)) {
      throw ExecutionError("TypeError", "list indices must be integers or "
                                        "slices, not " +
                                            index.TypeName());
    }
    items[NormalizeIndex(index.AsInt(), items.size(),
                         "list assignment index")] = value;
    return;
  }
  if (object.Is(Value::Type::DICT)) {
    CheckHashable(index);
    CheckSequenceSize(object.AsDict().items.size() + 1);
    object.AsDict().Set(index, value);
    return;
  }
  throw ExecutionError("TypeError", "'" + object.TypeName() +
                                        "' object does not support item "
                                        "assignment");
}

void DeleteItem(const Value& object, const Value& index) {
  if (object.Is(Value::Type::LIST)) {
    ValueList& items = object.AsList().items;
    int64_t i = NormalizeIndex(ToInt(index, "list indices"), items.size(),
                               "list assignment index");
    items.erase(items.begin() + i);
    return;
  }
  if (object.Is(Value::Type::DICT)) {
    CheckHashable(index);
    auto& items = object.AsDict().items;
    for (auto it = items.begin(); it != items.end(); ++it) {
      if (Equals(it->first, index)) {
        items.erase(it);
        return;
      }
    }
    throw ExecutionError("KeyError", ValueList{index});
  }
  throw ExecutionError("TypeError", "'" + object.TypeName() +
                                        "' object does not support item "
                                        "deletion");
}

Value GetSlice(const Value& object, const Value& lower, const Value& upper,
               const Value& step_value) {
  int64_t start, stop, step;
  switch (object.type()) {
    case Value::Type::LIST:
    case Value::Type::TUPLE: {
      const ValueList& items = object.AsList().items;
      SliceIndices(items.size(), lower, upper, step_value, &start, &stop,
                   &step);
      ValueList out;
      int64_t count = SliceCount(start, stop, step);
      out.reserve(count);
      for (int64_t i = 0; i < count; i++) {
        out.push_back(items[start + i * step]);
      }
      return object.Is(Value::Type::LIST) ? Value::List(std::move(out))
                                          : Value::Tuple(std::move(out));
    }
    case Value::Type::STR: {
      const std::string& s = object.AsStr();
      std::string out;
      if (IsAscii(s)) {
        SliceIndices(s.size(), lower, upper, step_value, &start, &stop, &step);
        int64_t count = SliceCount(start, stop, step);
        for (int64_t i = 0; i < count; i++) out += s[start + i * step];
      } else {
        std::vector<std::string> chars = CodePoints(s);
        SliceIndices(chars.size(), lower, upper, step_value, &start, &stop,
                     &step);
        int64_t count = SliceCount(start, stop, step);
        for (int64_t i = 0; i < count; i++) out += chars[start + i * step];
      }
      return Value::Str(std::move(out));
    }
    case Value::Type::RANGE: {
      const RangeObject& r = object.As<RangeObject>();
      SliceIndices(r.Size(), lower, upper, step_value, &start, &stop, &step);
      int64_t count = SliceCount(start, stop, step);
      int64_t new_step = CheckedMul(r.step, step);
      int64_t first = r.At(start);
      return Value::FromObject(
          Value::Type::RANGE,
          std::make_shared<RangeObject>(first, first + count * new_step,
                                        new_step));
    }
    default:
      throw ExecutionError("TypeError", "'" + object.TypeName() +
                                            "' object is not subscriptable");
  }
}

void SetSlice(const Value& object, const Value& lower, const Value& upper,
              const Value& step_value, ValueList values) {
  if (!object.Is(Value::Type::LIST)) {
    throw ExecutionError("TypeError", "'" + object.TypeName() +
                                          "' object does not support slice "
                                          "assignment");
  }
  ValueList& items = object.AsList().items;
  int64_t start, stop, step;
  SliceIndices(items.size(), lower, upper, step_value, &start, &stop, &step);
  if (step == 1) {
    if (stop < start) stop = start;
    CheckSequenceSize(items.size() - (stop - start) + values.size());
    items.erase(items.begin() + start, items.begin() + stop);
    items.insert(items.begin() + start, values.begin(), values.end());
    return;
  }
  int64_t count = SliceCount(start, stop, step);
  if (count != static_cast<int64_t>(values.size())) {
    throw ExecutionError("ValueError",
                         "attempt to assign sequence of size " +
                             std::to_string(values.size()) +
                             " to extended slice of size " +
                             std::to_string(count));
  }
  for (int64_t i = 0; i < count; i++) items[start + i * step] = values[i];
}

std::vector<std::string> CodePoints(const std::string& s) {
  std::vector<std::string> out;
  for (size_t i = 0; i < s.size(); i++) {
    unsigned char c = s[i];
    if ((c & 0xC0) == 0x80 && !out.empty()) {
      out.back() += s[i];
    } else {
      out.emplace_back(1, s[i]);
    }
  }
  return out;
}

int64_t CodePointCount(const std::string& s) {
  int64_t count = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) count++;
  }
  return count;
}

std::string FormatSpec(const Value& v, const std::string& spec) {
  ParsedSpec parsed = ParseSpec(spec);
  bool as_text = !v.IsNumber() ||
                 (v.Is(Value::Type::BOOL) && parsed.type == 0);
  if (as_text) {
    if (parsed.type != 0 && parsed.type != 's') {
      throw UnknownFormat(parsed.type, v);
    }
    std::string body = Str(v);
    if (parsed.precision >= 0 && CodePointCount(body) > parsed.precision) {
      std::vector<std::string> chars = CodePoints(body);
      body.clear();
      for (int i = 0; i < parsed.precision; i++) body += chars[i];
    }
    return Pad("", body, parsed, '<');
  }

  bool negative = v.AsFloat() < 0 || std::signbit(v.AsFloat());
  std::string body;
  char type = parsed.type;
  if (type == 0) {
    type = v.Is(Value::Type::FLOAT) ? (parsed.precision >= 0 ? 'g' : 0) : 'd';
  }
  switch (type) {
    case 'd':
    case 'n':
    case 'x':
    case 'X':
    case 'o':
    case 'b':
    case 'c': {
      if (v.Is(Value::Type::FLOAT)) throw UnknownFormat(type, v);
      int64_t i = v.AsInt();
      negative = i < 0;
      if (type == 'c') {
        if (i < 0 || i > 0x10FFFF) {
          throw ExecutionError("OverflowError",
                               "%c arg not in range(0x110000)");
        }
        std::string out;
        util::AppendUtf8(&out, static_cast<uint32_t>(i));
        return Pad("", out, parsed, '<');
      }
      int base = type == 'x' || type == 'X' ? 16
                 : type == 'o'              ? 8
                 : type == 'b'              ? 2
                                            : 10;
      body = IntToBase(i, base, type == 'X');
      if (parsed.grouping && base == 10) body = Group(body);
      if (parsed.alternate && base != 10) {
        body = std::string("0") + type + body;
      }
      break;
    }
    case 'f':
    case 'F':
    case 'e':
    case 'E':
    case 'g':
    case 'G':
    case '%': {
      double d = std::fabs(v.AsFloat());
      if (type == '%') d *= 100;
      int precision = parsed.precision >= 0 ? parsed.precision : 6;
      if (std::isnan(d) || std::isinf(d)) {
        body = std::isnan(d) ? "nan" : "inf";
        if (type == 'F' || type == 'E' || type == 'G') {
          std::transform(body.begin(), body.end(), body.begin(), [](char c) {
            return static_cast<char>(toupper(static_cast<unsigned char>(c)));
          });
        }
      } else {
        char fmt[8];
        snprintf(fmt, sizeof(fmt), "%%.*%c", type == '%' ? 'f' : type);
        if (type == 'g' || type == 'G') {
          if (parsed.alternate) snprintf(fmt, sizeof(fmt), "%%#.*%c", type);
        }
        std::vector<char> buf(precision + 400);
        snprintf(buf.data(), buf.size(), fmt, precision, d);
        body = buf.data();
        if (parsed.grouping && (type == 'f' || type == 'F' || type == '%')) {
          size_t dot = body.find('.');
          body = Group(body.substr(0, dot)) +
                 (dot == std::string::npos ? "" : body.substr(dot));
        }
      }
      if (type == '%') body += '%';
      break;
    }
    case 0:
      body = FormatFloat(std::fabs(v.AsFloat()));
      break;
    default:
      throw UnknownFormat(type, v);
  }
  std::string sign;
  if (negative) {
    sign = "-";
  } else if (parsed.sign == '+') {
    sign = "+";
  } else if (parsed.sign == ' ') {
    sign = " ";
  }
  return Pad(sign, body, parsed, '>');
}

std::string FormatPercent(const std::string& format, const Value& args) {
  ValueList values;
  if (args.Is(Value::Type::TUPLE)) {
    values = args.AsList().items;
  } else {
    values.push_back(args);
  }
  size_t next = 0;
  std::string out;
  for (size_t i = 0; i < format.size(); i++) {
    if (format[i] != '%') {
      out += format[i];
      continue;
    }
    if (++i >= format.size()) {
      throw ExecutionError("ValueError", "incomplete format");
    }
    if (format[i] == '%') {
      out += '%';
      continue;
    }
    std::string flags;
    while (i < format.size() && strchr("-+ 0#", format[i]) != nullptr) {
      flags += format[i++];
    }
    std::string width;
    while (i < format.size() &&
           isdigit(static_cast<unsigned char>(format[i]))) {
      width += format[i++];
    }
    std::string precision;
    if (i < format.size() && format[i] == '.') {
      precision = ".";
      i++;
      while (i < format.size() &&
             isdigit(static_cast<unsigned char>(format[i]))) {
        precision += format[i++];
      }
      if (precision == ".") precision = ".0";
    }
    if (i >= format.size()) {
      throw ExecutionError("ValueError", "incomplete format");
    }
    char type = format[i];
    if (next >= values.size()) {
      throw ExecutionError("TypeError",
                           "not enough arguments for format string");
    }
    Value value = values[next++];
    std::string spec;
    if (flags.find('-') != std::string::npos) spec += '<';
    if (flags.find('+') != std::string::npos) {
      spec += '+';
    } else if (flags.find(' ') != std::string::npos) {
      spec += ' ';
    }
    if (flags.find('#') != std::string::npos) spec += '#';
    if (flags.find('0') != std::string::npos &&
        flags.find('-') == std::string::npos) {
      spec += '0';
    }
    spec += width + precision;
    switch (type) {
      case 's':
        out += FormatSpec(Value::Str(Str(value)), spec);
        break;
      case 'r':
      case 'a':
        out += FormatSpec(Value::Str(Repr(value)), spec);
        break;
      case 'd':
      case 'i':
      case 'u':
        if (!value.IsNumber()) {
          throw ExecutionError("TypeError", "%d format: a real number is "
                                            "required, not " +
                                                value.TypeName());
        }
        if (value.Is(Value::Type::FLOAT)) {
          double d = std::trunc(value.AsFloat());
          if (!(std::fabs(d) < 9.2e18)) throw Overflow();
          value = Value::Int(static_cast<int64_t>(d));
        }
        out += FormatSpec(Value::Int(value.AsInt()), spec + "d");
        break;
      case 'f':
      case 'F':
      case 'e':
      case 'E':
      case 'g':
      case 'G':
        out += FormatSpec(Value::Float(ToFloat(value, "format argument")),
                          spec + type);
        break;
      case 'x':
      case 'X':
      case 'o':
      case 'c':
        out += FormatSpec(value, spec + type);
        break;
      default:
        throw ExecutionError("ValueError",
                             std::string("unsupported format character '") +
                                 type + "'");
    }
  }
  if (next < values.size()) {
    throw ExecutionError("TypeError",
                         "not all arguments converted during string "
                         "formatting");
  }
  return out;
}

}  // namespace script
