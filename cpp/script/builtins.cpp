#include "script/builtins.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <random>

#include "script/capabilities.hpp"
#include "script/error.hpp"
#include "script/interpreter.hpp"
#include "script/methods.hpp"
#include "script/native.hpp"
#include "script/ops.hpp"
#include "script/output.hpp"
#include "script/surface.hpp"
#include "util/misc.hpp"

namespace script {

namespace {

const char kWhitespace[] = " \t\n\r\f\v";

std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(kWhitespace);
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(kWhitespace);
  return s.substr(start, end - start + 1);
}

const double kPi = 3.141592653589793;
const double kE = 2.718281828459045;

// 2**63 as a double; doubles at or above it do not fit an int64_t.
const double kIntLimit = 9223372036854775808.0;

int64_t FloatToInt(double d) {
  if (std::isnan(d)) {
    throw ExecutionError("ValueError", "cannot convert float NaN to integer");
  }
  if (std::isinf(d)) {
    throw ExecutionError("OverflowError",
                         "cannot convert float infinity to integer");
  }
  if (d >= kIntLimit || d < -kIntLimit) {
    throw ExecutionError("OverflowError", "integer overflow");
  }
  return static_cast<int64_t>(d);
}

int DigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'z') return c - 'a' + 10;
  if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
  return 99;
}

int64_t ParseInt(const std::string& text, int64_t base) {
  auto invalid = [&]() {
    return ExecutionError("ValueError",
                          "invalid literal for int() with base " +
                              std::to_string(base) + ": " +
                              Repr(Value::Str(text)));
  };
  std::string s = Trim(text);
  bool negative = false;
  size_t pos = 0;
  if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
    negative = s[pos] == '-';
    pos++;
  }
  auto has_prefix = [&](char lower) {
    return pos + 1 < s.size() && s[pos] == '0' &&
           tolower(static_cast<unsigned char>(s[pos + 1])) == lower;
  };
  int64_t radix = base;
  if (base == 0 || base == 16 || base == 8 || base == 2) {
    if (has_prefix('x') && (base == 0 || base == 16)) {
      radix = 16;
      pos += 2;
    } else if (has_prefix('o') && (base == 0 || base == 8)) {
      radix = 8;
      pos += 2;
    } else if (has_prefix('b') && (base == 0 || base == 2)) {
      radix = 2;
      pos += 2;
    } else if (base == 0) {
      radix = 10;
    }
  }
  if (pos >= s.size()) throw invalid();
  int64_t value = 0;
  bool previous_digit = false;
  for (; pos < s.size(); pos++) {
    if (s[pos] == '_' && previous_digit) {
      previous_digit = false;
      continue;
    }
    int digit = DigitValue(s[pos]);
    if (digit >= radix) throw invalid();
    // Accumulate negatively so that the most negative value fits.
    value = CheckedAdd(CheckedMul(value, radix), -digit);
    previous_digit = true;
  }
  if (!previous_digit) throw invalid();
  if (!negative) {
    if (value == std::numeric_limits<int64_t>::min()) {
      throw ExecutionError("OverflowError", "integer overflow");
    }
    value = -value;
  }
  return value;
}

double ParseFloat(const std::string& text) {
  std::string s = Trim(text);
  std::string lower = s;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
    return static_cast<char>(tolower(static_cast<unsigned char>(c)));
  });
  bool negative = !lower.empty() && lower[0] == '-';
  if (!lower.empty() && (lower[0] == '-' || lower[0] == '+')) {
    lower = lower.substr(1);
  }
  if (lower == "inf" || lower == "infinity") {
    return negative ? -HUGE_VAL : HUGE_VAL;
  }
  if (lower == "nan") return std::nan("");
  std::string digits;
  for (char c : s) {
    if (c != '_') digits += c;
  }
  char* end = nullptr;
  double d = digits.empty() ? 0 : strtod(digits.c_str(), &end);
  bool valid = !digits.empty() && end == digits.c_str() + digits.size() &&
               (isdigit(static_cast<unsigned char>(digits.back())) ||
                digits.back() == '.');
  if (!valid) {
    throw ExecutionError("ValueError", "could not convert string to float: " +
                                           Repr(Value::Str(text)));
  }
  return d;
}

uint32_t DecodeUtf8(const std::string& c) {
  unsigned char lead = c[0];
  if (c.size() == 1) return lead;
  uint32_t cp = lead & (0x3F >> (c.size() - 1));
  for (size_t i = 1; i < c.size(); i++) {
    cp = (cp << 6) | (static_cast<unsigned char>(c[i]) & 0x3F);
  }
  return cp;
}

// bits is the number of bits per digit: 4 for hex(), 1 for bin().
std::string ToBase(int64_t v, int bits, const std::string& prefix) {
  uint64_t magnitude = v < 0 ? 0 - static_cast<uint64_t>(v) : v;
  const char digits[] = "0123456789abcdef";
  uint64_t mask = (uint64_t{1} << bits) - 1;
  std::string out;
  do {
    out += digits[magnitude & mask];
    magnitude >>= bits;
  } while (magnitude != 0);
  std::reverse(out.begin(), out.end());
  return (v < 0 ? "-" : "") + prefix + out;
}

double RoundHalfEven(double d) {
  double r = std::round(d);
  if (std::fabs(d - std::trunc(d)) == 0.5) r = 2.0 * std::round(d / 2.0);
  return r;
}

// Shared by min() and max(); sign is -1 for min and 1 for max.
Value Extreme(Interpreter& interp, const char* fn, int sign, ValueList& args,
              Kwargs& kwargs) {
  Value key = PopKwarg(&kwargs, "key", Value::None());
  bool has_default = false;
  for (const auto& kw : kwargs) {
    if (kw.first == "default") has_default = true;
  }
  Value fallback = PopKwarg(&kwargs, "default", Value::None());
  ExpectKwargsConsumed(fn, kwargs);
  if (args.empty()) {
    throw ExecutionError("TypeError", std::string(fn) +
                                          " expected at least 1 argument, "
                                          "got 0");
  }
  ValueList items = args.size() == 1 ? interp.Materialize(args[0]) : args;
  if (items.empty()) {
    if (args.size() == 1 && has_default) return fallback;
    throw ExecutionError("ValueError",
                         std::string(fn) + "() arg is an empty sequence");
  }
  Value best = items[0];
  Value best_key = key.IsNone() ? best : interp.Call(key, {best});
  for (size_t i = 1; i < items.size(); i++) {
    Value k = key.IsNone() ? items[i] : interp.Call(key, {items[i]});
    if (Compare(k, best_key) * sign > 0) {
      best = items[i];
      best_key = k;
    }
  }
  return best;
}

bool IsInstance(const Value& object, const Value& cls) {
  switch (cls.type()) {
    case Value::Type::TUPLE:
      for (const Value& c : cls.AsList().items) {
        if (IsInstance(object, c)) return true;
      }
      return false;
    case Value::Type::EXCEPTION_TYPE:
      return object.Is(Value::Type::EXCEPTION) &&
             ExecutionError::Matches(object.As<ExceptionObject>().kind,
                                     cls.As<ExceptionTypeObject>().kind);
    case Value::Type::BUILTIN: {
      const std::string& name = cls.As<BuiltinObject>().name;
      if (name == "int" && object.Is(Value::Type::BOOL)) return true;
      if (name == "bool" || name == "int" || name == "float" ||
          name == "str" || name == "list" || name == "tuple" ||
          name == "dict" || name == "range" || name == "Surface") {
        return object.TypeName() == name;
      }
      break;
    }
    default:
      break;
  }
  throw ExecutionError("TypeError",
                       "isinstance() arg 2 must be a type or tuple of types");
}

// Writes the index entry for key and the entries nested under it.
void WriteHelp(Interpreter& interp, const std::string& key) {
  std::string out;
  const Capability* entry = FindCapability(key);
  if (entry != nullptr) out += entry->name + ": " + entry->description + "\n";
  std::string prefix = key + ".";
  for (const Capability& c : CapabilityIndex()) {
    if (c.name.compare(0, prefix.size(), prefix) == 0) {
      out += "  " + c.name.substr(prefix.size()) + ": " + c.description +
             "\n";
    }
  }
  if (out.empty()) out = "no help entry for " + Repr(Value::Str(key)) + "\n";
  interp.Output().Write(out);
}

std::string HelpKey(const Value& v) {
  switch (v.type()) {
    case Value::Type::STR:
      return v.AsStr();
    case Value::Type::BUILTIN: {
      const BuiltinObject& b = v.As<BuiltinObject>();
      if (!b.help_key.empty()) return b.help_key;
      if (FindCapability(b.name) != nullptr) return b.name;
      // Bound methods: the first type that has a method with this name.
      for (const Capability& c : CapabilityIndex()) {
        size_t dot = c.name.rfind('.');
        if (dot != std::string::npos && c.name.substr(dot + 1) == b.name) {
          return c.name;
        }
      }
      return b.name;
    }
    case Value::Type::MODULE:
      return v.As<ModuleObject>().name;
    case Value::Type::EXCEPTION_TYPE:
      return v.As<ExceptionTypeObject>().kind;
    case Value::Type::FUNCTION:
      return v.As<FunctionObject>().name;
    default:
      return v.TypeName();
  }
}

Value Help(Interpreter& interp, ValueList& args, Kwargs& kwargs) {
  ExpectNoKwargs("help", kwargs);
  ExpectArgs("help", args, 0, 1);
  if (args.empty()) {
    std::string out = "Available names:\n";
    for (const Capability& c : CapabilityIndex()) {
      if (c.name.find('.') == std::string::npos) {
        out += "  " + c.name + ": " + c.description + "\n";
      }
    }
    interp.Output().Write(out);
  } else {
    WriteHelp(interp, HelpKey(args[0]));
  }
  return Value::None();
}

void Add(std::map<std::string, Value>* m, const std::string& name,
         NativeFn fn) {
  (*m)[name] = MakeBuiltin(name, std::move(fn));
}

using UnaryMath = double (*)(double);

// Adds a math function of one float argument. domain tells whether the
// argument is valid.
void AddMath(ModuleObject* module, const std::string& name, UnaryMath f,
             bool (*domain)(double) = nullptr) {
  module->members[name] = MakeBuiltin(
      name,
      [name, f, domain](Interpreter&, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs(name, kwargs);
        ExpectArgs(name, args, 1, 1);
        double x = ToFloat(args[0], name.c_str());
        if (domain != nullptr && !domain(x)) {
          throw ExecutionError("ValueError", "math domain error");
        }
        double r = f(x);
        if (std::isinf(r) && std::isfinite(x)) {
          throw ExecutionError("OverflowError", "math range error");
        }
        return Value::Float(r);
      },
      "math." + name);
}

Value MakeMathModule() {
  auto module = std::make_shared<ModuleObject>("math", "mathematical "
                                                       "functions");
  auto& m = module->members;
  m["pi"] = Value::Float(kPi);
  m["e"] = Value::Float(kE);
  m["tau"] = Value::Float(2 * kPi);
  m["inf"] = Value::Float(HUGE_VAL);
  m["nan"] = Value::Float(std::nan(""));

  auto positive = [](double x) { return x > 0; };
  auto non_negative = [](double x) { return x >= 0; };
  auto unit = [](double x) { return x >= -1 && x <= 1; };
  auto finite = [](double x) { return !std::isinf(x); };
  AddMath(module.get(), "sqrt", [](double x) { return std::sqrt(x); },
          non_negative);
  AddMath(module.get(), "exp", [](double x) { return std::exp(x); });
  AddMath(module.get(), "log2", [](double x) { return std::log2(x); },
          positive);
  AddMath(module.get(), "log10", [](double x) { return std::log10(x); },
          positive);
  AddMath(module.get(), "sin", [](double x) { return std::sin(x); }, finite);
  AddMath(module.get(), "cos", [](double x) { return std::cos(x); }, finite);
  AddMath(module.get(), "tan", [](double x) { return std::tan(x); }, finite);
  AddMath(module.get(), "asin", [](double x) { return std::asin(x); }, unit);
  AddMath(module.get(), "acos", [](double x) { return std::acos(x); }, unit);
  AddMath(module.get(), "atan", [](double x) { return std::atan(x); });
  AddMath(module.get(), "fabs", [](double x) { return std::fabs(x); });
  AddMath(module.get(), "degrees", [](double x) { return x * 180 / kPi; });
  AddMath(module.get(), "radians", [](double x) { return x * kPi / 180; });

  m["log"] = MakeBuiltin(
      "log",
      [](Interpreter&, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("log", kwargs);
        ExpectArgs("log", args, 1, 2);
        double x = ToFloat(args[0], "log");
        double base = args.size() == 2 ? ToFloat(args[1], "log") : kE;
        if (x <= 0 || base <= 0) {
          throw ExecutionError("ValueError", "math domain error");
        }
        if (base == 1) {
          throw ExecutionError("ZeroDivisionError", "float division by zero");
        }
        return Value::Float(args.size() == 2 ? std::log(x) / std::log(base)
                                             : std::log(x));
      },
      "math.log");

  auto binary = [](const std::string& name, double (*f)(double, double)) {
    return MakeBuiltin(
        name,
        [name, f](Interpreter&, ValueList& args, Kwargs& kwargs) {
          ExpectNoKwargs(name, kwargs);
          ExpectArgs(name, args, 2, 2);
          double r = f(ToFloat(args[0], name.c_str()),
                       ToFloat(args[1], name.c_str()));
          return Value::Float(r);
        },
        "math." + name);
  };
  m["atan2"] = binary("atan2", [](double y, double x) {
    return std::atan2(y, x);
  });
  m["hypot"] = binary("hypot", [](double x, double y) {
    return std::hypot(x, y);
  });
  m["pow"] = MakeBuiltin(
      "pow",
      [](Interpreter&, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("pow", kwargs);
        ExpectArgs("pow", args, 2, 2);
        double x = ToFloat(args[0], "pow");
        double y = ToFloat(args[1], "pow");
        if (x == 0 && y < 0) {
          throw ExecutionError("ValueError", "math domain error");
        }
        if (x < 0 && std::isfinite(y) && y != std::floor(y)) {
          throw ExecutionError("ValueError", "math domain error");
        }
        double r = std::pow(x, y);
        if (std::isinf(r) && std::isfinite(x) && std::isfinite(y)) {
          throw ExecutionError("OverflowError", "math range error");
        }
        return Value::Float(r);
      },
      "math.pow");

  auto rounding = [](const std::string& name, double (*f)(double)) {
    return MakeBuiltin(
        name,
        [name, f](Interpreter&, ValueList& args, Kwargs& kwargs) {
          ExpectNoKwargs(name, kwargs);
          ExpectArgs(name, args, 1, 1);
          if (args[0].Is(Value::Type::INT) || args[0].Is(Value::Type::BOOL)) {
            return Value::Int(args[0].AsInt());
          }
          return Value::Int(FloatToInt(f(ToFloat(args[0], name.c_str()))));
        },
        "math." + name);
  };
  m["floor"] = rounding("floor", [](double x) { return std::floor(x); });
  m["ceil"] = rounding("ceil", [](double x) { return std::ceil(x); });
  m["trunc"] = rounding("trunc", [](double x) { return std::trunc(x); });

  m["factorial"] = MakeBuiltin(
      "factorial",
      [](Interpreter&, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("factorial", kwargs);
        ExpectArgs("factorial", args, 1, 1);
        int64_t n = ToInt(args[0], "factorial() argument");
        if (n < 0) {
          throw ExecutionError("ValueError",
                               "factorial() not defined for negative values");
        }
        int64_t r = 1;
        for (int64_t i = 2; i <= n; i++) r = CheckedMul(r, i);
        return Value::Int(r);
      },
      "math.factorial");
  m["gcd"] = MakeBuiltin(
      "gcd",
      [](Interpreter&, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("gcd", kwargs);
        uint64_t r = 0;
        for (const Value& v : args) {
          int64_t x = ToInt(v, "gcd() arguments");
          uint64_t y = x < 0 ? 0 - static_cast<uint64_t>(x) : x;
          while (y != 0) {
            uint64_t t = r % y;
            r = y;
            y = t;
          }
        }
        if (r > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
          throw ExecutionError("OverflowError", "integer overflow");
        }
        return Value::Int(r);
      },
      "math.gcd");

  auto predicate = [](const std::string& name, bool (*f)(double)) {
    return MakeBuiltin(
        name,
        [name, f](Interpreter&, ValueList& args, Kwargs& kwargs) {
          ExpectNoKwargs(name, kwargs);
          ExpectArgs(name, args, 1, 1);
          return Value::Bool(f(ToFloat(args[0], name.c_str())));
        },
        "math." + name);
  };
  m["isfinite"] = predicate("isfinite",
                            [](double x) { return std::isfinite(x); });
  m["isinf"] = predicate("isinf", [](double x) { return std::isinf(x); });
  m["isnan"] = predicate("isnan", [](double x) { return std::isnan(x); });
  m["isclose"] = MakeBuiltin(
      "isclose",
      [](Interpreter&, ValueList& args, Kwargs& kwargs) {
        double rel = ToFloat(PopKwarg(&kwargs, "rel_tol", Value::Float(1e-9)),
                             "rel_tol");
        double abs = ToFloat(PopKwarg(&kwargs, "abs_tol", Value::Float(0)),
                             "abs_tol");
        ExpectKwargsConsumed("isclose", kwargs);
        ExpectArgs("isclose", args, 2, 2);
        if (rel < 0 || abs < 0) {
          throw ExecutionError("ValueError", "tolerances must be non-negative");
        }
        double a = ToFloat(args[0], "isclose");
        double b = ToFloat(args[1], "isclose");
        if (a == b) return Value::Bool(true);
        if (std::isinf(a) || std::isinf(b)) return Value::Bool(false);
        double diff = std::fabs(b - a);
        return Value::Bool(diff <= std::fabs(rel * b) ||
                           diff <= std::fabs(rel * a) || diff <= abs);
      },
      "math.isclose");
  return Value::FromObject(Value::Type::MODULE, std::move(module));
}

double Uniform01(Interpreter& interp) {
  return std::uniform_real_distribution<double>(0, 1)(interp.Random());
}

int64_t RandomBelow(Interpreter& interp, int64_t n) {
  return std::uniform_int_distribution<int64_t>(0, n - 1)(interp.Random());
}

Value MakeRandomModule() {
  auto module = std::make_shared<ModuleObject>(
      "random", "pseudo-random numbers, seeded per run");
  auto& m = module->members;
  m["random"] = MakeBuiltin(
      "random",
      [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("random", kwargs);
        ExpectArgs("random", args, 0, 0);
        return Value::Float(Uniform01(interp));
      },
      "random.random");
  m["uniform"] = MakeBuiltin(
      "uniform",
      [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("uniform", kwargs);
        ExpectArgs("uniform", args, 2, 2);
        double a = ToFloat(args[0], "uniform");
        double b = ToFloat(args[1], "uniform");
        return Value::Float(a + (b - a) * Uniform01(interp));
      },
      "random.uniform");
  m["randint"] = MakeBuiltin(
      "randint",
      [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("randint", kwargs);
        ExpectArgs("randint", args, 2, 2);
        int64_t a = ToInt(args[0], "randint() arguments");
        int64_t b = ToInt(args[1], "randint() arguments");
        if (a > b) {
          throw ExecutionError("ValueError", "empty range for randint(" +
                                                 std::to_string(a) + ", " +
                                                 std::to_string(b) + ")");
        }
        return Value::Int(
            std::uniform_int_distribution<int64_t>(a, b)(interp.Random()));
      },
      "random.randint");
  m["randrange"] = MakeBuiltin(
      "randrange",
      [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("randrange", kwargs);
        ExpectArgs("randrange", args, 1, 3);
        int64_t start = 0;
        int64_t stop;
        int64_t step = 1;
        if (args.size() == 1) {
          stop = ToInt(args[0], "randrange() arguments");
        } else {
          start = ToInt(args[0], "randrange() arguments");
          stop = ToInt(args[1], "randrange() arguments");
          if (args.size() == 3) step = ToInt(args[2], "randrange() arguments");
        }
        if (step == 0) {
          throw ExecutionError("ValueError", "zero step for randrange()");
        }
        RangeObject range(start, stop, step);
        int64_t size = range.Size();
        if (size <= 0) {
          throw ExecutionError("ValueError", "empty range for randrange()");
        }
        return Value::Int(range.At(RandomBelow(interp, size)));
      },
      "random.randrange");
  m["choice"] = MakeBuiltin(
      "choice",
      [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("choice", kwargs);
        ExpectArgs("choice", args, 1, 1);
        ValueList items = interp.Materialize(args[0]);
        if (items.empty()) {
          throw ExecutionError("IndexError",
                               "Cannot choose from an empty sequence");
        }
        return items[RandomBelow(interp, items.size())];
      },
      "random.choice");
  m["shuffle"] = MakeBuiltin(
      "shuffle",
      [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("shuffle", kwargs);
        ExpectArgs("shuffle", args, 1, 1);
        if (!args[0].Is(Value::Type::LIST)) {
          throw ExecutionError("TypeError", "shuffle() argument must be a "
                                            "list, not " +
                                                args[0].TypeName());
        }
        ValueList& items = args[0].AsList().items;
        for (size_t i = items.size(); i > 1; i--) {
          std::swap(items[i - 1], items[RandomBelow(interp, i)]);
        }
        return Value::None();
      },
      "random.shuffle");
  m["sample"] = MakeBuiltin(
      "sample",
      [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("sample", kwargs);
        ExpectArgs("sample", args, 2, 2);
        ValueList pool = interp.Materialize(args[0]);
        int64_t k = ToInt(args[1], "sample size");
        if (k < 0 || k > static_cast<int64_t>(pool.size())) {
          throw ExecutionError("ValueError",
                               "Sample larger than population or is "
                               "negative");
        }
        ValueList picked;
        for (int64_t i = 0; i < k; i++) {
          size_t j = i + RandomBelow(interp, pool.size() - i);
          std::swap(pool[i], pool[j]);
          picked.push_back(pool[i]);
        }
        return Value::List(std::move(picked));
      },
      "random.sample");
  m["seed"] = MakeBuiltin(
      "seed",
      [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("seed", kwargs);
        ExpectArgs("seed", args, 0, 1);
        uint64_t seed;
        if (args.empty() || args[0].IsNone()) {
          seed = std::chrono::steady_clock::now().time_since_epoch().count();
        } else if (args[0].Is(Value::Type::STR)) {
          seed = std::hash<std::string>()(args[0].AsStr());
        } else if (args[0].Is(Value::Type::FLOAT)) {
          seed = std::hash<double>()(args[0].AsFloat());
        } else {
          seed = ToInt(args[0], "seed");
        }
        interp.Random().seed(seed);
        return Value::None();
      },
      "random.seed");
  return Value::FromObject(Value::Type::MODULE, std::move(module));
}

Value MakeStringModule() {
  auto module =
      std::make_shared<ModuleObject>("string", "common string constants");
  auto& m = module->members;
  const std::string lower = "abcdefghijklmnopqrstuvwxyz";
  const std::string upper = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
  const std::string digits = "0123456789";
  const std::string punctuation = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";
  const std::string whitespace = " \t\n\r\x0b\x0c";
  m["ascii_lowercase"] = Value::Str(lower);
  m["ascii_uppercase"] = Value::Str(upper);
  m["ascii_letters"] = Value::Str(lower + upper);
  m["digits"] = Value::Str(digits);
  m["hexdigits"] = Value::Str("0123456789abcdefABCDEF");
  m["octdigits"] = Value::Str("01234567");
  m["punctuation"] = Value::Str(punctuation);
  m["whitespace"] = Value::Str(whitespace);
  m["printable"] =
      Value::Str(digits + lower + upper + punctuation + whitespace);
  return Value::FromObject(Value::Type::MODULE, std::move(module));
}

}  // namespace

std::map<std::string, Value> MakeBuiltins() {
  std::map<std::string, Value> b;

  Add(&b, "print", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    Value sep = PopKwarg(&kwargs, "sep", Value::None());
    Value end = PopKwarg(&kwargs, "end", Value::None());
    ExpectKwargsConsumed("print", kwargs);
    std::string separator = sep.IsNone() ? " " : ExpectStr("print", sep);
    std::string out;
    for (size_t i = 0; i < args.size(); i++) {
      if (i > 0) out += separator;
      out += Str(args[i]);
    }
    out += end.IsNone() ? "\n" : ExpectStr("print", end);
    interp.Output().Write(out);
    return Value::None();
  });

  Add(&b, "len", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("len", kwargs);
    ExpectArgs("len", args, 1, 1);
    return Value::Int(Length(args[0]));
  });

  Add(&b, "range", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("range", kwargs);
    ExpectArgs("range", args, 1, 3);
    int64_t start = 0;
    int64_t stop;
    int64_t step = 1;
    if (args.size() == 1) {
      stop = ToInt(args[0], "range() arguments");
    } else {
      start = ToInt(args[0], "range() arguments");
      stop = ToInt(args[1], "range() arguments");
      if (args.size() == 3) step = ToInt(args[2], "range() arguments");
    }
    if (step == 0) {
      throw ExecutionError("ValueError", "range() arg 3 must not be zero");
    }
    return Value::FromObject(Value::Type::RANGE,
                             std::make_shared<RangeObject>(start, stop, step));
  });

  Add(&b, "str", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("str", kwargs);
    ExpectArgs("str", args, 0, 1);
    return Value::Str(args.empty() ? "" : Str(args[0]));
  });

  Add(&b, "repr", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("repr", kwargs);
    ExpectArgs("repr", args, 1, 1);
    return Value::Str(Repr(args[0]));
  });

  Add(&b, "int", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    Value base = PopKwarg(&kwargs, "base", Value::None());
    ExpectKwargsConsumed("int", kwargs);
    ExpectArgs("int", args, 0, 2);
    if (args.size() == 2) base = args[1];
    if (args.empty()) return Value::Int(0);
    const Value& x = args[0];
    if (!base.IsNone()) {
      if (!x.Is(Value::Type::STR)) {
        throw ExecutionError("TypeError",
                             "int() can't convert non-string with explicit "
                             "base");
      }
      int64_t radix = ToInt(base, "int() base");
      if (radix != 0 && (radix < 2 || radix > 36)) {
        throw ExecutionError("ValueError",
                             "int() base must be >= 2 and <= 36, or 0");
      }
      return Value::Int(ParseInt(x.AsStr(), radix));
    }
    switch (x.type()) {
      case Value::Type::BOOL:
      case Value::Type::INT:
        return Value::Int(x.AsInt());
      case Value::Type::FLOAT:
        return Value::Int(FloatToInt(x.AsFloat()));
      case Value::Type::STR:
        return Value::Int(ParseInt(x.AsStr(), 10));
      default:
        throw ExecutionError("TypeError",
                             "int() argument must be a string or a real "
                             "number, not '" +
                                 x.TypeName() + "'");
    }
  });

  Add(&b, "float", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("float", kwargs);
    ExpectArgs("float", args, 0, 1);
    if (args.empty()) return Value::Float(0);
    if (args[0].Is(Value::Type::STR)) {
      return Value::Float(ParseFloat(args[0].AsStr()));
    }
    if (!args[0].IsNumber()) {
      throw ExecutionError("TypeError",
                           "float() argument must be a string or a real "
                           "number, not '" +
                               args[0].TypeName() + "'");
    }
    return Value::Float(args[0].AsFloat());
  });

  Add(&b, "bool", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("bool", kwargs);
    ExpectArgs("bool", args, 0, 1);
    return Value::Bool(!args.empty() && Truthy(args[0]));
  });

  Add(&b, "list", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("list", kwargs);
    ExpectArgs("list", args, 0, 1);
    return Value::List(args.empty() ? ValueList{}
                                    : interp.Materialize(args[0]));
  });

  Add(&b, "tuple", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("tuple", kwargs);
    ExpectArgs("tuple", args, 0, 1);
    return Value::Tuple(args.empty() ? ValueList{}
                                     : interp.Materialize(args[0]));
  });

  Add(&b, "dict", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    ExpectArgs("dict", args, 0, 1);
    Value dict = Value::Dict();
    Value update;
    BindMethod(dict, "update", &update);
    interp.Call(update, args, kwargs);
    return dict;
  });

  Add(&b, "abs", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("abs", kwargs);
    ExpectArgs("abs", args, 1, 1);
    const Value& x = args[0];
    if (x.Is(Value::Type::FLOAT)) return Value::Float(std::fabs(x.AsFloat()));
    if (!x.IsNumber()) {
      throw ExecutionError("TypeError", "bad operand type for abs(): '" +
                                            x.TypeName() + "'");
    }
    if (x.AsInt() == std::numeric_limits<int64_t>::min()) {
      throw ExecutionError("OverflowError", "integer overflow");
    }
    return Value::Int(std::llabs(x.AsInt()));
  });

  Add(&b, "min", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    return Extreme(interp, "min", -1, args, kwargs);
  });
  Add(&b, "max", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    return Extreme(interp, "max", 1, args, kwargs);
  });

  Add(&b, "sum", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    Value start = PopKwarg(&kwargs, "start", Value::Int(0));
    ExpectKwargsConsumed("sum", kwargs);
    ExpectArgs("sum", args, 1, 2);
    if (args.size() == 2) start = args[1];
    if (start.Is(Value::Type::STR)) {
      throw ExecutionError("TypeError",
                           "sum() can't sum strings [use ''.join(seq) "
                           "instead]");
    }
    Value total = start;
    interp.ForEach(args[0], [&](const Value& item) {
      total = BinaryOp(ast::BinOp::ADD, total, item);
      return true;
    });
    return total;
  });

  Add(&b, "round", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    Value ndigits = PopKwarg(&kwargs, "ndigits", Value::None());
    ExpectKwargsConsumed("round", kwargs);
    ExpectArgs("round", args, 1, 2);
    if (args.size() == 2) ndigits = args[1];
    const Value& x = args[0];
    if (!x.IsNumber()) {
      throw ExecutionError("TypeError", "type " + x.TypeName() +
                                            " doesn't define __round__ "
                                            "method");
    }
    if (ndigits.IsNone()) {
      if (!x.Is(Value::Type::FLOAT)) return Value::Int(x.AsInt());
      return Value::Int(FloatToInt(RoundHalfEven(x.AsFloat())));
    }
    int64_t n = ToInt(ndigits, "round() ndigits");
    if (!x.Is(Value::Type::FLOAT)) {
      if (n >= 0) return Value::Int(x.AsInt());
      if (n < -18) return Value::Int(0);
      int64_t p = 1;
      for (int64_t i = 0; i < -n; i++) p *= 10;
      int64_t v = x.AsInt();
      int64_t q = v / p;
      int64_t r = v % p;
      if (r < 0) {
        q -= 1;
        r += p;
      }
      if (2 * r > p || (2 * r == p && (q & 1))) q += 1;
      return Value::Int(CheckedMul(q, p));
    }
    double d = x.AsFloat();
    if (!std::isfinite(d) || n > 308) return Value::Float(d);
    if (n < -308) return Value::Float(0.0 * d);
    double scale = std::pow(10.0, static_cast<double>(std::llabs(n)));
    double r = n >= 0 ? RoundHalfEven(d * scale) / scale
                      : RoundHalfEven(d / scale) * scale;
    if (!std::isfinite(r)) return Value::Float(d);
    return Value::Float(r);
  });

  Add(&b, "sorted", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    Value key = PopKwarg(&kwargs, "key", Value::None());
    Value reverse = PopKwarg(&kwargs, "reverse", Value::Bool(false));
    ExpectKwargsConsumed("sorted", kwargs);
    ExpectArgs("sorted", args, 1, 1);
    ValueList items = interp.Materialize(args[0]);
    SortValues(interp, &items, key, Truthy(reverse));
    return Value::List(std::move(items));
  });

  Add(&b, "reversed",
      [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("reversed", kwargs);
        ExpectArgs("reversed", args, 1, 1);
        ValueList items = interp.Materialize(args[0]);
        std::reverse(items.begin(), items.end());
        return Value::List(std::move(items));
      });

  Add(&b, "enumerate",
      [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        Value start = PopKwarg(&kwargs, "start", Value::Int(0));
        ExpectKwargsConsumed("enumerate", kwargs);
        ExpectArgs("enumerate", args, 1, 2);
        if (args.size() == 2) start = args[1];
        int64_t i = ToInt(start, "enumerate() start");
        ValueList pairs;
        interp.ForEach(args[0], [&](const Value& item) {
          pairs.push_back(Value::Tuple({Value::Int(i), item}));
          i = CheckedAdd(i, 1);
          return true;
        });
        return Value::List(std::move(pairs));
      });

  Add(&b, "zip", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("zip", kwargs);
    std::vector<ValueList> columns;
    size_t rows = args.empty() ? 0 : std::numeric_limits<size_t>::max();
    for (const Value& arg : args) {
      columns.push_back(interp.Materialize(arg));
      rows = std::min(rows, columns.back().size());
    }
    ValueList out;
    for (size_t r = 0; r < rows; r++) {
      ValueList row;
      for (const ValueList& column : columns) row.push_back(column[r]);
      out.push_back(Value::Tuple(std::move(row)));
    }
    return Value::List(std::move(out));
  });

  Add(&b, "chr", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("chr", kwargs);
    ExpectArgs("chr", args, 1, 1);
    int64_t cp = ToInt(args[0], "chr() argument");
    if (cp < 0 || cp > 0x10FFFF) {
      throw ExecutionError("ValueError", "chr() arg not in range(0x110000)");
    }
    std::string out;
    util::AppendUtf8(&out, cp);
    return Value::Str(out);
  });

  Add(&b, "ord", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("ord", kwargs);
    ExpectArgs("ord", args, 1, 1);
    const std::string& s = ExpectStr("ord", args[0]);
    std::vector<std::string> chars = CodePoints(s);
    if (chars.size() != 1) {
      throw ExecutionError("TypeError",
                           "ord() expected a character, but string of "
                           "length " +
                               std::to_string(chars.size()) + " found");
    }
    return Value::Int(DecodeUtf8(chars[0]));
  });

  Add(&b, "isinstance", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("isinstance", kwargs);
    ExpectArgs("isinstance", args, 2, 2);
    return Value::Bool(IsInstance(args[0], args[1]));
  });

  Add(&b, "help", Help);

  Add(&b, "any", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("any", kwargs);
    ExpectArgs("any", args, 1, 1);
    bool found = false;
    interp.ForEach(args[0], [&](const Value& item) {
      found = Truthy(item);
      return !found;
    });
    return Value::Bool(found);
  });

  Add(&b, "all", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("all", kwargs);
    ExpectArgs("all", args, 1, 1);
    bool all = true;
    interp.ForEach(args[0], [&](const Value& item) {
      all = Truthy(item);
      return all;
    });
    return Value::Bool(all);
  });

  Add(&b, "divmod", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("divmod", kwargs);
    ExpectArgs("divmod", args, 2, 2);
    return Value::Tuple({BinaryOp(ast::BinOp::FLOOR_DIV, args[0], args[1]),
                         BinaryOp(ast::BinOp::MOD, args[0], args[1])});
  });

  Add(&b, "pow", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("pow", kwargs);
    ExpectArgs("pow", args, 2, 3);
    if (args.size() == 2 || args[2].IsNone()) {
      return BinaryOp(ast::BinOp::POW, args[0], args[1]);
    }
    int64_t base = ToInt(args[0], "pow() arguments");
    int64_t exp = ToInt(args[1], "pow() arguments");
    int64_t mod = ToInt(args[2], "pow() arguments");
    if (mod == 0) {
      throw ExecutionError("ValueError", "pow() 3rd argument cannot be 0");
    }
    if (exp < 0) {
      throw ExecutionError("ValueError",
                           "pow() 2nd argument cannot be negative when 3rd "
                           "argument specified");
    }
    __int128 m = mod < 0 ? -static_cast<__int128>(mod) : mod;
    __int128 result = 1 % m;
    __int128 factor = ((base % m) + m) % m;
    for (; exp > 0; exp >>= 1) {
      if (exp & 1) result = result * factor % m;
      factor = factor * factor % m;
    }
    if (mod < 0 && result != 0) result += mod;
    return Value::Int(static_cast<int64_t>(result));
  });

  Add(&b, "hex", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("hex", kwargs);
    ExpectArgs("hex", args, 1, 1);
    return Value::Str(ToBase(ToInt(args[0], "hex() argument"), 4, "0x"));
  });

  Add(&b, "bin", [](Interpreter&, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("bin", kwargs);
    ExpectArgs("bin", args, 1, 1);
    return Value::Str(ToBase(ToInt(args[0], "bin() argument"), 1, "0b"));
  });

  Add(&b, "map", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("map", kwargs);
    if (args.size() < 2) {
      throw ExecutionError("TypeError", "map() must have at least two "
                                        "arguments.");
    }
    std::vector<ValueList> columns;
    size_t rows = std::numeric_limits<size_t>::max();
    for (size_t i = 1; i < args.size(); i++) {
      columns.push_back(interp.Materialize(args[i]));
      rows = std::min(rows, columns.back().size());
    }
    ValueList out;
    for (size_t r = 0; r < rows; r++) {
      ValueList call_args;
      for (const ValueList& column : columns) call_args.push_back(column[r]);
      out.push_back(interp.Call(args[0], std::move(call_args)));
    }
    return Value::List(std::move(out));
  });

  Add(&b, "filter", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
    ExpectNoKwargs("filter", kwargs);
    ExpectArgs("filter", args, 2, 2);
    ValueList out;
    interp.ForEach(args[1], [&](const Value& item) {
      bool keep = args[0].IsNone() ? Truthy(item)
                                   : Truthy(interp.Call(args[0], {item}));
      if (keep) out.push_back(item);
      return true;
    });
    return Value::List(std::move(out));
  });

  for (const std::string& kind : ExceptionKinds()) {
    b[kind] = Value::FromObject(Value::Type::EXCEPTION_TYPE,
                                std::make_shared<ExceptionTypeObject>(kind));
  }
  return b;
}

Value MakeModule(const std::string& name) {
  if (name == "math") return MakeMathModule();
  if (name == "random") return MakeRandomModule();
  if (name == "string") return MakeStringModule();
  if (name == "draw") return MakeDrawModule();
  return Value::None();
}

}  // namespace script
