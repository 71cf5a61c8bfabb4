#include "script/methods.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <map>
#include <numeric>

#include "script/error.hpp"
#include "script/interpreter.hpp"
#include "script/native.hpp"
#include "script/ops.hpp"
#include "script/surface.hpp"

namespace script {

namespace {

using Method = Value (*)(Interpreter& interp, const Value& self,
                         ValueList& args, Kwargs& kwargs);
using MethodTable = std::map<std::string, Method>;

const char kWhitespace[] = " \t\n\r\f\v";

// Byte offset to code point offset.
int64_t CharIndex(const std::string& s, size_t byte_offset) {
  return CodePointCount(s.substr(0, byte_offset));
}

std::string StripChars(ValueList& args, const char* fn) {
  ExpectArgs(fn, args, 0, 1);
  if (args.empty() || args[0].IsNone()) return kWhitespace;
  return ExpectStr(fn, args[0]);
}

char UpperByte(char c) {
  return static_cast<char>(toupper(static_cast<unsigned char>(c)));
}

char LowerByte(char c) {
  return static_cast<char>(tolower(static_cast<unsigned char>(c)));
}

bool IsDigitByte(char c) { return isdigit(static_cast<unsigned char>(c)) != 0; }

bool AllBytes(const std::string& s, int (*pred)(int)) {
  if (s.empty()) return false;
  for (unsigned char c : s) {
    if (!pred(c)) return false;
  }
  return true;
}

std::string Justify(const std::string& s, ValueList& args, const char* fn,
                    char align) {
  ExpectArgs(fn, args, 1, 2);
  int64_t width = ToInt(args[0], "width");
  std::string fill = " ";
  if (args.size() == 2) {
    fill = ExpectStr(fn, args[1]);
    if (CodePointCount(fill) != 1) {
      throw ExecutionError("TypeError",
                           "The fill character must be exactly one character "
                           "long");
    }
  }
  CheckSequenceSize(width);
  int64_t padding = width - CodePointCount(s);
  if (padding <= 0) return s;
  auto repeat = [&](int64_t n) {
    std::string out;
    for (int64_t i = 0; i < n; i++) out += fill;
    return out;
  };
  if (align == '<') return s + repeat(padding);
  if (align == '>') return repeat(padding) + s;
  int64_t left = padding / 2 + (padding & width & 1);
  return repeat(left) + s + repeat(padding - left);
}

// Fields of str.format: "{}", "{0}", "{name}", with "!r" and ":spec".
std::string FormatFields(const std::string& format, const ValueList& args,
                         const Kwargs& kwargs) {
  std::string out;
  size_t auto_index = 0;
  for (size_t i = 0; i < format.size(); i++) {
    char c = format[i];
    if (c == '}') {
      if (i + 1 < format.size() && format[i + 1] == '}') i++;
      out += '}';
      continue;
    }
    if (c != '{') {
      out += c;
      continue;
    }
    if (i + 1 < format.size() && format[i + 1] == '{') {
      out += '{';
      i++;
      continue;
    }
    size_t end = format.find('}', i);
    if (end == std::string::npos) {
      throw ExecutionError("ValueError",
                           "Single '{' encountered in format string");
    }
    std::string field = format.substr(i + 1, end - i - 1);
    i = end;
    std::string spec;
    size_t colon = field.find(':');
    if (colon != std::string::npos) {
      spec = field.substr(colon + 1);
      field = field.substr(0, colon);
    }
    char conversion = 0;
    size_t bang = field.find('!');
    if (bang != std::string::npos) {
      conversion = bang + 1 < field.size() ? field[bang + 1] : 0;
      field = field.substr(0, bang);
    }
    Value value;
    if (field.empty()) {
      if (auto_index >= args.size()) {
        throw ExecutionError("IndexError",
                             "Replacement index " +
                                 std::to_string(auto_index) +
                                 " out of range for positional args tuple");
      }
      value = args[auto_index++];
    } else if (std::all_of(field.begin(), field.end(), IsDigitByte)) {
      size_t index = 0;
      for (char d : field) {
        if (index > (std::numeric_limits<int64_t>::max() - 9) / 10) {
          throw ExecutionError("ValueError",
                               "Too many decimal digits in format string");
        }
        index = index * 10 + (d - '0');
      }
      if (index >= args.size()) {
        throw ExecutionError("IndexError",
                             "Replacement index " + field +
                                 " out of range for positional args tuple");
      }
      value = args[index];
    } else {
      bool found = false;
      for (const auto& kw : kwargs) {
        if (kw.first == field) {
          value = kw.second;
          found = true;
        }
      }
      if (!found) throw ExecutionError("KeyError", field);
    }
    if (conversion == 'r' || conversion == 'a') {
      value = Value::Str(Repr(value));
    } else if (conversion == 's') {
      value = Value::Str(Str(value));
    }
    out += spec.empty() ? Str(value) : FormatSpec(value, spec);
  }
  return out;
}

const MethodTable& StrMethods() {
  static const MethodTable methods = {
      {"upper",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("upper", kwargs);
         ExpectArgs("upper", args, 0, 0);
         std::string s = self.AsStr();
         std::transform(s.begin(), s.end(), s.begin(), UpperByte);
         return Value::Str(s);
       }},
      {"lower",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("lower", kwargs);
         ExpectArgs("lower", args, 0, 0);
         std::string s = self.AsStr();
         std::transform(s.begin(), s.end(), s.begin(), LowerByte);
         return Value::Str(s);
       }},
      {"title",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("title", kwargs);
         ExpectArgs("title", args, 0, 0);
         std::string s = self.AsStr();
         bool previous_cased = false;
         for (char& c : s) {
           bool cased = isalpha(static_cast<unsigned char>(c));
           c = previous_cased ? LowerByte(c) : UpperByte(c);
           previous_cased = cased;
         }
         return Value::Str(s);
       }},
      {"capitalize",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("capitalize", kwargs);
         ExpectArgs("capitalize", args, 0, 0);
         std::string s = self.AsStr();
         std::transform(s.begin(), s.end(), s.begin(), LowerByte);
         if (!s.empty()) s[0] = UpperByte(s[0]);
         return Value::Str(s);
       }},
      {"strip",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("strip", kwargs);
         std::string chars = StripChars(args, "strip");
         const std::string& s = self.AsStr();
         size_t start = s.find_first_not_of(chars);
         if (start == std::string::npos) return Value::Str("");
         size_t end = s.find_last_not_of(chars);
         return Value::Str(s.substr(start, end - start + 1));
       }},
      {"lstrip",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("lstrip", kwargs);
         std::string chars = StripChars(args, "lstrip");
         const std::string& s = self.AsStr();
         size_t start = s.find_first_not_of(chars);
         return Value::Str(start == std::string::npos ? "" : s.substr(start));
       }},
      {"rstrip",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("rstrip", kwargs);
         std::string chars = StripChars(args, "rstrip");
         const std::string& s = self.AsStr();
         size_t end = s.find_last_not_of(chars);
         return Value::Str(end == std::string::npos ? ""
                                                    : s.substr(0, end + 1));
       }},
      {"split",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         if (args.size() < 1) {
           args.push_back(PopKwarg(&kwargs, "sep", Value::None()));
         }
         if (args.size() < 2) {
           args.push_back(PopKwarg(&kwargs, "maxsplit", Value::Int(-1)));
         }
         ExpectKwargsConsumed("split", kwargs);
         ExpectArgs("split", args, 2, 2);
         int64_t maxsplit = ToInt(args[1], "maxsplit");
         const std::string& s = self.AsStr();
         ValueList parts;
         if (args[0].IsNone()) {
           size_t pos = s.find_first_not_of(kWhitespace);
           while (pos != std::string::npos) {
             if (maxsplit >= 0 &&
                 static_cast<int64_t>(parts.size()) == maxsplit) {
               size_t end = s.find_last_not_of(kWhitespace);
               parts.push_back(Value::Str(s.substr(pos, end - pos + 1)));
               break;
             }
             size_t end = s.find_first_of(kWhitespace, pos);
             parts.push_back(Value::Str(s.substr(pos, end - pos)));
             pos = end == std::string::npos
                       ? end
                       : s.find_first_not_of(kWhitespace, end);
           }
           return Value::List(std::move(parts));
         }
         const std::string& sep = ExpectStr("split", args[0]);
         if (sep.empty()) throw ExecutionError("ValueError", "empty separator");
         size_t pos = 0;
         while (true) {
           size_t next = s.find(sep, pos);
           if (next == std::string::npos ||
               (maxsplit >= 0 &&
                static_cast<int64_t>(parts.size()) == maxsplit)) {
             parts.push_back(Value::Str(s.substr(pos)));
             break;
           }
           parts.push_back(Value::Str(s.substr(pos, next - pos)));
           pos = next + sep.size();
         }
         return Value::List(std::move(parts));
       }},
      {"splitlines",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("splitlines", kwargs);
         ExpectArgs("splitlines", args, 0, 0);
         const std::string& s = self.AsStr();
         ValueList lines;
         size_t start = 0;
         for (size_t i = 0; i < s.size(); i++) {
           if (s[i] != '\n' && s[i] != '\r') continue;
           lines.push_back(Value::Str(s.substr(start, i - start)));
           if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') i++;
           start = i + 1;
         }
         if (start < s.size()) lines.push_back(Value::Str(s.substr(start)));
         return Value::List(std::move(lines));
       }},
      {"join",
       [](Interpreter& interp, const Value& self, ValueList& args,
          Kwargs& kwargs) {
         ExpectNoKwargs("join", kwargs);
         ExpectArgs("join", args, 1, 1);
         std::string out;
         size_t index = 0;
         interp.ForEach(args[0], [&](const Value& item) {
           if (!item.Is(Value::Type::STR)) {
             throw ExecutionError("TypeError",
                                  "sequence item " + std::to_string(index) +
                                      ": expected str instance, " +
                                      item.TypeName() + " found");
           }
           if (index++ > 0) out += self.AsStr();
           out += item.AsStr();
           CheckSequenceSize(out.size());
           return true;
         });
         return Value::Str(std::move(out));
       }},
      {"replace",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("replace", kwargs);
         ExpectArgs("replace", args, 2, 3);
         const std::string& old = ExpectStr("replace", args[0]);
         const std::string& replacement = ExpectStr("replace", args[1]);
         int64_t count = args.size() == 3 ? ToInt(args[2], "count") : -1;
         const std::string& s = self.AsStr();
         std::string out;
         if (old.empty()) {
           std::vector<std::string> chars = CodePoints(s);
           for (size_t i = 0; i <= chars.size(); i++) {
             if (count < 0 || static_cast<int64_t>(i) < count) {
               out += replacement;
             }
             if (i < chars.size()) out += chars[i];
             CheckSequenceSize(out.size());
           }
           return Value::Str(std::move(out));
         }
         size_t pos = 0;
         int64_t done = 0;
         while (count < 0 || done < count) {
           size_t next = s.find(old, pos);
           if (next == std::string::npos) break;
           out.append(s, pos, next - pos);
           out += replacement;
           CheckSequenceSize(out.size());
           pos = next + old.size();
           done++;
         }
         out.append(s, pos, std::string::npos);
         return Value::Str(std::move(out));
       }},
      {"startswith",
       [](Interpreter& interp, const Value& self, ValueList& args,
          Kwargs& kwargs) {
         ExpectNoKwargs("startswith", kwargs);
         ExpectArgs("startswith", args, 1, 1);
         ValueList prefixes = args[0].Is(Value::Type::TUPLE)
                                  ? interp.Materialize(args[0])
                                  : ValueList{args[0]};
         for (const Value& p : prefixes) {
           const std::string& prefix = ExpectStr("startswith", p);
           if (self.AsStr().compare(0, prefix.size(), prefix) == 0) {
             return Value::Bool(true);
           }
         }
         return Value::Bool(false);
       }},
      {"endswith",
       [](Interpreter& interp, const Value& self, ValueList& args,
          Kwargs& kwargs) {
         ExpectNoKwargs("endswith", kwargs);
         ExpectArgs("endswith", args, 1, 1);
         ValueList suffixes = args[0].Is(Value::Type::TUPLE)
                                  ? interp.Materialize(args[0])
                                  : ValueList{args[0]};
         const std::string& s = self.AsStr();
         for (const Value& v : suffixes) {
           const std::string& suffix = ExpectStr("endswith", v);
           if (s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) ==
                   0) {
             return Value::Bool(true);
           }
         }
         return Value::Bool(false);
       }},
      {"find",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("find", kwargs);
         ExpectArgs("find", args, 1, 1);
         size_t pos = self.AsStr().find(ExpectStr("find", args[0]));
         if (pos == std::string::npos) return Value::Int(-1);
         return Value::Int(CharIndex(self.AsStr(), pos));
       }},
      {"index",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("index", kwargs);
         ExpectArgs("index", args, 1, 1);
         size_t pos = self.AsStr().find(ExpectStr("index", args[0]));
         if (pos == std::string::npos) {
           throw ExecutionError("ValueError", "substring not found");
         }
         return Value::Int(CharIndex(self.AsStr(), pos));
       }},
      {"count",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("count", kwargs);
         ExpectArgs("count", args, 1, 1);
         const std::string& s = self.AsStr();
         const std::string& sub = ExpectStr("count", args[0]);
         if (sub.empty()) return Value::Int(CodePointCount(s) + 1);
         int64_t count = 0;
         for (size_t pos = s.find(sub); pos != std::string::npos;
              pos = s.find(sub, pos + sub.size())) {
           count++;
         }
         return Value::Int(count);
       }},
      {"format",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         return Value::Str(FormatFields(self.AsStr(), args, kwargs));
       }},
      {"isdigit",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("isdigit", kwargs);
         ExpectArgs("isdigit", args, 0, 0);
         return Value::Bool(AllBytes(self.AsStr(), ::isdigit));
       }},
      {"isalpha",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("isalpha", kwargs);
         ExpectArgs("isalpha", args, 0, 0);
         return Value::Bool(AllBytes(self.AsStr(), ::isalpha));
       }},
      {"isalnum",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("isalnum", kwargs);
         ExpectArgs("isalnum", args, 0, 0);
         return Value::Bool(AllBytes(self.AsStr(), ::isalnum));
       }},
      {"isspace",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("isspace", kwargs);
         ExpectArgs("isspace", args, 0, 0);
         return Value::Bool(AllBytes(self.AsStr(), ::isspace));
       }},
      {"isupper",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("isupper", kwargs);
         ExpectArgs("isupper", args, 0, 0);
         const std::string& s = self.AsStr();
         bool cased = false;
         for (unsigned char c : s) {
           if (islower(c)) return Value::Bool(false);
           cased = cased || isupper(c);
         }
         return Value::Bool(cased);
       }},
      {"islower",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("islower", kwargs);
         ExpectArgs("islower", args, 0, 0);
         const std::string& s = self.AsStr();
         bool cased = false;
         for (unsigned char c : s) {
           if (isupper(c)) return Value::Bool(false);
           cased = cased || islower(c);
         }
         return Value::Bool(cased);
       }},
      {"center",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("center", kwargs);
         return Value::Str(Justify(self.AsStr(), args, "center", '^'));
       }},
      {"ljust",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("ljust", kwargs);
         return Value::Str(Justify(self.AsStr(), args, "ljust", '<'));
       }},
      {"rjust",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("rjust", kwargs);
         return Value::Str(Justify(self.AsStr(), args, "rjust", '>'));
       }},
      {"zfill",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("zfill", kwargs);
         ExpectArgs("zfill", args, 1, 1);
         const std::string& s = self.AsStr();
         int64_t width = ToInt(args[0], "width");
         CheckSequenceSize(width);
         int64_t padding = width - CodePointCount(s);
         if (padding <= 0) return Value::Str(s);
         size_t sign = !s.empty() && (s[0] == '-' || s[0] == '+') ? 1 : 0;
         return Value::Str(s.substr(0, sign) + std::string(padding, '0') +
                           s.substr(sign));
       }},
  };
  return methods;
}

Value SequenceIndex(const Value& self, ValueList& args, Kwargs& kwargs) {
  ExpectNoKwargs("index", kwargs);
  ExpectArgs("index", args, 1, 1);
  const ValueList& items = self.AsList().items;
  for (size_t i = 0; i < items.size(); i++) {
    if (Equals(items[i], args[0])) return Value::Int(i);
  }
  throw ExecutionError("ValueError", Repr(args[0]) + " is not in " +
                                         self.TypeName());
}

Value SequenceCount(const Value& self, ValueList& args, Kwargs& kwargs) {
  ExpectNoKwargs("count", kwargs);
  ExpectArgs("count", args, 1, 1);
  int64_t count = 0;
  for (const Value& v : self.AsList().items) {
    if (Equals(v, args[0])) count++;
  }
  return Value::Int(count);
}

const MethodTable& ListMethods() {
  static const MethodTable methods = {
      {"append",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("append", kwargs);
         ExpectArgs("append", args, 1, 1);
         ValueList& items = self.AsList().items;
         CheckSequenceSize(items.size() + 1);
         items.push_back(args[0]);
         return Value::None();
       }},
      {"extend",
       [](Interpreter& interp, const Value& self, ValueList& args,
          Kwargs& kwargs) {
         ExpectNoKwargs("extend", kwargs);
         ExpectArgs("extend", args, 1, 1);
         ValueList more = interp.Materialize(args[0]);
         ValueList& items = self.AsList().items;
         CheckSequenceSize(items.size() + more.size());
         items.insert(items.end(), more.begin(), more.end());
         return Value::None();
       }},
      {"insert",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("insert", kwargs);
         ExpectArgs("insert", args, 2, 2);
         ValueList& items = self.AsList().items;
         int64_t size = items.size();
         int64_t i = ToInt(args[0], "list indices");
         if (i < 0) i = std::max<int64_t>(i + size, 0);
         if (i > size) i = size;
         CheckSequenceSize(size + 1);
         items.insert(items.begin() + i, args[1]);
         return Value::None();
       }},
      {"pop",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("pop", kwargs);
         ExpectArgs("pop", args, 0, 1);
         ValueList& items = self.AsList().items;
         if (items.empty()) {
           throw ExecutionError("IndexError", "pop from empty list");
         }
         int64_t size = items.size();
         int64_t i = args.empty() ? size - 1 : ToInt(args[0], "list indices");
         if (i < 0) i += size;
         if (i < 0 || i >= size) {
           throw ExecutionError("IndexError", "pop index out of range");
         }
         Value v = items[i];
         items.erase(items.begin() + i);
         return v;
       }},
      {"remove",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("remove", kwargs);
         ExpectArgs("remove", args, 1, 1);
         ValueList& items = self.AsList().items;
         for (auto it = items.begin(); it != items.end(); ++it) {
           if (Equals(*it, args[0])) {
             items.erase(it);
             return Value::None();
           }
         }
         throw ExecutionError("ValueError", "list.remove(x): x not in list");
       }},
      {"index",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         return SequenceIndex(self, args, kwargs);
       }},
      {"count",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         return SequenceCount(self, args, kwargs);
       }},
      {"sort",
       [](Interpreter& interp, const Value& self, ValueList& args,
          Kwargs& kwargs) {
         Value key = PopKwarg(&kwargs, "key", Value::None());
         Value reverse = PopKwarg(&kwargs, "reverse", Value::Bool(false));
         ExpectKwargsConsumed("sort", kwargs);
         ExpectArgs("sort", args, 0, 0);
         // Sort a copy so that the key function sees a consistent list.
         ValueList items = self.AsList().items;
         SortValues(interp, &items, key, Truthy(reverse));
         self.AsList().items = std::move(items);
         return Value::None();
       }},
      {"reverse",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("reverse", kwargs);
         ExpectArgs("reverse", args, 0, 0);
         ValueList& items = self.AsList().items;
         std::reverse(items.begin(), items.end());
         return Value::None();
       }},
      {"copy",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("copy", kwargs);
         ExpectArgs("copy", args, 0, 0);
         return Value::List(self.AsList().items);
       }},
      {"clear",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("clear", kwargs);
         ExpectArgs("clear", args, 0, 0);
         self.AsList().items.clear();
         return Value::None();
       }},
  };
  return methods;
}

const MethodTable& TupleMethods() {
  static const MethodTable methods = {
      {"index",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         return SequenceIndex(self, args, kwargs);
       }},
      {"count",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         return SequenceCount(self, args, kwargs);
       }},
  };
  return methods;
}

const MethodTable& DictMethods() {
  static const MethodTable methods = {
      {"keys",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("keys", kwargs);
         ExpectArgs("keys", args, 0, 0);
         ValueList keys;
         for (const auto& item : self.AsDict().items) {
           keys.push_back(item.first);
         }
         return Value::List(std::move(keys));
       }},
      {"values",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("values", kwargs);
         ExpectArgs("values", args, 0, 0);
         ValueList values;
         for (const auto& item : self.AsDict().items) {
           values.push_back(item.second);
         }
         return Value::List(std::move(values));
       }},
      {"items",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("items", kwargs);
         ExpectArgs("items", args, 0, 0);
         ValueList pairs;
         for (const auto& item : self.AsDict().items) {
           pairs.push_back(Value::Tuple({item.first, item.second}));
         }
         return Value::List(std::move(pairs));
       }},
      {"get",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("get", kwargs);
         ExpectArgs("get", args, 1, 2);
         CheckHashable(args[0]);
         Value* found = self.AsDict().Find(args[0]);
         if (found != nullptr) return *found;
         return args.size() == 2 ? args[1] : Value::None();
       }},
      {"pop",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("pop", kwargs);
         ExpectArgs("pop", args, 1, 2);
         CheckHashable(args[0]);
         auto& items = self.AsDict().items;
         for (auto it = items.begin(); it != items.end(); ++it) {
           if (Equals(it->first, args[0])) {
             Value v = it->second;
             items.erase(it);
             return v;
           }
         }
         if (args.size() == 2) return args[1];
         throw ExecutionError("KeyError", ValueList{args[0]});
       }},
      {"setdefault",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("setdefault", kwargs);
         ExpectArgs("setdefault", args, 1, 2);
         CheckHashable(args[0]);
         Value* found = self.AsDict().Find(args[0]);
         if (found != nullptr) return *found;
         Value fallback = args.size() == 2 ? args[1] : Value::None();
         self.AsDict().Set(args[0], fallback);
         return fallback;
       }},
      {"update",
       [](Interpreter& interp, const Value& self, ValueList& args,
          Kwargs& kwargs) {
         ExpectArgs("update", args, 0, 1);
         DictObject& dict = self.AsDict();
         if (!args.empty()) {
           if (args[0].Is(Value::Type::DICT)) {
             auto pairs = args[0].AsDict().items;
             for (const auto& item : pairs) dict.Set(item.first, item.second);
           } else {
             interp.ForEach(args[0], [&](const Value& pair) {
               ValueList kv = interp.Materialize(pair);
               if (kv.size() != 2) {
                 throw ExecutionError("ValueError",
                                      "dictionary update sequence element "
                                      "has wrong length");
               }
               CheckHashable(kv[0]);
               dict.Set(kv[0], kv[1]);
               return true;
             });
           }
         }
         for (const auto& kw : kwargs) {
           dict.Set(Value::Str(kw.first), kw.second);
         }
         CheckSequenceSize(dict.items.size());
         return Value::None();
       }},
      {"copy",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("copy", kwargs);
         ExpectArgs("copy", args, 0, 0);
         Value copy = Value::Dict();
         copy.AsDict().items = self.AsDict().items;
         return copy;
       }},
      {"clear",
       [](Interpreter&, const Value& self, ValueList& args, Kwargs& kwargs) {
         ExpectNoKwargs("clear", kwargs);
         ExpectArgs("clear", args, 0, 0);
         self.AsDict().items.clear();
         return Value::None();
       }},
  };
  return methods;
}

}  // namespace

bool BindMethod(const Value& self, const std::string& name, Value* out) {
  const MethodTable* table = nullptr;
  switch (self.type()) {
    case Value::Type::STR:
      table = &StrMethods();
      break;
    case Value::Type::LIST:
      table = &ListMethods();
      break;
    case Value::Type::TUPLE:
      table = &TupleMethods();
      break;
    case Value::Type::DICT:
      table = &DictMethods();
      break;
    case Value::Type::SURFACE:
      return BindSurfaceMethod(self, name, out);
    default:
      return false;
  }
  auto it = table->find(name);
  if (it == table->end()) return false;
  Method method = it->second;
  *out = MakeBuiltin(
      name, [self, method](Interpreter& interp, ValueList& args,
                           Kwargs& kwargs) {
        return method(interp, self, args, kwargs);
      });
  return true;
}

void SortValues(Interpreter& interp, ValueList* items, const Value& key,
                bool reverse) {
  ValueList keys;
  if (key.IsNone()) {
    keys = *items;
  } else {
    keys.reserve(items->size());
    for (const Value& v : *items) keys.push_back(interp.Call(key, {v}));
  }
  std::vector<size_t> order(items->size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return reverse ? Compare(keys[b], keys[a]) < 0
                   : Compare(keys[a], keys[b]) < 0;
  });
  ValueList sorted;
  sorted.reserve(items->size());
  for (size_t i : order) sorted.push_back((*items)[i]);
  *items = std::move(sorted);
}

}  // namespace script
