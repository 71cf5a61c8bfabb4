#include "script/capabilities.hpp"

#include <algorithm>
#include <set>

namespace script {

const std::vector<Capability>& CapabilityIndex() {
  static const std::vector<Capability> index = {
      // Builtins.
      {"print", "print(*values, sep=' ', end='\\n'): write values to the "
                "output"},
      {"len", "len(obj): number of items of a sequence, dict or range"},
      {"range", "range(stop) / range(start, stop[, step]): integer sequence"},
      {"str", "str(obj=''): text form of an object"},
      {"int", "int(x=0[, base]): convert a number or string to an integer"},
      {"float", "float(x=0.0): convert a number or string to a float"},
      {"bool", "bool(x=False): truth value of an object"},
      {"list", "list(iterable=()): new list"},
      {"tuple", "tuple(iterable=()): new tuple"},
      {"dict", "dict(iterable=(), **kwargs): new dictionary"},
      {"abs", "abs(x): absolute value"},
      {"min", "min(iterable) / min(a, b, ...[, key]): smallest item"},
      {"max", "max(iterable) / max(a, b, ...[, key]): largest item"},
      {"sum", "sum(iterable, start=0): sum of the items"},
      {"round", "round(number[, ndigits]): round half to even"},
      {"sorted", "sorted(iterable, key=None, reverse=False): new sorted list"},
      {"reversed", "reversed(sequence): items in reverse order"},
      {"enumerate", "enumerate(iterable, start=0): (index, item) pairs"},
      {"zip", "zip(*iterables): tuples of items taken in parallel"},
      {"repr", "repr(obj): unambiguous text form of an object"},
      {"chr", "chr(i): one-character string for a code point"},
      {"ord", "ord(c): code point of a one-character string"},
      {"isinstance", "isinstance(obj, type_or_tuple): type check"},
      {"help", "help([obj]): describe an allowed name"},
      {"any", "any(iterable): True if any item is true"},
      {"all", "all(iterable): True if every item is true"},
      {"divmod", "divmod(a, b): (a // b, a % b)"},
      {"pow", "pow(base, exp[, mod]): base ** exp, optionally modulo mod"},
      {"hex", "hex(i): hexadecimal representation of an integer"},
      {"bin", "bin(i): binary representation of an integer"},
      {"map", "map(func, *iterables): list of func applied to the items"},
      {"filter", "filter(func, iterable): items for which func is true"},
      // Exception constructors.
      {"Exception", "base of all exceptions a snippet can raise and catch"},
      {"ArithmeticError", "base of arithmetic errors"},
      {"AssertionError", "failed assert statement"},
      {"AttributeError", "missing attribute"},
      {"ImportError", "import failure"},
      {"IndexError", "sequence index out of range"},
      {"KeyError", "missing dictionary key"},
      {"LookupError", "base of IndexError and KeyError"},
      {"MemoryError", "allocation failure or oversized object"},
      {"NameError", "undefined name"},
      {"OverflowError", "integer result does not fit in 64 bits"},
      {"RecursionError", "too many nested calls"},
      {"RuntimeError", "generic runtime error"},
      {"StopIteration", "iteration is over"},
      {"TypeError", "operation applied to an object of the wrong type"},
      {"ValueError", "argument with the right type but a bad value"},
      {"ZeroDivisionError", "division or modulo by zero"},
      // Modules.
      {"math", "mathematical functions"},
      {"math.pi", "3.141592653589793"},
      {"math.e", "2.718281828459045"},
      {"math.tau", "6.283185307179586"},
      {"math.inf", "positive infinity"},
      {"math.nan", "not a number"},
      {"math.sqrt", "sqrt(x): square root"},
      {"math.pow", "pow(x, y): x raised to y, as a float"},
      {"math.exp", "exp(x): e raised to x"},
      {"math.log", "log(x[, base]): logarithm, natural by default"},
      {"math.log2", "log2(x): base 2 logarithm"},
      {"math.log10", "log10(x): base 10 logarithm"},
      {"math.sin", "sin(x): sine of x radians"},
      {"math.cos", "cos(x): cosine of x radians"},
      {"math.tan", "tan(x): tangent of x radians"},
      {"math.asin", "asin(x): arc sine, in radians"},
      {"math.acos", "acos(x): arc cosine, in radians"},
      {"math.atan", "atan(x): arc tangent, in radians"},
      {"math.atan2", "atan2(y, x): arc tangent of y/x, in radians"},
      {"math.hypot", "hypot(x, y): euclidean norm"},
      {"math.degrees", "degrees(x): radians to degrees"},
      {"math.radians", "radians(x): degrees to radians"},
      {"math.floor", "floor(x): largest integer <= x"},
      {"math.ceil", "ceil(x): smallest integer >= x"},
      {"math.trunc", "trunc(x): x truncated towards zero"},
      {"math.fabs", "fabs(x): absolute value, as a float"},
      {"math.factorial", "factorial(n): n!"},
      {"math.gcd", "gcd(a, b): greatest common divisor"},
      {"math.isfinite", "isfinite(x): neither infinite nor nan"},
      {"math.isinf", "isinf(x): positive or negative infinity"},
      {"math.isnan", "isnan(x): not a number"},
      {"math.isclose", "isclose(a, b, rel_tol=1e-09, abs_tol=0.0)"},
      {"random", "pseudo-random numbers, seeded per run"},
      {"random.random", "random(): float in [0, 1)"},
      {"random.uniform", "uniform(a, b): float between a and b"},
      {"random.randint", "randint(a, b): integer in [a, b]"},
      {"random.randrange", "randrange(start, stop[, step]): random item of "
                           "range(start, stop, step)"},
      {"random.choice", "choice(seq): random item of a sequence"},
      {"random.shuffle", "shuffle(list): shuffle a list in place"},
      {"random.sample", "sample(seq, k): k distinct random items"},
      {"random.seed", "seed(n): reseed the generator"},
      {"string", "common string constants"},
      {"string.ascii_letters", "ascii_lowercase + ascii_uppercase"},
      {"string.ascii_lowercase", "'abcdefghijklmnopqrstuvwxyz'"},
      {"string.ascii_uppercase", "'ABCDEFGHIJKLMNOPQRSTUVWXYZ'"},
      {"string.digits", "'0123456789'"},
      {"string.hexdigits", "'0123456789abcdefABCDEF'"},
      {"string.octdigits", "'01234567'"},
      {"string.punctuation", "ASCII punctuation characters"},
      {"string.whitespace", "ASCII whitespace characters"},
      {"string.printable", "digits, letters, punctuation and whitespace"},
      {"draw", "drawing surfaces; the surface alive at the end is the image "
               "result"},
      {"draw.Surface", "Surface(width, height): transparent RGBA image"},
      {"draw.rect", "rect(surface, color, (x, y, w, h), width=0): rectangle, "
                    "filled when width is 0"},
      {"draw.line", "line(surface, color, start, end, width=1): line segment"},
      {"draw.circle", "circle(surface, color, center, radius, width=0): "
                      "circle, filled when width is 0"},
      // Methods.
      {"Surface.fill", "fill(color): paint the whole surface"},
      {"Surface.set_at", "set_at((x, y), color): paint one pixel"},
      {"Surface.get_at", "get_at((x, y)): (r, g, b, a) of one pixel"},
      {"Surface.get_width", "get_width(): width in pixels"},
      {"Surface.get_height", "get_height(): height in pixels"},
      {"Surface.get_size", "get_size(): (width, height)"},
      {"str.upper", "upper(): uppercase copy"},
      {"str.lower", "lower(): lowercase copy"},
      {"str.title", "title(): titlecased copy"},
      {"str.capitalize", "capitalize(): copy with the first letter uppercase"},
      {"str.strip", "strip([chars]): copy without surrounding whitespace"},
      {"str.lstrip", "lstrip([chars]): copy without leading whitespace"},
      {"str.rstrip", "rstrip([chars]): copy without trailing whitespace"},
      {"str.split", "split(sep=None, maxsplit=-1): list of the words"},
      {"str.splitlines", "splitlines(): list of the lines"},
      {"str.join", "join(iterable): items concatenated with the string"},
      {"str.replace", "replace(old, new[, count]): copy with replacements"},
      {"str.startswith", "startswith(prefix): prefix test"},
      {"str.endswith", "endswith(suffix): suffix test"},
      {"str.find", "find(sub): lowest index of sub, or -1"},
      {"str.index", "index(sub): lowest index of sub"},
      {"str.count", "count(sub): non-overlapping occurrences of sub"},
      {"str.format", "format(*args, **kwargs): replace {} fields"},
      {"str.isdigit", "isdigit(): only decimal digits"},
      {"str.isalpha", "isalpha(): only letters"},
      {"str.isalnum", "isalnum(): only letters and digits"},
      {"str.isspace", "isspace(): only whitespace"},
      {"str.isupper", "isupper(): cased characters are all uppercase"},
      {"str.islower", "islower(): cased characters are all lowercase"},
      {"str.center", "center(width[, fill]): centered copy"},
      {"str.ljust", "ljust(width[, fill]): left-justified copy"},
      {"str.rjust", "rjust(width[, fill]): right-justified copy"},
      {"str.zfill", "zfill(width): copy padded with zeros"},
      {"list.append", "append(x): add x at the end"},
      {"list.extend", "extend(iterable): add the items at the end"},
      {"list.insert", "insert(i, x): insert x before position i"},
      {"list.pop", "pop([i]): remove and return the item at i (last)"},
      {"list.remove", "remove(x): remove the first item equal to x"},
      {"list.index", "index(x): position of the first item equal to x"},
      {"list.count", "count(x): number of items equal to x"},
      {"list.sort", "sort(key=None, reverse=False): sort in place"},
      {"list.reverse", "reverse(): reverse in place"},
      {"list.copy", "copy(): shallow copy"},
      {"list.clear", "clear(): remove all items"},
      {"tuple.index", "index(x): position of the first item equal to x"},
      {"tuple.count", "count(x): number of items equal to x"},
      {"dict.keys", "keys(): list of the keys"},
      {"dict.values", "values(): list of the values"},
      {"dict.items", "items(): list of (key, value) pairs"},
      {"dict.get", "get(key, default=None): value for key, or default"},
      {"dict.pop", "pop(key[, default]): remove key and return its value"},
      {"dict.setdefault", "setdefault(key, default=None): get, inserting "
                          "default if missing"},
      {"dict.update", "update(other): copy the pairs of other"},
      {"dict.copy", "copy(): shallow copy"},
      {"dict.clear", "clear(): remove all pairs"},
  };
  return index;
}

const Capability* FindCapability(const std::string& name) {
  for (const Capability& c : CapabilityIndex()) {
    if (c.name == name) return &c;
  }
  return nullptr;
}

bool IsDeniedName(const std::string& name) {
  static const std::set<std::string> denied = {
      "open",     "exec",     "eval",       "compile", "__import__",
      "globals",  "locals",   "vars",       "getattr", "setattr",
      "delattr",  "input",    "exit",       "quit",    "breakpoint",
      "type",     "object",   "memoryview", "dir",     "id",
      "hasattr",  "__builtins__", "classmethod", "staticmethod",
      "property", "super"};
  if (denied.count(name)) return true;
  return name.size() > 4 && name.compare(0, 2, "__") == 0 &&
         name.compare(name.size() - 2, 2, "__") == 0;
}

const std::vector<std::string>& AllowedModules() {
  static const std::vector<std::string> modules = {"math", "random", "string",
                                                   "draw"};
  return modules;
}

bool IsAllowedModule(const std::string& name) {
  const auto& modules = AllowedModules();
  return std::find(modules.begin(), modules.end(), name) != modules.end();
}

}  // namespace script
