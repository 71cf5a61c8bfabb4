#include "sandbox/source.hpp"

#include <cctype>

namespace sandbox {

namespace {
static const constexpr char kFence[] = "```";
static const constexpr size_t kFenceSize = sizeof(kFence) - 1;

bool IsSpace(char c) { return isspace(static_cast<unsigned char>(c)) != 0; }

bool IsLanguageTag(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' &&
        c != '_' && c != '#') {
      return false;
    }
  }
  return true;
}
}  // namespace

std::string NormalizeSource(const std::string& source) {
  size_t begin = 0;
  size_t end = source.size();
  while (begin < end && IsSpace(source[begin])) begin++;
  while (end > begin && IsSpace(source[end - 1])) end--;
  std::string code = source.substr(begin, end - begin);

  if (code.compare(0, kFenceSize, kFence) == 0) {
    code.erase(0, kFenceSize);
    size_t newline = code.find('\n');
    if (newline == 0) {
      code.erase(0, 1);
    } else if (newline != std::string::npos &&
               IsLanguageTag(code.substr(0, newline))) {
      code.erase(0, newline + 1);
    }
    if (code.size() >= kFenceSize &&
        code.compare(code.size() - kFenceSize, kFenceSize, kFence) == 0) {
      code.erase(code.size() - kFenceSize);
    }
  } else if (code.size() >= 2 && code.front() == '`' && code.back() == '`') {
    code = code.substr(1, code.size() - 2);
  }
  return code;
}

}  // namespace sandbox
