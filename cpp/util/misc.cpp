#include "util/misc.hpp"

#include <stdexcept>

namespace util {

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p.cStr();
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int& var) {
  return [&var](kj::StringPtr p) {
    try {
      var = std::stoi(std::string(p.cStr()));
    } catch (const std::logic_error&) {
      return false;
    }
    return true;
  };
};

std::function<bool(kj::StringPtr)> setUint(uint32_t& var) {
  return [&var](kj::StringPtr p) {
    try {
      long long value = std::stoll(std::string(p.cStr()));
      if (value < 0 || value > UINT32_MAX) return false;
      var = static_cast<uint32_t>(value);
    } catch (const std::logic_error&) {
      return false;
    }
    return true;
  };
};

void AppendUtf8(std::string* out, uint32_t code_point) {
  if (code_point < 0x80) {
    *out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    *out += static_cast<char>(0xC0 | (code_point >> 6));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    *out += static_cast<char>(0xE0 | (code_point >> 12));
    *out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    *out += static_cast<char>(0xF0 | (code_point >> 18));
    *out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    *out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

std::string TruncateUtf8(const std::string& s, size_t max_chars,
                         bool* truncated) {
  size_t chars = 0;
  for (size_t i = 0; i < s.size(); i++) {
    // Continuation bytes belong to the previous code point.
    if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
    if (chars++ == max_chars) {
      if (truncated != nullptr) *truncated = true;
      return s.substr(0, i);
    }
  }
  if (truncated != nullptr) *truncated = false;
  return s;
}

}  // namespace util
