#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <string>

#include <kj/string.h>

namespace util {

std::function<bool()> setBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
std::function<bool(kj::StringPtr)> setInt(int& var);
std::function<bool(kj::StringPtr)> setUint(uint32_t& var);

// Appends the UTF-8 encoding of a code point.
void AppendUtf8(std::string* out, uint32_t code_point);

// Returns the longest prefix of s made of at most max_chars code points.
// Sets *truncated when something was cut.
std::string TruncateUtf8(const std::string& s, size_t max_chars,
                         bool* truncated = nullptr);

}  // namespace util
#endif
