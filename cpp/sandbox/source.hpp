#ifndef SANDBOX_SOURCE_HPP
#define SANDBOX_SOURCE_HPP

#include <string>

namespace sandbox {

// Strips the markup a snippet is usually wrapped in: surrounding
// whitespace, a ``` fence with an optional language tag, or a single pair
// of inline backticks. The content of a fenced block is kept verbatim.
std::string NormalizeSource(const std::string& source);

}  // namespace sandbox

#endif
