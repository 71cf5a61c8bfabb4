#ifndef FRONTEND_FORMATTER_HPP
#define FRONTEND_FORMATTER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sandbox/result.hpp"
#include "util/file.hpp"

namespace frontend {

static const constexpr size_t kMaxBlockChars = 2048;
static const constexpr size_t kMaxMessageChars = 2000;

// A titled message, as shown to the author of a snippet.
struct Message {
  std::string title;
  std::string body;
  // Set when something the snippet produced could not be shown.
  std::string notice;
};

// Renders the outcome of a run: the returned text on success, the kind
// and arguments of the exception otherwise.
Message Render(const sandbox::SandboxResult& result);

// Breaks every ``` in text so that it cannot close a code block.
std::string NeutralizeFences(const std::string& text);

// Wraps text in a code block of at most max_chars characters, fences
// included. Longer text is cut and marked with " ...", as is text already
// cut elsewhere when cut is set.
std::string CodeBlock(const std::string& text,
                      size_t max_chars = kMaxBlockChars, bool cut = false);

// Formats a duration with the largest fitting unit among s, ms, μs, ns,
// ps and smaller, e.g. "1.5000 ms".
std::string FormatTime(double seconds, int decimal_places = 4);

// Formats a size in bytes as B, KiB, MiB or GiB. Exact multiples of a
// unit have no decimals.
std::string FormatBytes(uint64_t size, int decimal_places = 3);

// Splits text into pages of at most page_chars characters. Pages break
// after a newline, unless a single line does not fit in a page.
std::vector<std::string> SplitLongMessage(
    const std::string& text, size_t page_chars = kMaxMessageChars);

// Hands the image of a result over through a temporary PNG file, which is
// removed together with this object. Artifacts above the configured size
// are not written, which is reported through TooLarge.
class ArtifactFile {
 public:
  ArtifactFile(const std::string& directory, const sandbox::Artifact& image);

  bool TooLarge() const { return !file_; }
  // Empty if TooLarge.
  std::string Path() const { return file_ ? file_->Path() : ""; }

 private:
  std::unique_ptr<util::TempFile> file_;
};

}  // namespace frontend

#endif
