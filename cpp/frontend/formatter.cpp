#include "frontend/formatter.hpp"

#include <iomanip>
#include <sstream>

#include <kj/debug.h>

#include "util/flags.hpp"
#include "util/misc.hpp"

namespace frontend {

namespace {
static const constexpr char kFence[] = "```";
// Zero width spaces around every backtick.
static const constexpr char kBrokenFence[] =
    "\xE2\x80\x8B`\xE2\x80\x8B`\xE2\x80\x8B`\xE2\x80\x8B";
static const constexpr char kCutMarker[] = " ...";

size_t CountChars(const std::string& s) {
  size_t chars = 0;
  for (char c : s) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) chars++;
  }
  return chars;
}

std::string Join(const std::vector<std::string>& pieces,
                 const std::string& separator) {
  std::string joined;
  for (size_t i = 0; i < pieces.size(); i++) {
    if (i) joined += separator;
    joined += pieces[i];
  }
  return joined;
}

std::string Block(const std::string& text, bool cut) {
  return CodeBlock(NeutralizeFences(text.empty() ? " " : text),
                   kMaxBlockChars, cut);
}
}  // namespace

std::string NeutralizeFences(const std::string& text) {
  std::string out;
  size_t pos = 0;
  while (true) {
    size_t next = text.find(kFence, pos);
    if (next == std::string::npos) break;
    out.append(text, pos, next - pos);
    out += kBrokenFence;
    pos = next + sizeof(kFence) - 1;
  }
  out.append(text, pos, std::string::npos);
  return out;
}

std::string CodeBlock(const std::string& text, size_t max_chars, bool cut) {
  const std::string open = std::string(kFence) + "\n";
  size_t overhead = CountChars(open) + CountChars(kFence);
  KJ_REQUIRE(max_chars > overhead + CountChars(kCutMarker), max_chars,
             "Code block too small");
  if (!cut && CountChars(text) + overhead <= max_chars) {
    return open + text + kFence;
  }
  size_t keep = max_chars - overhead - CountChars(kCutMarker);
  return open + util::TruncateUtf8(text, keep) + kCutMarker + kFence;
}

Message Render(const sandbox::SandboxResult& result) {
  Message message;
  if (result.HasException()) {
    message.title = "An exception occured!";
    message.body = Block(
        result.exception.kind + ": " + Join(result.exception.args, ", "),
        false);
    return message;
  }
  message.title = "Returned text (code executed in " +
                  FormatTime(result.duration_nanos / 1e9) + "):";
  message.body = Block(result.has_text ? result.text : "",
                       result.text_truncated);
  if (result.image_too_large) {
    message.notice = "Image cannot be sent: the image file size is >" +
                     FormatBytes(Flags::max_artifact_bytes);
  }
  return message;
}

std::string FormatTime(double seconds, int decimal_places) {
  static const std::pair<double, const char*> units[] = {
      {1.0, "s"},    {1e-03, "ms"}, {1e-06, "\xCE\xBCs"},
      {1e-09, "ns"}, {1e-12, "ps"}, {1e-15, "fs"},
      {1e-18, "as"}, {1e-21, "zs"}, {1e-24, "ys"},
  };
  for (const auto& unit : units) {
    if (seconds >= unit.first) {
      std::ostringstream out;
      out << std::fixed << std::setprecision(decimal_places)
          << seconds / unit.first << " " << unit.second;
      return out.str();
    }
  }
  return "very fast";
}

std::string FormatBytes(uint64_t size, int decimal_places) {
  static const std::pair<uint64_t, const char*> units[] = {
      {1ull << 30, "GiB"}, {1ull << 20, "MiB"}, {1ull << 10, "KiB"}};
  for (const auto& unit : units) {
    if (size >= unit.first) {
      if (size % unit.first == 0) {
        return std::to_string(size / unit.first) + " " + unit.second;
      }
      std::ostringstream out;
      out << std::fixed << std::setprecision(decimal_places)
          << static_cast<double>(size) / unit.first << " " << unit.second;
      return out.str();
    }
  }
  return std::to_string(size) + " B";
}

std::vector<std::string> SplitLongMessage(const std::string& text,
                                          size_t page_chars) {
  KJ_REQUIRE(page_chars > 0, "Invalid page size");
  std::vector<std::string> pages;
  std::string page;
  size_t page_size = 0;
  auto flush = [&]() {
    if (page_size == 0) return;
    pages.push_back(page);
    page.clear();
    page_size = 0;
  };
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string::npos) end = text.size();
    std::string line = text.substr(pos, end - pos);
    bool has_newline = end < text.size();
    pos = end + 1;
    if (!has_newline && line.empty()) break;
    if (has_newline) line += '\n';

    size_t line_size = CountChars(line);
    if (page_size + line_size > page_chars) flush();
    // Lines longer than a page are broken anywhere.
    while (line_size > page_chars) {
      std::string head = util::TruncateUtf8(line, page_chars);
      pages.push_back(head);
      line.erase(0, head.size());
      line_size -= page_chars;
    }
    page += line;
    page_size += line_size;
  }
  flush();
  return pages;
}

ArtifactFile::ArtifactFile(const std::string& directory,
                           const sandbox::Artifact& image) {
  if (image.png.size() > Flags::max_artifact_bytes) {
    KJ_LOG(WARNING, "Artifact too large, not written", image.png.size(),
           Flags::max_artifact_bytes);
    return;
  }
  file_.reset(new util::TempFile(directory, ".png"));
  auto data = reinterpret_cast<const kj::byte*>(image.png.data());  // NOLINT
  file_->Write(kj::arrayPtr(data, image.png.size()));
}

}  // namespace frontend
