#ifndef SCRIPT_OUTPUT_HPP
#define SCRIPT_OUTPUT_HPP

#include <memory>
#include <string>
#include <vector>

#include "script/value.hpp"

namespace script {

class Surface;

// What a completed snippet produced.
struct Completion {
  bool has_text = false;
  std::string text;
  // Set only if exactly one surface was alive at completion.
  std::shared_ptr<Surface> image;
};

// Append-only sink for everything a snippet prints, plus the registry of the
// surfaces it created.
class OutputChannel {
 public:
  OutputChannel() = default;
  OutputChannel(const OutputChannel&) = delete;
  OutputChannel& operator=(const OutputChannel&) = delete;

  void Write(const std::string& text);

  bool HasWrites() const { return has_writes_; }
  const std::string& Text() const { return text_; }

  void TrackSurface(const std::shared_ptr<Surface>& surface);
  std::vector<std::shared_ptr<Surface>> LiveSurfaces() const;

  // Text is absent if nothing was written and there is no trailing value;
  // otherwise it is the writes followed by str(trailing).
  Completion Complete(const Value& trailing) const;

 private:
  std::string text_;
  bool has_writes_ = false;
  std::vector<std::weak_ptr<Surface>> surfaces_;
};

}  // namespace script

#endif
