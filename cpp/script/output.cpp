#include "script/output.hpp"

#include <algorithm>

#include "script/surface.hpp"

namespace script {

void OutputChannel::Write(const std::string& text) {
  has_writes_ = true;
  text_ += text;
}

void OutputChannel::TrackSurface(const std::shared_ptr<Surface>& surface) {
  auto expired = [](const std::weak_ptr<Surface>& s) { return s.expired(); };
  surfaces_.erase(
      std::remove_if(surfaces_.begin(), surfaces_.end(), expired),
      surfaces_.end());
  surfaces_.push_back(surface);
}

std::vector<std::shared_ptr<Surface>> OutputChannel::LiveSurfaces() const {
  std::vector<std::shared_ptr<Surface>> live;
  for (const auto& weak : surfaces_) {
    std::shared_ptr<Surface> surface = weak.lock();
    if (surface) live.push_back(std::move(surface));
  }
  return live;
}

Completion OutputChannel::Complete(const Value& trailing) const {
  Completion completion;
  completion.has_text = has_writes_ || !trailing.IsNone();
  completion.text = text_;
  if (!trailing.IsNone()) completion.text += Str(trailing);
  std::vector<std::shared_ptr<Surface>> live = LiveSurfaces();
  if (live.size() == 1) completion.image = live[0];
  return completion;
}

}  // namespace script
