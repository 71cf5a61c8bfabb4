#ifndef SCRIPT_SURFACE_HPP
#define SCRIPT_SURFACE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "script/value.hpp"

namespace script {

struct Color {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  uint8_t a = 255;
};

// Parses (r, g, b), (r, g, b, a) or a colour name.
Color ToColor(Interpreter& interp, const Value& v);

// An RGBA image a snippet draws on. The one left alive when the snippet
// completes becomes the image of the result.
class Surface : public Object {
 public:
  static const constexpr int kMaxDimension = 4096;

  // Throws ValueError for sizes outside [1, kMaxDimension].
  Surface(int64_t width, int64_t height);

  int Width() const { return width_; }
  int Height() const { return height_; }

  void Fill(Color color);
  // Pixels outside the surface are ignored.
  void SetAt(int64_t x, int64_t y, Color color);
  // Throws IndexError for pixels outside the surface.
  Color GetAt(int64_t x, int64_t y) const;

  void FillRect(int64_t x, int64_t y, int64_t w, int64_t h, Color color);
  void DrawRect(int64_t x, int64_t y, int64_t w, int64_t h, Color color,
                int64_t width);
  void DrawLine(int64_t x0, int64_t y0, int64_t x1, int64_t y1, Color color,
                int64_t width);
  void DrawCircle(int64_t cx, int64_t cy, int64_t radius, Color color,
                  int64_t width);

  // 8-bit RGBA PNG, deflated by zlib.
  std::string EncodePng() const;

 private:
  int width_;
  int height_;
  std::vector<uint8_t> pixels_;
};

// Looks up a method of a surface value, bound to it.
bool BindSurfaceMethod(const Value& self, const std::string& name,
                       Value* out);

// The "draw" module.
Value MakeDrawModule();

}  // namespace script

#endif
