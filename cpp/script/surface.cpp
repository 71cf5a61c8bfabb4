#include "script/surface.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <new>
#include <stdexcept>

#include <zlib.h>

#include "script/error.hpp"
#include "script/interpreter.hpp"
#include "script/native.hpp"
#include "script/ops.hpp"
#include "script/output.hpp"

namespace script {

namespace {

// Coordinates further than this from the origin are rejected, which keeps
// the cost of every drawing call bounded.
static const constexpr int64_t kMaxCoordinate = 1 << 16;

const std::map<std::string, Color>& ColorNames() {
  static const std::map<std::string, Color> names = {
      {"black", {0, 0, 0, 255}},       {"white", {255, 255, 255, 255}},
      {"red", {255, 0, 0, 255}},       {"green", {0, 255, 0, 255}},
      {"blue", {0, 0, 255, 255}},      {"yellow", {255, 255, 0, 255}},
      {"cyan", {0, 255, 255, 255}},    {"magenta", {255, 0, 255, 255}},
      {"gray", {128, 128, 128, 255}},  {"grey", {128, 128, 128, 255}},
      {"orange", {255, 165, 0, 255}},  {"purple", {128, 0, 128, 255}},
      {"pink", {255, 192, 203, 255}},  {"brown", {165, 42, 42, 255}},
      {"transparent", {0, 0, 0, 0}}};
  return names;
}

int64_t ToCoordinate(const Value& v) {
  double d = ToFloat(v, "coordinates");
  if (!(std::fabs(d) <= kMaxCoordinate)) {
    throw ExecutionError("ValueError", "coordinate out of range");
  }
  return static_cast<int64_t>(d);
}

// Reads an (x, y) pair.
void ToPoint(Interpreter& interp, const Value& v, int64_t* x, int64_t* y) {
  if (!v.IsSequence()) {
    throw ExecutionError("TypeError", "point must be a pair of numbers");
  }
  ValueList items = interp.Materialize(v);
  if (items.size() != 2) {
    throw ExecutionError("TypeError", "point must be a pair of numbers");
  }
  *x = ToCoordinate(items[0]);
  *y = ToCoordinate(items[1]);
}

void AppendBE32(std::string* out, uint32_t v) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    *out += static_cast<char>((v >> shift) & 0xFF);
  }
}

void AppendChunk(std::string* out, const char* type, const std::string& data) {
  AppendBE32(out, data.size());
  size_t start = out->size();
  *out += type;
  *out += data;
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(out->data() + start),
              out->size() - start);
  AppendBE32(out, static_cast<uint32_t>(crc));
}

// Compresses the scanlines into the zlib stream that IDAT holds.
std::string Deflate(const std::string& raw) {
  uLongf size = compressBound(raw.size());
  std::string out(size, '\0');
  int status = compress2(reinterpret_cast<Bytef*>(&out[0]), &size,
                         reinterpret_cast<const Bytef*>(raw.data()),
                         raw.size(), Z_DEFAULT_COMPRESSION);
  if (status == Z_MEM_ERROR) throw std::bad_alloc();
  if (status != Z_OK) {
    throw std::runtime_error("compress2 failed: " + std::to_string(status));
  }
  out.resize(size);
  return out;
}

Surface& SelfSurface(const Value& self) { return self.As<Surface>(); }

Surface& ExpectSurface(const std::string& fn, const Value& v) {
  if (!v.Is(Value::Type::SURFACE)) {
    throw ExecutionError("TypeError", fn + "() argument 1 must be Surface, "
                                           "not " +
                                           v.TypeName());
  }
  return v.As<Surface>();
}

Value ColorTuple(Color c) {
  return Value::Tuple({Value::Int(c.r), Value::Int(c.g), Value::Int(c.b),
                       Value::Int(c.a)});
}

}  // namespace

Color ToColor(Interpreter& interp, const Value& v) {
  if (v.Is(Value::Type::STR)) {
    auto it = ColorNames().find(v.AsStr());
    if (it == ColorNames().end()) {
      throw ExecutionError("ValueError", "unknown color name '" + v.AsStr() +
                                             "'");
    }
    return it->second;
  }
  if (!v.IsSequence()) {
    throw ExecutionError("TypeError", "invalid color argument");
  }
  ValueList items = interp.Materialize(v);
  if (items.size() != 3 && items.size() != 4) {
    throw ExecutionError("ValueError", "invalid color argument");
  }
  uint8_t channels[4] = {0, 0, 0, 255};
  for (size_t i = 0; i < items.size(); i++) {
    int64_t c = ToInt(items[i], "color components");
    if (c < 0 || c > 255) {
      throw ExecutionError("ValueError", "invalid color argument");
    }
    channels[i] = static_cast<uint8_t>(c);
  }
  Color color;
  color.r = channels[0];
  color.g = channels[1];
  color.b = channels[2];
  color.a = channels[3];
  return color;
}

Surface::Surface(int64_t width, int64_t height) {
  if (width < 1 || height < 1 || width > kMaxDimension ||
      height > kMaxDimension) {
    throw ExecutionError("ValueError",
                         "surface size must be between 1 and " +
                             std::to_string(kMaxDimension));
  }
  width_ = width;
  height_ = height;
  pixels_.assign(static_cast<size_t>(width) * height * 4, 0);
}

void Surface::Fill(Color color) { FillRect(0, 0, width_, height_, color); }

void Surface::SetAt(int64_t x, int64_t y, Color color) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
  uint8_t* p = &pixels_[(y * width_ + x) * 4];
  p[0] = color.r;
  p[1] = color.g;
  p[2] = color.b;
  p[3] = color.a;
}

Color Surface::GetAt(int64_t x, int64_t y) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) {
    throw ExecutionError("IndexError", "pixel index out of range");
  }
  const uint8_t* p = &pixels_[(y * width_ + x) * 4];
  Color color;
  color.r = p[0];
  color.g = p[1];
  color.b = p[2];
  color.a = p[3];
  return color;
}

void Surface::FillRect(int64_t x, int64_t y, int64_t w, int64_t h,
                       Color color) {
  int64_t x0 = std::max<int64_t>(x, 0);
  int64_t y0 = std::max<int64_t>(y, 0);
  int64_t x1 = std::min<int64_t>(x + w, width_);
  int64_t y1 = std::min<int64_t>(y + h, height_);
  for (int64_t j = y0; j < y1; j++) {
    for (int64_t i = x0; i < x1; i++) SetAt(i, j, color);
  }
}

void Surface::DrawRect(int64_t x, int64_t y, int64_t w, int64_t h,
                       Color color, int64_t width) {
  if (width <= 0 || 2 * width >= w || 2 * width >= h) {
    FillRect(x, y, w, h, color);
    return;
  }
  FillRect(x, y, w, width, color);
  FillRect(x, y + h - width, w, width, color);
  FillRect(x, y + width, width, h - 2 * width, color);
  FillRect(x + w - width, y + width, width, h - 2 * width, color);
}

void Surface::DrawLine(int64_t x0, int64_t y0, int64_t x1, int64_t y1,
                       Color color, int64_t width) {
  if (width < 1) return;
  int64_t dx = std::abs(x1 - x0);
  int64_t dy = -std::abs(y1 - y0);
  int64_t sx = x0 < x1 ? 1 : -1;
  int64_t sy = y0 < y1 ? 1 : -1;
  int64_t err = dx + dy;
  int64_t half = (width - 1) / 2;
  while (true) {
    if (width == 1) {
      SetAt(x0, y0, color);
    } else {
      FillRect(x0 - half, y0 - half, width, width, color);
    }
    if (x0 == x1 && y0 == y1) break;
    int64_t e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x0 += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y0 += sy;
    }
  }
}

void Surface::DrawCircle(int64_t cx, int64_t cy, int64_t radius, Color color,
                         int64_t width) {
  if (radius < 0) return;
  int64_t x0 = std::max<int64_t>(cx - radius, 0);
  int64_t y0 = std::max<int64_t>(cy - radius, 0);
  int64_t x1 = std::min<int64_t>(cx + radius, width_ - 1);
  int64_t y1 = std::min<int64_t>(cy + radius, height_ - 1);
  double outer = static_cast<double>(radius) * radius;
  double inner_radius = width > 0 && width < radius ? radius - width : -1;
  double inner = inner_radius < 0 ? -1 : inner_radius * inner_radius;
  for (int64_t y = y0; y <= y1; y++) {
    for (int64_t x = x0; x <= x1; x++) {
      double ddx = x - cx;
      double ddy = y - cy;
      double d2 = ddx * ddx + ddy * ddy;
      if (d2 <= outer && d2 > inner) SetAt(x, y, color);
    }
  }
}

std::string Surface::EncodePng() const {
  std::string png("\x89PNG\r\n\x1a\n", 8);
  std::string header;
  AppendBE32(&header, width_);
  AppendBE32(&header, height_);
  header += '\x08';  // bit depth
  header += '\x06';  // RGBA
  header += std::string(3, '\0');
  AppendChunk(&png, "IHDR", header);
  std::string raw;
  size_t stride = static_cast<size_t>(width_) * 4;
  raw.reserve((stride + 1) * height_);
  for (int y = 0; y < height_; y++) {
    raw += '\0';  // no filter
    raw.append(reinterpret_cast<const char*>(&pixels_[y * stride]), stride);
  }
  AppendChunk(&png, "IDAT", Deflate(raw));
  AppendChunk(&png, "IEND", "");
  return png;
}

bool BindSurfaceMethod(const Value& self, const std::string& name,
                       Value* out) {
  NativeFn fn;
  if (name == "fill") {
    fn = [self](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
      ExpectNoKwargs("fill", kwargs);
      ExpectArgs("fill", args, 1, 1);
      SelfSurface(self).Fill(ToColor(interp, args[0]));
      return Value::None();
    };
  } else if (name == "set_at") {
    fn = [self](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
      ExpectNoKwargs("set_at", kwargs);
      ExpectArgs("set_at", args, 2, 2);
      int64_t x, y;
      ToPoint(interp, args[0], &x, &y);
      SelfSurface(self).SetAt(x, y, ToColor(interp, args[1]));
      return Value::None();
    };
  } else if (name == "get_at") {
    fn = [self](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
      ExpectNoKwargs("get_at", kwargs);
      ExpectArgs("get_at", args, 1, 1);
      int64_t x, y;
      ToPoint(interp, args[0], &x, &y);
      return ColorTuple(SelfSurface(self).GetAt(x, y));
    };
  } else if (name == "get_width" || name == "get_height" ||
             name == "get_size") {
    fn = [self, name](Interpreter&, ValueList& args, Kwargs& kwargs) {
      ExpectNoKwargs(name, kwargs);
      ExpectArgs(name, args, 0, 0);
      const Surface& s = SelfSurface(self);
      if (name == "get_width") return Value::Int(s.Width());
      if (name == "get_height") return Value::Int(s.Height());
      return Value::Tuple({Value::Int(s.Width()), Value::Int(s.Height())});
    };
  } else {
    return false;
  }
  *out = MakeBuiltin(name, std::move(fn));
  return true;
}

Value MakeDrawModule() {
  auto module = std::make_shared<ModuleObject>("draw", "drawing surfaces");
  auto& m = module->members;

  m["Surface"] = MakeBuiltin(
      "Surface", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        ExpectNoKwargs("Surface", kwargs);
        ExpectArgs("Surface", args, 1, 2);
        int64_t w, h;
        if (args.size() == 1) {
          ValueList size = interp.Materialize(args[0]);
          if (size.size() != 2) {
            throw ExecutionError("TypeError", "size must be two numbers");
          }
          w = ToInt(size[0], "sizes");
          h = ToInt(size[1], "sizes");
        } else {
          w = ToInt(args[0], "sizes");
          h = ToInt(args[1], "sizes");
        }
        auto surface = std::make_shared<Surface>(w, h);
        interp.Output().TrackSurface(surface);
        return Value::FromObject(Value::Type::SURFACE, std::move(surface));
      });

  m["rect"] = MakeBuiltin(
      "rect", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        Value width = PopKwarg(&kwargs, "width", Value::Int(0));
        ExpectKwargsConsumed("rect", kwargs);
        ExpectArgs("rect", args, 3, 4);
        if (args.size() == 4) width = args[3];
        Surface& s = ExpectSurface("rect", args[0]);
        Color color = ToColor(interp, args[1]);
        ValueList r = interp.Materialize(args[2]);
        if (r.size() != 4) {
          throw ExecutionError("TypeError", "rect must be (x, y, w, h)");
        }
        s.DrawRect(ToCoordinate(r[0]), ToCoordinate(r[1]), ToCoordinate(r[2]),
                   ToCoordinate(r[3]), color, ToCoordinate(width));
        return Value::None();
      });

  m["line"] = MakeBuiltin(
      "line", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        Value width = PopKwarg(&kwargs, "width", Value::Int(1));
        ExpectKwargsConsumed("line", kwargs);
        ExpectArgs("line", args, 4, 5);
        if (args.size() == 5) width = args[4];
        Surface& s = ExpectSurface("line", args[0]);
        Color color = ToColor(interp, args[1]);
        int64_t x0, y0, x1, y1;
        ToPoint(interp, args[2], &x0, &y0);
        ToPoint(interp, args[3], &x1, &y1);
        s.DrawLine(x0, y0, x1, y1, color, ToCoordinate(width));
        return Value::None();
      });

  m["circle"] = MakeBuiltin(
      "circle", [](Interpreter& interp, ValueList& args, Kwargs& kwargs) {
        Value width = PopKwarg(&kwargs, "width", Value::Int(0));
        ExpectKwargsConsumed("circle", kwargs);
        ExpectArgs("circle", args, 4, 5);
        if (args.size() == 5) width = args[4];
        Surface& s = ExpectSurface("circle", args[0]);
        Color color = ToColor(interp, args[1]);
        int64_t cx, cy;
        ToPoint(interp, args[2], &cx, &cy);
        s.DrawCircle(cx, cy, ToCoordinate(args[3]), color,
                     ToCoordinate(width));
        return Value::None();
      });

  return Value::FromObject(Value::Type::MODULE, std::move(module));
}

}  // namespace script
