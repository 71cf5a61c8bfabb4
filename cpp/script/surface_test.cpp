#include "script/surface.hpp"
#include <zlib.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "script/error.hpp"

namespace {

using namespace script;  // NOLINT

Color Rgb(uint8_t r, uint8_t g, uint8_t b) {
  Color c;
  c.r = r;
  c.g = g;
  c.b = b;
  return c;
}

bool Same(Color a, Color b) {
  return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

uint32_t ReadBE32(const std::string& s, size_t pos) {
  uint32_t v = 0;
  for (size_t i = 0; i < 4; i++) {
    v = (v << 8) | static_cast<uint8_t>(s[pos + i]);
  }
  return v;
}

/*
 * Pixels
 */

// NOLINTNEXTLINE
TEST(Surface, StartsTransparent) {
  Surface s(3, 2);
  EXPECT_EQ(s.Width(), 3);
  EXPECT_EQ(s.Height(), 2);
  EXPECT_EQ(s.GetAt(2, 1).a, 0);
}

// NOLINTNEXTLINE
TEST(Surface, InvalidSize) {
  EXPECT_THROW(Surface(0, 10), ExecutionError);
  EXPECT_THROW(Surface(10, -1), ExecutionError);
  EXPECT_THROW(Surface(Surface::kMaxDimension + 1, 1), ExecutionError);
  EXPECT_NO_THROW(Surface(Surface::kMaxDimension, 1));
}

// NOLINTNEXTLINE
TEST(Surface, FillAndSet) {
  Surface s(4, 4);
  s.Fill(Rgb(10, 20, 30));
  s.SetAt(1, 2, Rgb(255, 0, 0));
  EXPECT_TRUE(Same(s.GetAt(0, 0), Rgb(10, 20, 30)));
  EXPECT_TRUE(Same(s.GetAt(1, 2), Rgb(255, 0, 0)));
  // Ignored.
  s.SetAt(-1, 0, Rgb(0, 0, 0));
  s.SetAt(4, 4, Rgb(0, 0, 0));
}

// NOLINTNEXTLINE
TEST(Surface, GetOutsideRaises) {
  Surface s(2, 2);
  try {
    s.GetAt(2, 0);
    FAIL() << "pixel outside the surface";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.Kind(), "IndexError");
  }
}

// NOLINTNEXTLINE
TEST(Surface, FillRectIsClipped) {
  Surface s(4, 4);
  s.FillRect(2, 2, 10, 10, Rgb(0, 255, 0));
  EXPECT_TRUE(Same(s.GetAt(3, 3), Rgb(0, 255, 0)));
  EXPECT_TRUE(Same(s.GetAt(2, 2), Rgb(0, 255, 0)));
  EXPECT_EQ(s.GetAt(1, 1).a, 0);
}

// NOLINTNEXTLINE
TEST(Surface, LineEndpoints) {
  Surface s(10, 10);
  s.DrawLine(0, 0, 9, 9, Rgb(1, 2, 3), 1);
  EXPECT_TRUE(Same(s.GetAt(0, 0), Rgb(1, 2, 3)));
  EXPECT_TRUE(Same(s.GetAt(5, 5), Rgb(1, 2, 3)));
  EXPECT_TRUE(Same(s.GetAt(9, 9), Rgb(1, 2, 3)));
  EXPECT_EQ(s.GetAt(9, 0).a, 0);
}

// NOLINTNEXTLINE
TEST(Surface, FilledCircle) {
  Surface s(21, 21);
  s.DrawCircle(10, 10, 5, Rgb(9, 9, 9), 0);
  EXPECT_TRUE(Same(s.GetAt(10, 10), Rgb(9, 9, 9)));
  EXPECT_TRUE(Same(s.GetAt(12, 10), Rgb(9, 9, 9)));
  EXPECT_EQ(s.GetAt(0, 0).a, 0);
}

/*
 * PNG
 */

// NOLINTNEXTLINE
TEST(Surface, PngHeader) {
  Surface s(300, 7);
  std::string png = s.EncodePng();
  ASSERT_GT(png.size(), 33u);
  EXPECT_EQ(png.substr(0, 8), std::string("\x89PNG\r\n\x1a\n", 8));
  EXPECT_EQ(png.substr(12, 4), "IHDR");
  EXPECT_EQ(ReadBE32(png, 16), 300u);
  EXPECT_EQ(ReadBE32(png, 20), 7u);
  // 8 bits per channel, RGBA.
  EXPECT_EQ(png[24], 8);
  EXPECT_EQ(png[25], 6);
}

// NOLINTNEXTLINE
TEST(Surface, PngTrailer) {
  Surface s(1, 1);
  std::string png = s.EncodePng();
  EXPECT_EQ(png.substr(png.size() - 12),
            std::string("\0\0\0\0IEND\xAE\x42\x60\x82", 12));
}

// NOLINTNEXTLINE
TEST(Surface, PngPixelsInflate) {
  Surface s(3, 2);
  s.SetAt(1, 0, Rgb(10, 20, 30));
  std::string png = s.EncodePng();
  // The image data chunk follows the 8 byte signature and the 25 byte IHDR.
  ASSERT_EQ(png.substr(37, 4), "IDAT");
  uint32_t length = ReadBE32(png, 33);
  ASSERT_LE(41 + length + 4, png.size());
  std::string chunk = png.substr(37, 4 + length);
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(chunk.data()), chunk.size());
  EXPECT_EQ(ReadBE32(png, 41 + length), static_cast<uint32_t>(crc));

  // One filter byte, then four bytes per pixel, on each row.
  std::string raw(2 * (1 + 3 * 4), 'x');
  uLongf raw_size = raw.size();
  ASSERT_EQ(uncompress(reinterpret_cast<Bytef*>(&raw[0]), &raw_size,
                       reinterpret_cast<const Bytef*>(png.data() + 41),
                       length),
            Z_OK);
  ASSERT_EQ(raw_size, raw.size());
  EXPECT_EQ(raw[0], '\0');
  EXPECT_EQ(raw.substr(1 + 4, 4), std::string("\x0a\x14\x1e\xff", 4));
  EXPECT_EQ(raw.substr(1, 4), std::string(4, '\0'));
}

// NOLINTNEXTLINE
TEST(Surface, PngIsCompressed) {
  Surface s(2000, 2000);
  s.Fill(Rgb(1, 2, 3));
  EXPECT_LT(s.EncodePng().size(), 100u * 1024);
}

}  // namespace
