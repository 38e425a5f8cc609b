#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hazmap {

// A fully decoded zone raster.
//
// Layout: RGBA8, row-major (y major), origin at the top-left pixel, so
//   rgba[(y * width + x) * 4 + 3] is the alpha of pixel (x,y).
//
// The buffer is a flat array; per-pixel queries index into it directly.
struct RasterImage {
  int width = 0;
  int height = 0;
  std::vector<std::uint8_t> rgba;

  bool empty() const { return width <= 0 || height <= 0 || rgba.empty(); }

  std::size_t pixelIndex(int x, int y) const
  {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
  }
};

// Default "colored pixel" threshold: a pixel counts as colored iff alpha >= 10.
// Absorbs anti-aliasing fringes without eroding real content.
constexpr std::uint8_t kDefaultAlphaThreshold = 10;

// Allocate a fully transparent raster.
RasterImage MakeTransparentRaster(int width, int height);

// True when the buffer size matches width*height*4 and both dimensions are positive.
bool IsValidRaster(const RasterImage& img);

// Alpha of pixel (x,y). Out-of-range coordinates are transparent (0).
std::uint8_t AlphaAt(const RasterImage& img, int x, int y);

inline bool IsColored(const RasterImage& img, int x, int y, std::uint8_t threshold = kDefaultAlphaThreshold)
{
  return AlphaAt(img, x, y) >= threshold;
}

// Write an RGBA value (ignored when out of range).
void SetPixel(RasterImage& img, int x, int y, std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a);

// Fill the inclusive pixel rectangle [x0,x1] x [y0,y1] (clipped to the image).
void FillRect(RasterImage& img, int x0, int y0, int x1, int y1, std::uint8_t r, std::uint8_t g, std::uint8_t b,
              std::uint8_t a);

// Row-major boolean mask (1 = colored) of size width*height.
std::vector<std::uint8_t> BuildColoredMask(const RasterImage& img, std::uint8_t threshold = kDefaultAlphaThreshold);

// Number of colored pixels.
std::size_t CountColoredPixels(const RasterImage& img, std::uint8_t threshold = kDefaultAlphaThreshold);

} // namespace hazmap
