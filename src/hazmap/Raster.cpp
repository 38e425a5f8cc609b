#include "hazmap/Raster.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace hazmap {

RasterImage MakeTransparentRaster(int width, int height)
{
  RasterImage img;
  if (width <= 0 || height <= 0) return img;
  img.width = width;
  img.height = height;
  img.rgba.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u, 0u);
  return img;
}

bool IsValidRaster(const RasterImage& img)
{
  if (img.width <= 0 || img.height <= 0) return false;
  const std::size_t expected = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.height) * 4u;
  return img.rgba.size() == expected;
}

std::uint8_t AlphaAt(const RasterImage& img, int x, int y)
{
  if (x < 0 || y < 0 || x >= img.width || y >= img.height) return 0;
  const std::size_t idx = img.pixelIndex(x, y) * 4u + 3u;
  if (idx >= img.rgba.size()) return 0;
  return img.rgba[idx];
}

void SetPixel(RasterImage& img, int x, int y, std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a)
{
  if (x < 0 || y < 0 || x >= img.width || y >= img.height) return;
  const std::size_t idx = img.pixelIndex(x, y) * 4u;
  if (idx + 3 >= img.rgba.size()) return;
  img.rgba[idx + 0] = r;
  img.rgba[idx + 1] = g;
  img.rgba[idx + 2] = b;
  img.rgba[idx + 3] = a;
}

void FillRect(RasterImage& img, int x0, int y0, int x1, int y1, std::uint8_t r, std::uint8_t g, std::uint8_t b,
              std::uint8_t a)
{
  if (x0 > x1) std::swap(x0, x1);
  if (y0 > y1) std::swap(y0, y1);
  x0 = std::max(x0, 0);
  y0 = std::max(y0, 0);
  x1 = std::min(x1, img.width - 1);
  y1 = std::min(y1, img.height - 1);
  for (int y = y0; y <= y1; ++y) {
    for (int x = x0; x <= x1; ++x) SetPixel(img, x, y, r, g, b, a);
  }
}

std::vector<std::uint8_t> BuildColoredMask(const RasterImage& img, std::uint8_t threshold)
{
  std::vector<std::uint8_t> mask;
  if (!IsValidRaster(img)) return mask;

  const std::size_t n = static_cast<std::size_t>(img.width) * static_cast<std::size_t>(img.height);
  mask.resize(n, 0u);
  for (std::size_t i = 0; i < n; ++i) {
    mask[i] = (img.rgba[i * 4u + 3u] >= threshold) ? 1u : 0u;
  }
  return mask;
}

std::size_t CountColoredPixels(const RasterImage& img, std::uint8_t threshold)
{
  if (!IsValidRaster(img)) return 0;
  std::size_t count = 0;
  for (std::size_t i = 3; i < img.rgba.size(); i += 4) {
    if (img.rgba[i] >= threshold) ++count;
  }
  return count;
}

} // namespace hazmap
