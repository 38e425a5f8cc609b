#include "hazmap/ContentBounds.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace hazmap {

std::optional<ContentBounds> DetectContentBounds(const RasterImage& img, std::uint8_t alphaThreshold)
{
  if (!IsValidRaster(img)) return std::nullopt;

  const int w = img.width;
  const int h = img.height;

  int minX = w;
  int minY = h;
  int maxX = -1;
  int maxY = -1;

  for (int y = 0; y < h; ++y) {
    const std::size_t rowBase = static_cast<std::size_t>(y) * static_cast<std::size_t>(w) * 4u;
    for (int x = 0; x < w; ++x) {
      if (img.rgba[rowBase + static_cast<std::size_t>(x) * 4u + 3u] < alphaThreshold) continue;
      minX = std::min(minX, x);
      maxX = std::max(maxX, x);
      minY = std::min(minY, y);
      maxY = std::max(maxY, y);
    }
  }

  if (maxX < 0) return std::nullopt;

  ContentBounds cb;
  cb.minPx = minX;
  cb.minPy = minY;
  cb.maxPx = maxX;
  cb.maxPy = maxY;
  cb.imageWidth = w;
  cb.imageHeight = h;
  cb.rect.minX = static_cast<double>(minX) / static_cast<double>(w);
  cb.rect.minY = static_cast<double>(minY) / static_cast<double>(h);
  cb.rect.maxX = static_cast<double>(maxX + 1) / static_cast<double>(w);
  cb.rect.maxY = static_cast<double>(maxY + 1) / static_cast<double>(h);
  return cb;
}

GeoBounds AdjustBoundsToContent(const GeoBounds& bounds, const NormalizedRect& content)
{
  const double latRange = bounds.latSpan();
  const double lngRange = bounds.lngSpan();

  GeoBounds out;
  out.west = bounds.west + lngRange * content.minX;
  out.east = bounds.west + lngRange * content.maxX;
  // Image Y grows downward: minY is the northern edge.
  out.north = bounds.north - latRange * content.minY;
  out.south = bounds.north - latRange * content.maxY;
  return out;
}

ClipInsets ContentClipInsets(const NormalizedRect& content)
{
  ClipInsets c;
  c.top = content.minY * 100.0;
  c.right = (1.0 - content.maxX) * 100.0;
  c.bottom = (1.0 - content.maxY) * 100.0;
  c.left = content.minX * 100.0;
  return c;
}

} // namespace hazmap
