#pragma once

#include "hazmap/Raster.hpp"
#include "hazmap/Types.hpp"

#include <cstdint>
#include <optional>

namespace hazmap {

// Tight rectangle enclosing every colored pixel of a raster.
//
// Pixel extents are inclusive. The normalized rectangle covers whole pixels:
//   minX = minPx / W
//   maxX = (maxPx + 1) / W
// (likewise for Y), so a fully opaque raster yields [0,1] x [0,1].
struct ContentBounds {
  NormalizedRect rect;

  int minPx = 0;
  int minPy = 0;
  int maxPx = 0;
  int maxPy = 0;

  int imageWidth = 0;
  int imageHeight = 0;

  bool coversWholeImage() const
  {
    return minPx == 0 && minPy == 0 && maxPx == imageWidth - 1 && maxPy == imageHeight - 1;
  }
};

// Single O(W*H) scan. Returns nullopt when no pixel reaches the threshold
// ("no content"); callers then fall back to full-image bounds.
std::optional<ContentBounds> DetectContentBounds(const RasterImage& img,
                                                 std::uint8_t alphaThreshold = kDefaultAlphaThreshold);

// Geographic rectangle covering only the colored part of a raster drawn over `bounds`.
GeoBounds AdjustBoundsToContent(const GeoBounds& bounds, const NormalizedRect& content);

// Percent insets (0..100) of the transparent padding on each side; used by renderers
// to clip an overlay to its content.
struct ClipInsets {
  double top = 0.0;
  double right = 0.0;
  double bottom = 0.0;
  double left = 0.0;
};

ClipInsets ContentClipInsets(const NormalizedRect& content);

} // namespace hazmap
