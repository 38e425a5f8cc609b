#pragma once

#include "hazmap/EngineConfig.hpp"
#include "hazmap/Raster.hpp"
#include "hazmap/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace hazmap {

// Perimeter extraction: raster -> ordered, simplified, closed geographic ring.
//
// Pipeline:
//   1) FindEdgePixels          colored pixels on the image border or with a non-colored
//                              4-neighbor, in row-major scan order
//   2) ThinByMinSpacing        drop points closer than minPointSpacing to an already kept point
//   3) OrderByNearestNeighbor  greedy path; a long jump (> jumpThreshold px once the path has
//                              more than jumpMinPathPoints points) restarts at the first
//                              unvisited point instead of bridging unrelated blobs
//   4) SimplifyDouglasPeucker  only when the path has more than simplifyTriggerPoints points
//   5) PixelsToGeo + CloseRing
//
// The ordering step is a heuristic, not a contour trace: concave or multi-blob shapes
// may come out mis-ordered. Zone shapes were authored against exactly this behavior.

struct PerimeterStats {
  std::size_t edgePixels = 0;
  std::size_t thinnedPoints = 0;
  std::size_t pathSegments = 0; // 1 + number of jumps
  std::size_t jumps = 0;
  std::size_t simplifiedPoints = 0;
  bool simplified = false;
  std::size_t ringVertices = 0; // including the closing vertex
};

std::vector<IPoint> FindEdgePixels(const RasterImage& img, std::uint8_t alphaThreshold = kDefaultAlphaThreshold);

// First-come thinning. Output preserves input order.
std::vector<IPoint> ThinByMinSpacing(const std::vector<IPoint>& pts, double minSpacing);

// Greedy nearest-neighbor ordering starting at pts[0]. Equal distances resolve to the
// lowest input index. outJumps (optional) receives the number of segment restarts.
std::vector<IPoint> OrderByNearestNeighbor(const std::vector<IPoint>& pts, double jumpThreshold,
                                           int jumpMinPathPoints, std::size_t* outJumps = nullptr);

// Distance from p to the segment [a,b] (clamped to the endpoints; a degenerate
// segment measures to a).
double PointToSegmentDistance(const PixelPoint& p, const PixelPoint& a, const PixelPoint& b);

// Open-polyline Douglas-Peucker. Endpoints are always kept; a point survives when its
// distance to the current chord exceeds tol.
std::vector<PixelPoint> SimplifyDouglasPeucker(const std::vector<PixelPoint>& pts, double tol);
std::vector<IPoint> SimplifyDouglasPeucker(const std::vector<IPoint>& pts, double tol);

// Append the first vertex when the ring is not already closed.
template <typename P>
void CloseRing(std::vector<P>& ring)
{
  if (ring.empty()) return;
  if (!(ring.front() == ring.back())) ring.push_back(ring.front());
}

// Number of distinct vertices of a ring (the closing duplicate is not counted).
std::size_t CountDistinctVertices(const std::vector<GeoPoint>& ring);

// Steps 1-4. Returns nullopt when the raster has no edge pixels.
std::optional<std::vector<IPoint>> ExtractPerimeterPixels(const RasterImage& img, const EngineConfig& cfg = {},
                                                          PerimeterStats* outStats = nullptr);

// Full pipeline. Returns nullopt ("no perimeter") when there are no edge pixels or
// fewer than 3 distinct vertices remain; callers then hit-test against bounds.
std::optional<std::vector<GeoPoint>> ExtractPerimeter(const RasterImage& img, const GeoBounds& bounds,
                                                      const EngineConfig& cfg = {},
                                                      PerimeterStats* outStats = nullptr);

} // namespace hazmap
