#include "hazmap/Perimeter.hpp"

#include "hazmap/CoordMapper.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace hazmap {

namespace {

// Cells are at least this many pixels wide so the grid stays small for large rasters.
constexpr int kMinGridCell = 8;

inline std::int64_t DistSq(const IPoint& a, const IPoint& b)
{
  const std::int64_t dx = static_cast<std::int64_t>(a.x) - b.x;
  const std::int64_t dy = static_cast<std::int64_t>(a.y) - b.y;
  return dx * dx + dy * dy;
}

// Uniform bucket grid over the bounding box of a point set. Buckets hold indices into
// the caller's point array.
class PointGrid {
public:
  PointGrid(const std::vector<IPoint>& pts, int cell) : m_cell(std::max(1, cell))
  {
    if (pts.empty()) return;
    m_minX = m_maxX = pts[0].x;
    m_minY = m_maxY = pts[0].y;
    for (const IPoint& p : pts) {
      m_minX = std::min(m_minX, p.x);
      m_maxX = std::max(m_maxX, p.x);
      m_minY = std::min(m_minY, p.y);
      m_maxY = std::max(m_maxY, p.y);
    }
    m_w = (m_maxX - m_minX) / m_cell + 1;
    m_h = (m_maxY - m_minY) / m_cell + 1;
    m_buckets.resize(static_cast<std::size_t>(m_w) * static_cast<std::size_t>(m_h));
  }

  int cell() const { return m_cell; }
  int width() const { return m_w; }
  int height() const { return m_h; }

  int cellX(int x) const { return (x - m_minX) / m_cell; }
  int cellY(int y) const { return (y - m_minY) / m_cell; }

  std::vector<int>& bucket(int cx, int cy)
  {
    return m_buckets[static_cast<std::size_t>(cy) * static_cast<std::size_t>(m_w) + static_cast<std::size_t>(cx)];
  }

  void insert(const IPoint& p, int idx) { bucket(cellX(p.x), cellY(p.y)).push_back(idx); }

  void erase(const IPoint& p, int idx)
  {
    std::vector<int>& b = bucket(cellX(p.x), cellY(p.y));
    for (std::size_t i = 0; i < b.size(); ++i) {
      if (b[i] == idx) {
        b[i] = b.back();
        b.pop_back();
        return;
      }
    }
  }

private:
  int m_cell = 1;
  int m_minX = 0;
  int m_minY = 0;
  int m_maxX = 0;
  int m_maxY = 0;
  int m_w = 0;
  int m_h = 0;
  std::vector<std::vector<int>> m_buckets;
};

template <typename P>
inline PixelPoint ToPixel(const P& p)
{
  return PixelPoint{static_cast<double>(p.x), static_cast<double>(p.y)};
}

// Iterative form of the recursive split: same kept set, no recursion depth limit.
template <typename P>
std::vector<P> SimplifyDouglasPeuckerImpl(const std::vector<P>& in, double tol)
{
  if (in.size() <= 2) return in;

  const int n = static_cast<int>(in.size());
  std::vector<std::uint8_t> keep(static_cast<std::size_t>(n), std::uint8_t{0});
  keep[0] = 1;
  keep[static_cast<std::size_t>(n - 1)] = 1;

  struct Range {
    int a;
    int b;
  };

  std::vector<Range> stack;
  stack.push_back({0, n - 1});

  while (!stack.empty()) {
    const Range r = stack.back();
    stack.pop_back();
    if (r.b <= r.a + 1) continue;

    const PixelPoint a = ToPixel(in[static_cast<std::size_t>(r.a)]);
    const PixelPoint b = ToPixel(in[static_cast<std::size_t>(r.b)]);

    double best = 0.0;
    int bestIdx = -1;
    for (int i = r.a + 1; i < r.b; ++i) {
      const double d = PointToSegmentDistance(ToPixel(in[static_cast<std::size_t>(i)]), a, b);
      if (d > best) {
        best = d;
        bestIdx = i;
      }
    }

    if (bestIdx >= 0 && best > tol) {
      keep[static_cast<std::size_t>(bestIdx)] = 1;
      stack.push_back({r.a, bestIdx});
      stack.push_back({bestIdx, r.b});
    }
  }

  std::vector<P> out;
  out.reserve(in.size());
  for (int i = 0; i < n; ++i) {
    if (keep[static_cast<std::size_t>(i)] != 0) out.push_back(in[static_cast<std::size_t>(i)]);
  }
  return out;
}

} // namespace

std::vector<IPoint> FindEdgePixels(const RasterImage& img, std::uint8_t alphaThreshold)
{
  std::vector<IPoint> out;
  const std::vector<std::uint8_t> mask = BuildColoredMask(img, alphaThreshold);
  if (mask.empty()) return out;

  const int w = img.width;
  const int h = img.height;
  auto colored = [&](int x, int y) -> bool {
    return mask[static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x)] != 0;
  };

  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      if (!colored(x, y)) continue;
      const bool border = (x == 0 || y == 0 || x == w - 1 || y == h - 1);
      if (border || !colored(x, y - 1) || !colored(x + 1, y) || !colored(x, y + 1) || !colored(x - 1, y)) {
        out.push_back(IPoint{x, y});
      }
    }
  }
  return out;
}

std::vector<IPoint> ThinByMinSpacing(const std::vector<IPoint>& pts, double minSpacing)
{
  if (pts.empty() || !(minSpacing > 0.0)) return pts;

  const double spacingSq = minSpacing * minSpacing;

  // Every pair lies within the bounding-box diagonal; a larger spacing keeps the first point only.
  std::int64_t minX = pts[0].x, maxX = pts[0].x, minY = pts[0].y, maxY = pts[0].y;
  for (const IPoint& p : pts) {
    minX = std::min<std::int64_t>(minX, p.x);
    maxX = std::max<std::int64_t>(maxX, p.x);
    minY = std::min<std::int64_t>(minY, p.y);
    maxY = std::max<std::int64_t>(maxY, p.y);
  }
  const double dx = static_cast<double>(maxX - minX);
  const double dy = static_cast<double>(maxY - minY);
  if (dx * dx + dy * dy < spacingSq) return {pts.front()};

  const double cellF = std::min(std::ceil(minSpacing), static_cast<double>(std::numeric_limits<int>::max()));
  const int cell = std::max(kMinGridCell, static_cast<int>(cellF));

  // Kept points only; a candidate within minSpacing of a kept point lies in one of the
  // 3x3 neighboring cells because cell >= minSpacing.
  PointGrid grid(pts, cell);
  std::vector<IPoint> kept;
  kept.reserve(pts.size());

  for (const IPoint& p : pts) {
    const int cx = grid.cellX(p.x);
    const int cy = grid.cellY(p.y);
    bool tooClose = false;
    for (int gy = std::max(0, cy - 1); gy <= std::min(grid.height() - 1, cy + 1) && !tooClose; ++gy) {
      for (int gx = std::max(0, cx - 1); gx <= std::min(grid.width() - 1, cx + 1) && !tooClose; ++gx) {
        for (int idx : grid.bucket(gx, gy)) {
          if (static_cast<double>(DistSq(p, kept[static_cast<std::size_t>(idx)])) < spacingSq) {
            tooClose = true;
            break;
          }
        }
      }
    }
    if (tooClose) continue;
    grid.insert(p, static_cast<int>(kept.size()));
    kept.push_back(p);
  }
  return kept;
}

std::vector<IPoint> OrderByNearestNeighbor(const std::vector<IPoint>& pts, double jumpThreshold,
                                           int jumpMinPathPoints, std::size_t* outJumps)
{
  if (outJumps) *outJumps = 0;
  std::vector<IPoint> path;
  if (pts.empty()) return path;

  const int n = static_cast<int>(pts.size());
  const double jumpSq = jumpThreshold * jumpThreshold;

  PointGrid grid(pts, kMinGridCell);
  for (int i = 1; i < n; ++i) grid.insert(pts[static_cast<std::size_t>(i)], i);

  std::vector<std::uint8_t> visited(static_cast<std::size_t>(n), std::uint8_t{0});
  int firstUnvisited = 1;
  int remaining = n - 1;

  auto visit = [&](int idx) {
    visited[static_cast<std::size_t>(idx)] = 1;
    grid.erase(pts[static_cast<std::size_t>(idx)], idx);
    path.push_back(pts[static_cast<std::size_t>(idx)]);
    --remaining;
  };

  path.reserve(pts.size());
  visited[0] = 1;
  path.push_back(pts[0]);
  IPoint current = pts[0];

  const int maxRing = std::max(grid.width(), grid.height());
  const double cellSize = static_cast<double>(grid.cell());

  while (remaining > 0) {
    // Ring search outward from the current cell. Points in ring r+1 are at least
    // r*cell away, so once the best candidate is closer than that we are done.
    const int cx = grid.cellX(current.x);
    const int cy = grid.cellY(current.y);

    std::int64_t bestDsq = std::numeric_limits<std::int64_t>::max();
    int bestIdx = -1;

    for (int r = 0; r <= maxRing; ++r) {
      const int y0 = cy - r;
      const int y1 = cy + r;
      for (int gy = std::max(0, y0); gy <= std::min(grid.height() - 1, y1); ++gy) {
        const bool fullRow = (gy == y0 || gy == y1);
        const int step = fullRow ? 1 : std::max(1, 2 * r);
        for (int gx = cx - r; gx <= cx + r; gx += step) {
          if (gx < 0 || gx >= grid.width()) continue;
          for (int idx : grid.bucket(gx, gy)) {
            const std::int64_t d = DistSq(current, pts[static_cast<std::size_t>(idx)]);
            if (d < bestDsq || (d == bestDsq && idx < bestIdx)) {
              bestDsq = d;
              bestIdx = idx;
            }
          }
        }
      }

      if (bestIdx >= 0) {
        const double reach = static_cast<double>(r) * cellSize;
        if (static_cast<double>(bestDsq) < reach * reach) break;
      }
    }

    if (bestIdx < 0) break; // unreachable while remaining > 0

    while (firstUnvisited < n && visited[static_cast<std::size_t>(firstUnvisited)] != 0) ++firstUnvisited;

    int next = bestIdx;
    if (static_cast<double>(bestDsq) > jumpSq && static_cast<int>(path.size()) > jumpMinPathPoints) {
      next = firstUnvisited;
      if (outJumps) ++(*outJumps);
    }

    visit(next);
    current = pts[static_cast<std::size_t>(next)];
  }

  return path;
}

double PointToSegmentDistance(const PixelPoint& p, const PixelPoint& a, const PixelPoint& b)
{
  const double vx = b.x - a.x;
  const double vy = b.y - a.y;
  const double lenSq = vx * vx + vy * vy;

  double qx = a.x;
  double qy = a.y;
  if (lenSq != 0.0) {
    const double t = ((p.x - a.x) * vx + (p.y - a.y) * vy) / lenSq;
    if (t > 1.0) {
      qx = b.x;
      qy = b.y;
    } else if (t >= 0.0) {
      qx = a.x + t * vx;
      qy = a.y + t * vy;
    }
  }

  const double dx = p.x - qx;
  const double dy = p.y - qy;
  return std::sqrt(dx * dx + dy * dy);
}

std::vector<PixelPoint> SimplifyDouglasPeucker(const std::vector<PixelPoint>& pts, double tol)
{
  return SimplifyDouglasPeuckerImpl(pts, tol);
}

std::vector<IPoint> SimplifyDouglasPeucker(const std::vector<IPoint>& pts, double tol)
{
  return SimplifyDouglasPeuckerImpl(pts, tol);
}

std::size_t CountDistinctVertices(const std::vector<GeoPoint>& ring)
{
  std::vector<std::pair<double, double>> v;
  v.reserve(ring.size());
  for (const GeoPoint& p : ring) v.emplace_back(p.lat, p.lng);
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
  return v.size();
}

std::optional<std::vector<IPoint>> ExtractPerimeterPixels(const RasterImage& img, const EngineConfig& cfg,
                                                          PerimeterStats* outStats)
{
  PerimeterStats stats;

  const std::vector<IPoint> edges = FindEdgePixels(img, cfg.alphaThresholdU8());
  stats.edgePixels = edges.size();
  if (edges.empty()) {
    if (outStats) *outStats = stats;
    return std::nullopt;
  }

  const std::vector<IPoint> thinned = ThinByMinSpacing(edges, cfg.minPointSpacing);
  stats.thinnedPoints = thinned.size();

  std::vector<IPoint> path = OrderByNearestNeighbor(thinned, cfg.jumpThreshold, cfg.jumpMinPathPoints, &stats.jumps);
  stats.pathSegments = stats.jumps + 1;

  if (static_cast<long long>(path.size()) > static_cast<long long>(cfg.simplifyTriggerPoints)) {
    path = SimplifyDouglasPeucker(path, cfg.simplifyTolerance);
    stats.simplified = true;
  }
  stats.simplifiedPoints = path.size();

  if (outStats) *outStats = stats;
  return path;
}

std::optional<std::vector<GeoPoint>> ExtractPerimeter(const RasterImage& img, const GeoBounds& bounds,
                                                      const EngineConfig& cfg, PerimeterStats* outStats)
{
  PerimeterStats stats;
  std::optional<std::vector<IPoint>> pixels = ExtractPerimeterPixels(img, cfg, &stats);
  if (!pixels) {
    if (outStats) *outStats = stats;
    return std::nullopt;
  }

  std::vector<GeoPoint> ring = PixelsToGeo(*pixels, img.width, img.height, bounds);
  CloseRing(ring);
  stats.ringVertices = ring.size();
  if (outStats) *outStats = stats;

  if (CountDistinctVertices(ring) < 3) return std::nullopt;
  return ring;
}

} // namespace hazmap
