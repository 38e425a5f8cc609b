#include "hazmap/BoundsOps.hpp"
#include "hazmap/Checksum.hpp"
#include "hazmap/ConfigIO.hpp"
#include "hazmap/ContentBounds.hpp"
#include "hazmap/CoordMapper.hpp"
#include "hazmap/GeoJsonExport.hpp"
#include "hazmap/Inflate.hpp"
#include "hazmap/Json.hpp"
#include "hazmap/LogTee.hpp"
#include "hazmap/OverlayPipeline.hpp"
#include "hazmap/Perimeter.hpp"
#include "hazmap/Raster.hpp"
#include "hazmap/RasterIO.hpp"
#include "hazmap/Transform.hpp"
#include "hazmap/ZoneCategory.hpp"
#include "hazmap/ZoneRecord.hpp"
#include "hazmap/ZoneStore.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                        \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace hazmap;

fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

std::string ReadWholeFile(const fs::path& p)
{
  std::ifstream f(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

GeoBounds MakeBounds(double south, double west, double north, double east)
{
  GeoBounds b;
  b.south = south;
  b.west = west;
  b.north = north;
  b.east = east;
  return b;
}

ZoneRecord MakeZone(ZoneId id, const std::string& name, const GeoBounds& b)
{
  ZoneRecord r;
  r.id = id;
  r.name = name;
  r.bounds = b;
  return r;
}

// 100x100 raster, opaque square over pixels [25,74] on both axes.
RasterImage MakeCenteredSquareRaster()
{
  RasterImage img = MakeTransparentRaster(100, 100);
  FillRect(img, 25, 25, 74, 74, 255, 105, 180, 255);
  return img;
}

} // namespace

static void TestCoordinateRoundTrip()
{
  const GeoBounds b = MakeBounds(27.7, -97.540496, 27.9, -97.259504);
  const int W = 2550;
  const int H = 1815;

  // Row 0 is the north edge.
  const GeoPoint nw = PixelToGeo(0.0, 0.0, W, H, b);
  EXPECT_NEAR(nw.lat, b.north, 1e-12);
  EXPECT_NEAR(nw.lng, b.west, 1e-12);
  const GeoPoint se = PixelToGeo(W, H, W, H, b);
  EXPECT_NEAR(se.lat, b.south, 1e-12);
  EXPECT_NEAR(se.lng, b.east, 1e-12);

  const double xs[] = {0.0, 1.5, 637.25, 1275.0, 2549.0, 2550.0};
  const double ys[] = {0.0, 0.5, 400.0, 907.5, 1814.0, 1815.0};
  for (double x : xs) {
    for (double y : ys) {
      const GeoPoint g = PixelToGeo(x, y, W, H, b);
      const PixelPoint p = GeoToPixel(g.lat, g.lng, W, H, b);
      EXPECT_NEAR(p.x, x, 1e-6);
      EXPECT_NEAR(p.y, y, 1e-6);
    }
  }

  const PixelPoint n = GeoToNormalized(27.8, -97.4, b);
  const GeoPoint back = NormalizedToGeo(n.x, n.y, b);
  EXPECT_NEAR(back.lat, 27.8, 1e-12);
  EXPECT_NEAR(back.lng, -97.4, 1e-12);

  std::vector<GeoPoint> ring = PixelsToGeo({IPoint{0, 0}, IPoint{W, 0}, IPoint{W, H}}, W, H, b);
  ASSERT_TRUE(ring.size() == 3);
  EXPECT_NEAR(ring[1].lng, b.east, 1e-12);
  EXPECT_NEAR(ring[2].lat, b.south, 1e-12);
  CloseRing(ring);
  EXPECT_EQ(ring.size(), static_cast<std::size_t>(4));
  EXPECT_TRUE(ring.front() == ring.back());
  CloseRing(ring);
  EXPECT_EQ(ring.size(), static_cast<std::size_t>(4));
}

static void TestValidateBoundsRejectsDegenerate()
{
  std::string err;
  EXPECT_TRUE(ValidateBounds(MakeBounds(0, 0, 1, 1), err));
  EXPECT_FALSE(ValidateBounds(MakeBounds(1, 0, 1, 1), err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(ValidateBounds(MakeBounds(0, 2, 1, 1), err));
  EXPECT_FALSE(ValidateBounds(MakeBounds(0, 0, std::nan(""), 1), err));
  EXPECT_FALSE(IsValidBounds(MakeBounds(0, 0, 1, HUGE_VAL)));
}

static void TestRasterSampling()
{
  RasterImage img = MakeTransparentRaster(4, 3);
  EXPECT_TRUE(IsValidRaster(img));
  SetPixel(img, 1, 2, 10, 20, 30, 9);
  SetPixel(img, 3, 0, 10, 20, 30, 10);
  EXPECT_EQ(AlphaAt(img, 1, 2), static_cast<std::uint8_t>(9));
  EXPECT_FALSE(IsColored(img, 1, 2));
  EXPECT_TRUE(IsColored(img, 3, 0));
  EXPECT_EQ(AlphaAt(img, -1, 0), static_cast<std::uint8_t>(0));
  EXPECT_EQ(AlphaAt(img, 4, 0), static_cast<std::uint8_t>(0));
  EXPECT_EQ(CountColoredPixels(img), static_cast<std::size_t>(1));
  EXPECT_EQ(CountColoredPixels(img, 5), static_cast<std::size_t>(2));

  const std::vector<std::uint8_t> mask = BuildColoredMask(img);
  ASSERT_TRUE(mask.size() == 12);
  EXPECT_EQ(mask[3], static_cast<std::uint8_t>(1));
  EXPECT_EQ(mask[2 * 4 + 1], static_cast<std::uint8_t>(0));

  img.rgba.pop_back();
  EXPECT_FALSE(IsValidRaster(img));
}

static void TestContentBoundsCenteredSquare()
{
  const RasterImage img = MakeCenteredSquareRaster();
  const std::optional<ContentBounds> cb = DetectContentBounds(img);
  ASSERT_TRUE(cb.has_value());
  EXPECT_EQ(cb->minPx, 25);
  EXPECT_EQ(cb->maxPx, 74);
  EXPECT_NEAR(cb->rect.minX, 0.25, 0.01);
  EXPECT_NEAR(cb->rect.minY, 0.25, 0.01);
  EXPECT_NEAR(cb->rect.maxX, 0.75, 0.01);
  EXPECT_NEAR(cb->rect.maxY, 0.75, 0.01);
  EXPECT_FALSE(cb->coversWholeImage());

  // Same raster, same answer.
  const std::optional<ContentBounds> again = DetectContentBounds(img);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->rect.minX, cb->rect.minX);
  EXPECT_EQ(again->rect.minY, cb->rect.minY);
  EXPECT_EQ(again->rect.maxX, cb->rect.maxX);
  EXPECT_EQ(again->rect.maxY, cb->rect.maxY);

  const GeoBounds adjusted = AdjustBoundsToContent(MakeBounds(0, 0, 1, 1), cb->rect);
  EXPECT_NEAR(adjusted.west, 0.25, 1e-12);
  EXPECT_NEAR(adjusted.east, 0.75, 1e-12);
  EXPECT_NEAR(adjusted.south, 0.25, 1e-12);
  EXPECT_NEAR(adjusted.north, 0.75, 1e-12);

  const ClipInsets in = ContentClipInsets(cb->rect);
  EXPECT_NEAR(in.top, 25.0, 1e-9);
  EXPECT_NEAR(in.left, 25.0, 1e-9);
  EXPECT_NEAR(in.right, 25.0, 1e-9);
  EXPECT_NEAR(in.bottom, 25.0, 1e-9);
}

static void TestContentBoundsNoContent()
{
  RasterImage img = MakeTransparentRaster(16, 16);
  // Anti-aliasing fringe below the threshold is not content.
  FillRect(img, 2, 2, 5, 5, 0, 0, 0, 9);
  EXPECT_FALSE(DetectContentBounds(img).has_value());

  FillRect(img, 0, 0, 15, 15, 0, 0, 0, 255);
  const std::optional<ContentBounds> full = DetectContentBounds(img);
  ASSERT_TRUE(full.has_value());
  EXPECT_TRUE(full->coversWholeImage());
  EXPECT_EQ(full->rect.maxX, 1.0);
  EXPECT_EQ(full->rect.maxY, 1.0);
}

static void TestEdgePixelsAndThinning()
{
  RasterImage img = MakeTransparentRaster(10, 10);
  FillRect(img, 2, 2, 6, 6, 0, 0, 255, 255);
  const std::vector<IPoint> edges = FindEdgePixels(img);
  // 5x5 block: 25 colored, 9 interior.
  EXPECT_EQ(edges.size(), static_cast<std::size_t>(16));
  ASSERT_TRUE(!edges.empty());
  EXPECT_EQ(edges.front(), (IPoint{2, 2}));

  // A colored pixel on the image border is always an edge.
  RasterImage full = MakeTransparentRaster(3, 3);
  FillRect(full, 0, 0, 2, 2, 0, 0, 0, 255);
  EXPECT_EQ(FindEdgePixels(full).size(), static_cast<std::size_t>(8));

  const std::vector<IPoint> line = {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}, {1, 1}};
  const std::vector<IPoint> thinned = ThinByMinSpacing(line, 2.0);
  ASSERT_TRUE(thinned.size() == 3);
  EXPECT_EQ(thinned[0], (IPoint{0, 0}));
  EXPECT_EQ(thinned[1], (IPoint{2, 0}));
  EXPECT_EQ(thinned[2], (IPoint{4, 0}));

  // Spacings far beyond the point spread keep only the first point.
  const std::vector<IPoint> spread = {{0, 0}, {1000, 0}, {0, 1000}};
  EXPECT_EQ(ThinByMinSpacing(spread, 1000.0).size(), static_cast<std::size_t>(3));
  const std::vector<IPoint> huge = ThinByMinSpacing(spread, 5e9);
  ASSERT_TRUE(huge.size() == 1);
  EXPECT_EQ(huge[0], (IPoint{0, 0}));
  EXPECT_EQ(ThinByMinSpacing(spread, 1e300).size(), static_cast<std::size_t>(1));
}

static void TestNearestNeighborJumpRule()
{
  std::vector<IPoint> pts;
  for (int i = 0; i < 12; ++i) pts.push_back(IPoint{i * 2, 0});
  pts.push_back(IPoint{500, 0});
  pts.push_back(IPoint{300, 0});

  std::size_t jumps = 0;
  const std::vector<IPoint> path = OrderByNearestNeighbor(pts, 50.0, 10, &jumps);
  ASSERT_TRUE(path.size() == pts.size());
  // The path is long enough, so a far neighbor restarts at the first unvisited point.
  EXPECT_EQ(path[12], (IPoint{500, 0}));
  EXPECT_EQ(path[13], (IPoint{300, 0}));
  EXPECT_EQ(jumps, static_cast<std::size_t>(2));

  // With a short path the greedy step is taken regardless of distance.
  const std::vector<IPoint> free = OrderByNearestNeighbor(pts, 50.0, 100, &jumps);
  ASSERT_TRUE(free.size() == pts.size());
  EXPECT_EQ(free[12], (IPoint{300, 0}));
  EXPECT_EQ(free[13], (IPoint{500, 0}));
  EXPECT_EQ(jumps, static_cast<std::size_t>(0));

  // Equal distances resolve to the lowest input index.
  const std::vector<IPoint> tie = {{10, 10}, {13, 10}, {7, 10}};
  const std::vector<IPoint> tiePath = OrderByNearestNeighbor(tie, 50.0, 10);
  ASSERT_TRUE(tiePath.size() == 3);
  EXPECT_EQ(tiePath[1], (IPoint{13, 10}));
}

static void TestDouglasPeucker()
{
  std::vector<IPoint> collinear;
  for (int i = 0; i <= 500; ++i) collinear.push_back(IPoint{i, 0});
  ASSERT_TRUE(collinear.size() == 501);
  const std::vector<IPoint> simplified = SimplifyDouglasPeucker(collinear, 1.0);
  ASSERT_TRUE(simplified.size() == 2);
  EXPECT_EQ(simplified.front(), (IPoint{0, 0}));
  EXPECT_EQ(simplified.back(), (IPoint{500, 0}));

  const std::vector<PixelPoint> peak = {{0.0, 0.0}, {5.0, 3.0}, {10.0, 0.0}};
  EXPECT_EQ(SimplifyDouglasPeucker(peak, 1.0).size(), static_cast<std::size_t>(3));
  EXPECT_EQ(SimplifyDouglasPeucker(peak, 5.0).size(), static_cast<std::size_t>(2));

  // Deviation exactly at the tolerance is dropped.
  const std::vector<PixelPoint> edge = {{0.0, 0.0}, {5.0, 1.0}, {10.0, 0.0}};
  EXPECT_EQ(SimplifyDouglasPeucker(edge, 1.0).size(), static_cast<std::size_t>(2));

  EXPECT_NEAR(PointToSegmentDistance({-3.0, 4.0}, {0.0, 0.0}, {10.0, 0.0}), 5.0, 1e-12);
  EXPECT_NEAR(PointToSegmentDistance({5.0, 2.0}, {0.0, 0.0}, {10.0, 0.0}), 2.0, 1e-12);
  EXPECT_NEAR(PointToSegmentDistance({3.0, 4.0}, {0.0, 0.0}, {0.0, 0.0}), 5.0, 1e-12);
}

static void TestPerimeterOfSquare()
{
  RasterImage img = MakeTransparentRaster(40, 40);
  FillRect(img, 10, 10, 29, 29, 0, 128, 0, 255);

  // lng = x, lat = 40 - y
  const GeoBounds b = MakeBounds(0, 0, 40, 40);
  PerimeterStats stats;
  const std::optional<std::vector<GeoPoint>> ring = ExtractPerimeter(img, b, EngineConfig{}, &stats);
  ASSERT_TRUE(ring.has_value());
  ASSERT_TRUE(ring->size() >= 4);
  EXPECT_EQ(ring->front(), ring->back());
  EXPECT_TRUE(CountDistinctVertices(*ring) >= 3);
  EXPECT_EQ(stats.edgePixels, static_cast<std::size_t>(76));
  EXPECT_TRUE(stats.thinnedPoints < stats.edgePixels);
  EXPECT_FALSE(stats.simplified);
  EXPECT_EQ(stats.ringVertices, ring->size());

  auto approx = [](double a, double v) { return std::fabs(a - v) < 1e-9; };
  for (const GeoPoint& p : *ring) {
    const bool onEdge = approx(p.lng, 10.0) || approx(p.lng, 29.0) || approx(p.lat, 30.0) || approx(p.lat, 11.0);
    EXPECT_TRUE(onEdge);
  }

  // Nothing colored: no perimeter.
  EXPECT_FALSE(ExtractPerimeter(MakeTransparentRaster(8, 8), b).has_value());

  // A single pixel collapses to fewer than 3 distinct vertices.
  RasterImage dot = MakeTransparentRaster(8, 8);
  SetPixel(dot, 4, 4, 0, 0, 0, 255);
  EXPECT_FALSE(ExtractPerimeter(dot, b).has_value());
}

static void TestPerimeterSimplifiesLargeOutlines()
{
  RasterImage img = MakeTransparentRaster(600, 600);
  FillRect(img, 20, 20, 579, 579, 0, 0, 0, 255);

  EngineConfig cfg;
  PerimeterStats stats;
  const std::optional<std::vector<IPoint>> path = ExtractPerimeterPixels(img, cfg, &stats);
  ASSERT_TRUE(path.has_value());
  EXPECT_TRUE(stats.thinnedPoints > static_cast<std::size_t>(cfg.simplifyTriggerPoints));
  EXPECT_TRUE(stats.simplified);
  EXPECT_TRUE(path->size() < stats.thinnedPoints);
  EXPECT_EQ(stats.simplifiedPoints, path->size());
}

static void TestStackingOrderResolvesOverlap()
{
  ZoneStore store;
  std::string err;
  EXPECT_TRUE(store.UpsertZone(MakeZone(1, "A", MakeBounds(0, 0, 10, 10)), err));
  EXPECT_TRUE(store.UpsertZone(MakeZone(2, "B", MakeBounds(5, 5, 15, 15)), err));
  EXPECT_TRUE(store.ActivateZone(1));
  EXPECT_TRUE(store.ActivateZone(2));

  EXPECT_EQ(store.GetZoneAtPoint(7, 7, false), std::optional<ZoneId>(2));
  EXPECT_EQ(store.GetZoneAtPoint(2, 2, false), std::optional<ZoneId>(1));
  EXPECT_FALSE(store.GetZoneAtPoint(20, 20, false).has_value());

  // Order is stacking order, not id order.
  EXPECT_TRUE(store.SetActiveZones({2, 1}, err));
  EXPECT_EQ(store.GetZoneAtPoint(7, 7, false), std::optional<ZoneId>(1));

  EXPECT_FALSE(store.SetActiveZones({1, 1}, err));
  EXPECT_FALSE(store.SetActiveZones({9}, err));
  EXPECT_EQ(store.activeZones().size(), static_cast<std::size_t>(2));

  EXPECT_TRUE(store.DeactivateZone(1));
  EXPECT_EQ(store.GetZoneAtPoint(7, 7, false), std::optional<ZoneId>(2));
  EXPECT_FALSE(store.GetZoneAtPoint(2, 2, false).has_value());

  EXPECT_TRUE(store.RemoveZone(2));
  EXPECT_FALSE(store.isActive(2));
  EXPECT_FALSE(store.RemoveZone(2));

  EXPECT_FALSE(store.UpsertZone(MakeZone(3, "C", MakeBounds(5, 5, 5, 15)), err));
}

static void TestCheckPixelsOnlyRemovesMatches()
{
  ZoneStore store;
  std::string err;
  EXPECT_TRUE(store.UpsertZone(MakeZone(1, "pink", MakeBounds(0, 0, 100, 100)), err));
  EXPECT_TRUE(store.ActivateZone(1));

  // Raster not decoded yet: pixel checks fall back to bounds.
  EXPECT_EQ(store.GetZoneAtPoint(95, 5, true), std::optional<ZoneId>(1));

  OverlayReport report;
  EXPECT_TRUE(AttachRaster(store, 1, MakeCenteredSquareRaster(), EngineConfig{}, false, &report, err));
  EXPECT_EQ(report.state, RasterState::Ready);
  EXPECT_TRUE(report.content.has_value());
  EXPECT_FALSE(report.degraded());

  EXPECT_EQ(store.GetZoneAtPoint(95, 5, false), std::optional<ZoneId>(1));
  EXPECT_FALSE(store.GetZoneAtPoint(95, 5, true).has_value());
  EXPECT_EQ(store.GetZoneAtPoint(50, 50, true), std::optional<ZoneId>(1));

  int removed = 0;
  for (int lat = 0; lat <= 100; lat += 5) {
    for (int lng = 0; lng <= 100; lng += 5) {
      const bool coarse = store.GetZoneAtPoint(lat, lng, false).has_value();
      const bool fine = store.GetZoneAtPoint(lat, lng, true).has_value();
      EXPECT_TRUE(coarse);
      if (fine) EXPECT_TRUE(coarse);
      if (coarse && !fine) ++removed;
    }
  }
  EXPECT_TRUE(removed > 0);
}

static void TestAlphaHitTest()
{
  RasterImage img = MakeCenteredSquareRaster();
  FillRect(img, 40, 40, 59, 59, 0, 0, 0, 0);

  ZoneStore store;
  std::string err;
  EXPECT_TRUE(store.UpsertZone(MakeZone(1, "green", MakeBounds(0, 0, 100, 100)), err));
  EXPECT_TRUE(store.ActivateZone(1));
  EXPECT_TRUE(AttachRaster(store, 1, img, EngineConfig{}, false, nullptr, err));

  // Center is inside the content rectangle but lands on the transparent hole.
  EXPECT_EQ(store.GetZoneAtPointPrecise(50, 50, HitTestMode::ContentBounds), std::optional<ZoneId>(1));
  EXPECT_FALSE(store.GetZoneAtPointPrecise(50, 50, HitTestMode::Alpha).has_value());
  EXPECT_EQ(store.GetZoneAtPointPrecise(70, 30, HitTestMode::Alpha), std::optional<ZoneId>(1));

  HitTestMode m = HitTestMode::Bounds;
  EXPECT_TRUE(ParseHitTestMode("alpha", m));
  EXPECT_EQ(m, HitTestMode::Alpha);
  EXPECT_TRUE(ParseHitTestMode("content", m));
  EXPECT_EQ(m, HitTestMode::ContentBounds);
  EXPECT_FALSE(ParseHitTestMode("polygon", m));
}

static void TestUnavailableRasterFallsBackToBounds()
{
  ZoneStore store;
  std::string err;
  ZoneRecord r = MakeZone(4, "purple", MakeBounds(0, 0, 10, 10));
  r.imagePath = "/mapzone/purplezone.png";
  EXPECT_TRUE(store.UpsertZone(r, err));
  EXPECT_TRUE(store.ActivateZone(4));

  const fs::path missingRoot = MakeTempPath("hazmap_missing_assets");
  OverlayReport report;
  EXPECT_TRUE(LoadZoneRaster(store, 4, missingRoot.string(), EngineConfig{}, true, &report, err));
  EXPECT_EQ(report.state, RasterState::Unavailable);
  EXPECT_TRUE(report.degraded());
  EXPECT_EQ(store.find(4)->rasterState, RasterState::Unavailable);
  EXPECT_FALSE(store.find(4)->rasterError.empty());

  EXPECT_EQ(store.GetZoneAtPointPrecise(1, 1, HitTestMode::Alpha), std::optional<ZoneId>(4));
  EXPECT_FALSE(LoadZoneRaster(store, 99, missingRoot.string(), EngineConfig{}, true, nullptr, err));

  EXPECT_EQ(ResolveImagePath("assets", "/mapzone/a.png"), (fs::path("assets") / "mapzone/a.png").string());
  EXPECT_EQ(ResolveImagePath("", "/mapzone/a.png"), std::string("mapzone/a.png"));
}

static void TestPipelineLoadsRasterFromDisk()
{
  const fs::path root = MakeTempPath("hazmap_assets");
  std::error_code ec;
  fs::create_directories(root / "mapzone", ec);
  ASSERT_TRUE(!ec);

  std::string err;
  ASSERT_TRUE(WritePng((root / "mapzone" / "pinkzone.png").string(), MakeCenteredSquareRaster(), err));

  ZoneStore store;
  ZoneRecord r = MakeZone(3, "pink", MakeBounds(0, 0, 1, 1));
  r.imagePath = "mapzone/pinkzone.png";
  EXPECT_TRUE(store.UpsertZone(r, err));
  EXPECT_TRUE(store.ActivateZone(3));

  OverlayReport report;
  EXPECT_TRUE(LoadZoneRaster(store, 3, root.string(), EngineConfig{}, true, &report, err));
  EXPECT_EQ(report.state, RasterState::Ready);
  EXPECT_EQ(report.imageWidth, 100);
  EXPECT_TRUE(report.perimeterExtracted);
  EXPECT_FALSE(report.degraded());
  EXPECT_TRUE(store.find(3)->record.hasPerimeter());
  EXPECT_NEAR(report.displayBounds.west, 0.25, 1e-12);
  EXPECT_NEAR(report.displayBounds.north, 0.75, 1e-12);

  fs::remove_all(root, ec);
}

static void TestPreviewDoesNotMutateCommitted()
{
  ZoneStore store;
  std::string err;
  const GeoBounds b = MakeBounds(0, 0, 10, 20);
  EXPECT_TRUE(store.UpsertZone(MakeZone(1, "yellow", b), err));

  // Never displayed: no base size.
  EXPECT_EQ(PreviewScale(store, 1, 0.5), TransformStatus::MissingBaseSize);
  EXPECT_EQ(PreviewScale(store, 7, 0.5), TransformStatus::UnknownZone);

  EXPECT_TRUE(store.ActivateZone(1));
  for (int i = 1; i <= 5; ++i) {
    EXPECT_EQ(PreviewScale(store, 1, 0.3 * i), TransformStatus::Ok);
    EXPECT_EQ(PreviewRotate(store, 1, 15.0 * i), TransformStatus::Ok);
  }
  const ZoneEntry* e = store.find(1);
  ASSERT_TRUE(e != nullptr);
  EXPECT_EQ(e->committed.bounds, b);
  EXPECT_EQ(e->record.bounds, b);
  ASSERT_TRUE(e->committed.baseSize.has_value());
  EXPECT_EQ(*e->committed.baseSize, SpanOf(b));
  EXPECT_NE(e->preview->displayedBounds, b);

  // Rotation leaves the anchor and the displayed rectangle alone; scale keeps rotation.
  const GeoBounds shown = e->preview->displayedBounds;
  const GeoPoint anchor = e->preview->anchor;
  EXPECT_EQ(PreviewRotate(store, 1, 42.0), TransformStatus::Ok);
  EXPECT_EQ(e->preview->displayedBounds, shown);
  EXPECT_EQ(e->preview->anchor, anchor);
  EXPECT_EQ(PreviewScalePercent(store, 1, 80.0), TransformStatus::Ok);
  EXPECT_EQ(e->preview->rotationDeg, 42.0);
  EXPECT_EQ(e->preview->anchor, anchor);
  const GeoBounds shown80 = e->preview->displayedBounds;

  EXPECT_EQ(PreviewScale(store, 1, 0.0), TransformStatus::InvalidFactor);
  EXPECT_EQ(PreviewScale(store, 1, std::nan("")), TransformStatus::InvalidFactor);

  // A factor that collapses the rectangle is refused and the preview stays as it was.
  const double scaleBefore = e->preview->scale;
  EXPECT_EQ(PreviewScale(store, 1, 1e-300), TransformStatus::DegenerateBounds);
  EXPECT_EQ(e->preview->scale, scaleBefore);
  EXPECT_EQ(e->preview->displayedBounds, shown80);
  EXPECT_TRUE(IsValidBounds(e->preview->displayedBounds));

  // Same for an anchor so large that the span vanishes in rounding.
  EXPECT_EQ(MoveAnchor(store, 1, GeoPoint{1e300, 0.0}), TransformStatus::DegenerateBounds);
  EXPECT_EQ(e->preview->anchor, anchor);
  EXPECT_EQ(e->preview->displayedBounds, shown80);

  EXPECT_EQ(DiscardPreview(store, 1), TransformStatus::Ok);
  EXPECT_EQ(e->preview->displayedBounds, b);
  EXPECT_EQ(e->preview->scale, 1.0);

  // Hidden zones have no anchor.
  EXPECT_TRUE(store.DeactivateZone(1));
  EXPECT_EQ(PreviewScale(store, 1, 2.0), TransformStatus::MissingAnchor);
  EXPECT_EQ(store.find(1)->committed.bounds, b);
}

static void TestScaleScenarios()
{
  ZoneStore store;
  std::string err;
  // base {4,4} around (10,10)
  EXPECT_TRUE(store.UpsertZone(MakeZone(1, "a", MakeBounds(8, 8, 12, 12)), err));
  // base {8,8} around (10,10)
  EXPECT_TRUE(store.UpsertZone(MakeZone(2, "b", MakeBounds(6, 6, 14, 14)), err));
  EXPECT_TRUE(store.ActivateZone(1));
  EXPECT_TRUE(store.ActivateZone(2));

  EXPECT_EQ(PreviewScale(store, 1, 0.5), TransformStatus::Ok);
  EXPECT_EQ(store.find(1)->preview->displayedBounds, MakeBounds(9, 9, 11, 11));

  EXPECT_EQ(PreviewScale(store, 2, 0.5), TransformStatus::Ok);
  EXPECT_EQ(store.find(2)->preview->displayedBounds, MakeBounds(8, 8, 12, 12));

  // Scaling happens about the anchor, not the committed center.
  EXPECT_EQ(MoveAnchor(store, 1, GeoPoint{20.0, 30.0}), TransformStatus::Ok);
  EXPECT_EQ(store.find(1)->preview->displayedBounds, MakeBounds(19, 29, 21, 31));
  EXPECT_EQ(PreviewScale(store, 1, 2.0), TransformStatus::Ok);
  EXPECT_EQ(store.find(1)->preview->displayedBounds, MakeBounds(16, 26, 24, 34));
}

static void TestCommitTransform()
{
  ZoneStore store;
  std::string err;
  ZoneRecord r = MakeZone(1, "orange", MakeBounds(0, 0, 10, 20));
  r.perimeter = {GeoPoint{0, 0}, GeoPoint{10, 0}, GeoPoint{10, 20}, GeoPoint{0, 0}};
  EXPECT_TRUE(store.UpsertZone(r, err));
  EXPECT_TRUE(store.ActivateZone(1));

  EXPECT_EQ(PreviewScale(store, 1, 1.5), TransformStatus::Ok);
  EXPECT_EQ(PreviewRotate(store, 1, 30.0), TransformStatus::Ok);

  GeoBounds committed;
  EXPECT_EQ(CommitTransform(store, 1, &committed), TransformStatus::Ok);
  EXPECT_EQ(committed, MakeBounds(-2.5, -5, 12.5, 25));

  const ZoneEntry* e = store.find(1);
  ASSERT_TRUE(e != nullptr);
  EXPECT_EQ(e->committed.bounds, committed);
  EXPECT_EQ(e->record.bounds, committed);
  ASSERT_TRUE(e->committed.baseSize.has_value());
  EXPECT_NEAR(e->committed.baseSize->lat, 15.0, 1e-12);
  EXPECT_NEAR(e->committed.baseSize->lng, 30.0, 1e-12);
  EXPECT_EQ(e->record.rotationDeg, 30.0);
  EXPECT_EQ(e->record.scale, 1.0);
  EXPECT_EQ(e->preview->scale, 1.0);

  // The perimeter follows the bounds.
  ASSERT_TRUE(e->record.perimeter.size() == 4);
  EXPECT_NEAR(e->record.perimeter[2].lat, 12.5, 1e-9);
  EXPECT_NEAR(e->record.perimeter[2].lng, 25.0, 1e-9);

  // 100% reproduces the committed bounds; later scales are relative to the new base.
  EXPECT_EQ(PreviewScalePercent(store, 1, 100.0), TransformStatus::Ok);
  EXPECT_EQ(e->preview->displayedBounds, committed);
  EXPECT_EQ(PreviewScale(store, 1, 2.0), TransformStatus::Ok);
  EXPECT_NEAR(e->preview->displayedBounds.latSpan(), 30.0, 1e-9);

  // Position-only commit keeps the size.
  EXPECT_EQ(MoveAnchor(store, 1, GeoPoint{100.0, 100.0}), TransformStatus::Ok);
  EXPECT_EQ(CommitPosition(store, 1, &committed), TransformStatus::Ok);
  EXPECT_NEAR(committed.latSpan(), 15.0, 1e-9);
  EXPECT_NEAR(committed.center().lat, 100.0, 1e-9);
  EXPECT_EQ(e->record.scale, 1.0);

  // A reload from the collaborator keeps the cached base size.
  ZoneRecord reloaded = e->record;
  reloaded.bounds = MakeBounds(0, 0, 1, 1);
  EXPECT_TRUE(store.UpsertZone(reloaded, err));
  EXPECT_NEAR(store.find(1)->committed.baseSize->lat, 15.0, 1e-9);
}

static void TestBatchTransformsSkipAndContinue()
{
  ZoneStore store;
  std::string err;
  EXPECT_TRUE(store.UpsertZone(MakeZone(1, "green", MakeBounds(0, 0, 10, 10)), err));
  EXPECT_TRUE(store.UpsertZone(MakeZone(2, "pink", MakeBounds(0, 0, 10, 10)), err));
  EXPECT_TRUE(store.UpsertZone(MakeZone(3, "yellow", MakeBounds(20, 20, 30, 30)), err));
  EXPECT_TRUE(store.ActivateZone(1));
  EXPECT_TRUE(store.ActivateZone(2));
  EXPECT_TRUE(store.ActivateZone(3));

  const BatchTransformReport scaled = PreviewScaleAll(store, 2.0);
  EXPECT_TRUE(scaled.allApplied());
  EXPECT_EQ(scaled.applied.size(), static_cast<std::size_t>(3));

  const GeoPoint a3 = store.find(3)->preview->anchor;
  const BatchTransformReport rotated = PreviewRotateAll(store, 45.0);
  EXPECT_TRUE(rotated.allApplied());
  EXPECT_EQ(rotated.anchorsRestored, 0);
  EXPECT_EQ(store.find(3)->preview->anchor, a3);
  EXPECT_EQ(store.find(1)->preview->rotationDeg, 45.0);

  // Rotation about a moved anchor keeps that anchor; nothing counts as drift.
  EXPECT_EQ(MoveAnchor(store, 3, GeoPoint{26.0, 24.0}), TransformStatus::Ok);
  const BatchTransformReport rotatedAgain = PreviewRotateAll(store, -30.0);
  EXPECT_EQ(rotatedAgain.anchorsRestored, 0);
  EXPECT_EQ(store.find(3)->preview->anchor, (GeoPoint{26.0, 24.0}));
  EXPECT_EQ(store.find(3)->preview->rotationDeg, -30.0);
  EXPECT_TRUE(DescribeBatchReport(rotatedAgain).find("anchors restored") == std::string::npos);
  EXPECT_EQ(MoveAnchor(store, 3, a3), TransformStatus::Ok);

  // Collapsing previews are refused per zone; siblings are unaffected.
  const BatchTransformReport collapsed = PreviewScaleAll(store, 1e-300);
  ASSERT_TRUE(collapsed.skipped.size() == 3);
  EXPECT_EQ(collapsed.skipped[0].second, TransformStatus::DegenerateBounds);
  EXPECT_EQ(store.find(1)->preview->scale, 2.0);

  // Commit re-checks the result: zone 2 carries a collapsing scale, the others still commit.
  store.find(2)->preview->scale = 1e-300;
  const BatchTransformReport committed = CommitAll(store);
  EXPECT_EQ(committed.applied.size(), static_cast<std::size_t>(2));
  ASSERT_TRUE(committed.skipped.size() == 1);
  EXPECT_EQ(committed.skipped[0].first, 2);
  EXPECT_EQ(committed.skipped[0].second, TransformStatus::DegenerateBounds);
  EXPECT_EQ(store.find(2)->committed.bounds, MakeBounds(0, 0, 10, 10));
  EXPECT_EQ(store.find(1)->committed.bounds, MakeBounds(-5, -5, 15, 15));

  const std::string text = DescribeBatchReport(committed);
  EXPECT_TRUE(text.find("applied 2") != std::string::npos);
  EXPECT_TRUE(text.find("zone 2: degenerate bounds") != std::string::npos);

  EXPECT_EQ(PreviewScaleAll(store, -1.0).skipped.size(), static_cast<std::size_t>(3));

  EXPECT_EQ(DiscardPreview(store, 2), TransformStatus::Ok);
  const BatchTransformReport positions = CommitAllPositions(store);
  EXPECT_TRUE(positions.allApplied());
}

static void TestBoundsOps()
{
  EXPECT_EQ(ShiftBounds(MakeBounds(0, 0, 10, 10), 1.0, 2.0), MakeBounds(-1, 2, 9, 12));
  EXPECT_EQ(ScaleBoundsAboutCenter(MakeBounds(0, 0, 2, 4), 2.0), MakeBounds(-1, -2, 3, 6));

  bool changed = false;
  const GeoBounds fitted = FitBoundsToAspect(MakeBounds(0, 0, 1, 1), 200, 100, 0.01, &changed);
  EXPECT_TRUE(changed);
  EXPECT_NEAR(fitted.west, -0.5, 1e-12);
  EXPECT_NEAR(fitted.east, 1.5, 1e-12);
  EXPECT_EQ(fitted.south, 0.0);
  EXPECT_EQ(fitted.north, 1.0);

  const GeoBounds same = FitBoundsToAspect(MakeBounds(0, 0, 1, 2.005), 200, 100, 0.01, &changed);
  EXPECT_FALSE(changed);
  EXPECT_EQ(same, MakeBounds(0, 0, 1, 2.005));

  const std::vector<GeoPoint> moved = RemapRing({GeoPoint{5, 5}}, MakeBounds(0, 0, 10, 10), MakeBounds(10, 10, 30, 30));
  ASSERT_TRUE(moved.size() == 1);
  EXPECT_NEAR(moved[0].lat, 20.0, 1e-12);
  EXPECT_NEAR(moved[0].lng, 20.0, 1e-12);

  // 90 degrees clockwise: the north-west corner ends up north-east.
  const std::vector<GeoPoint> corners = RotatedCorners(MakeBounds(0, 0, 2, 2), 90.0);
  ASSERT_TRUE(corners.size() == 4);
  EXPECT_NEAR(corners[0].lat, 2.0, 1e-12);
  EXPECT_NEAR(corners[0].lng, 2.0, 1e-12);
  EXPECT_NEAR(corners[3].lat, 2.0, 1e-12);
  EXPECT_NEAR(corners[3].lng, 0.0, 1e-12);

  const std::vector<GeoPoint> unrotated = RotatedCorners(MakeBounds(0, 0, 2, 4), 0.0);
  ASSERT_TRUE(unrotated.size() == 4);
  EXPECT_EQ(unrotated[1], (GeoPoint{2.0, 4.0}));
}

static void TestChecksumsAndInflate()
{
  const char* digits = "123456789";
  EXPECT_EQ(Crc32(reinterpret_cast<const std::uint8_t*>(digits), std::strlen(digits)), 0xCBF43926u);
  const char* wiki = "Wikipedia";
  EXPECT_EQ(Adler32(reinterpret_cast<const std::uint8_t*>(wiki), std::strlen(wiki)), 0x11E60398u);

  // Stored block: BFINAL=1, BTYPE=00, LEN=5, NLEN=~5, "hello".
  std::vector<std::uint8_t> raw = {0x01, 0x05, 0x00, 0xFA, 0xFF, 'h', 'e', 'l', 'l', 'o'};
  std::vector<std::uint8_t> out;
  std::string err;
  EXPECT_TRUE(InflateRaw(raw.data(), raw.size(), out, err));
  EXPECT_EQ(std::string(out.begin(), out.end()), std::string("hello"));

  std::vector<std::uint8_t> zlib = {0x78, 0x01};
  zlib.insert(zlib.end(), raw.begin(), raw.end());
  const std::uint32_t adler = Adler32(out.data(), out.size());
  zlib.push_back(static_cast<std::uint8_t>(adler >> 24));
  zlib.push_back(static_cast<std::uint8_t>(adler >> 16));
  zlib.push_back(static_cast<std::uint8_t>(adler >> 8));
  zlib.push_back(static_cast<std::uint8_t>(adler));
  EXPECT_TRUE(InflateZlib(zlib.data(), zlib.size(), out, err));
  EXPECT_EQ(out.size(), static_cast<std::size_t>(5));

  zlib.back() ^= 0xFF;
  EXPECT_FALSE(InflateZlib(zlib.data(), zlib.size(), out, err));
  EXPECT_FALSE(err.empty());

  // Fixed Huffman block as written by zlib for "a".
  const std::vector<std::uint8_t> fixed = {0x78, 0x9C, 0x4B, 0x04, 0x00, 0x00, 0x62, 0x00, 0x62};
  EXPECT_TRUE(InflateZlib(fixed.data(), fixed.size(), out, err));
  EXPECT_EQ(std::string(out.begin(), out.end()), std::string("a"));

  // Invalid stored block length complement.
  std::vector<std::uint8_t> bad = raw;
  bad[3] = 0x00;
  EXPECT_FALSE(InflateRaw(bad.data(), bad.size(), out, err));
}

static void TestPngRoundTripThroughFile()
{
  RasterImage img = MakeTransparentRaster(7, 5);
  SetPixel(img, 0, 0, 255, 0, 0, 255);
  SetPixel(img, 6, 4, 1, 2, 3, 4);
  FillRect(img, 2, 1, 4, 3, 10, 200, 30, 128);

  const fs::path p = MakeTempPath("hazmap_png").string() + ".png";
  std::string err;
  ASSERT_TRUE(WritePng(p.string(), img, err));

  RasterImage back;
  EXPECT_TRUE(ReadPng(p.string(), back, err));
  EXPECT_EQ(back.width, 7);
  EXPECT_EQ(back.height, 5);
  EXPECT_TRUE(back.rgba == img.rgba);

  RasterImage autoImg;
  EXPECT_TRUE(ReadRasterAuto(p.string(), autoImg, err));
  EXPECT_TRUE(autoImg.rgba == img.rgba);

  const std::vector<std::uint8_t> junk = {0x89, 'P', 'N', 'G', 0, 1, 2, 3};
  EXPECT_FALSE(DecodePng(junk.data(), junk.size(), back, err));
  EXPECT_FALSE(err.empty());

  std::error_code ec;
  fs::remove(p, ec);
}

static void TestPpmDecodesOpaque()
{
  const fs::path p = MakeTempPath("hazmap_ppm").string() + ".ppm";
  {
    std::ofstream f(p, std::ios::binary);
    f << "P6\n# comment\n2 1\n255\n";
    const unsigned char px[] = {255, 0, 0, 0, 0, 255};
    f.write(reinterpret_cast<const char*>(px), sizeof(px));
  }
  RasterImage img;
  std::string err;
  EXPECT_TRUE(ReadRasterAuto(p.string(), img, err));
  EXPECT_EQ(img.width, 2);
  EXPECT_EQ(img.height, 1);
  EXPECT_EQ(AlphaAt(img, 0, 0), static_cast<std::uint8_t>(255));
  EXPECT_EQ(AlphaAt(img, 1, 0), static_cast<std::uint8_t>(255));
  ASSERT_TRUE(img.rgba.size() == 8);
  EXPECT_EQ(img.rgba[6], static_cast<std::uint8_t>(255));

  std::error_code ec;
  fs::remove(p, ec);
}

static void TestJsonParseAndWrite()
{
  JsonValue v;
  std::string err;
  EXPECT_TRUE(ParseJson("{\"a\": [1, 2.5, true, null], \"s\": \"x\\u00e9\\n\"}", v, err));
  ASSERT_TRUE(v.isObject());
  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a && a->isArray() && a->arrayValue.size() == 4);
  EXPECT_EQ(a->arrayValue[1].numberValue, 2.5);
  EXPECT_TRUE(a->arrayValue[3].isNull());
  EXPECT_EQ(FindJsonMember(v, "s")->stringValue, std::string("x\xC3\xA9\n"));

  EXPECT_FALSE(ParseJson("{\"a\": 1,}", v, err));
  EXPECT_FALSE(ParseJson("[1, 2] 3", v, err));

  EXPECT_EQ(JsonNumberText(-0.0), std::string("0"));
  EXPECT_EQ(JsonNumberText(0.1), std::string("0.1"));

  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = false;
  JsonWriter w(oss, opt);
  w.beginObject();
  w.member("v", std::nan(""));
  w.endObject();
  EXPECT_FALSE(w.ok());
}

static void TestEngineConfigOverrides()
{
  EngineConfig cfg;
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson("{\"alpha_threshold\": 20, \"jump_threshold\": 40.5, \"unknown\": 1}", root, err));
  EXPECT_TRUE(ApplyEngineConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.alphaThreshold, 20);
  EXPECT_EQ(cfg.jumpThreshold, 40.5);
  EXPECT_EQ(cfg.minPointSpacing, 2.0);
  EXPECT_EQ(cfg.simplifyTriggerPoints, 500);

  ASSERT_TRUE(ParseJson("{\"min_point_spacing\": \"wide\", \"alpha_threshold\": 30}", root, err));
  EXPECT_FALSE(ApplyEngineConfigJson(root, cfg, err));
  EXPECT_TRUE(err.find("min_point_spacing") != std::string::npos);
  EXPECT_EQ(cfg.alphaThreshold, 20);

  ASSERT_TRUE(ParseJson("{\"alpha_threshold\": 300}", root, err));
  EXPECT_FALSE(ApplyEngineConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.alphaThreshold, 20);

  ASSERT_TRUE(ParseJson("{\"min_point_spacing\": 1e10}", root, err));
  EXPECT_FALSE(ApplyEngineConfigJson(root, cfg, err));
  EXPECT_TRUE(err.find("min_point_spacing") != std::string::npos);
  EXPECT_EQ(cfg.minPointSpacing, 2.0);
  ASSERT_TRUE(ParseJson("{\"min_point_spacing\": 1000000}", root, err));
  EXPECT_TRUE(ApplyEngineConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.minPointSpacing, kMaxMinPointSpacing);
  cfg.minPointSpacing = 2.0;

  const fs::path p = MakeTempPath("hazmap_cfg").string() + ".json";
  EXPECT_TRUE(WriteEngineConfigJsonFile(p.string(), cfg, err));
  EngineConfig loaded;
  EXPECT_TRUE(LoadEngineConfigJsonFile(p.string(), loaded, err));
  EXPECT_EQ(loaded.alphaThreshold, 20);
  EXPECT_EQ(loaded.jumpThreshold, 40.5);
  EXPECT_EQ(loaded.alphaThresholdU8(), static_cast<std::uint8_t>(20));

  std::error_code ec;
  fs::remove(p, ec);
}

static void TestZoneRecordsJson()
{
  const std::string text = R"([
    {"id": 3, "name": "pink", "image_path": "/mapzone/pinkzone.png",
     "bounds": [[1, 2], [3, 4]], "rotation": 12.5,
     "perimeter": [[1, 2], [3, 2], [3, 4]]},
    {"id": 7, "name": "Orange Zone", "bounds": [[-1, -2], [1, 2]], "opacity": 0.25,
     "original_bounds": [[-2, -4], [2, 4]]}
  ])";
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(text, root, err));
  std::vector<ZoneRecord> records;
  ASSERT_TRUE(ParseZoneRecords(root, records, err));
  ASSERT_TRUE(records.size() == 2);
  EXPECT_EQ(records[0].id, 3);
  EXPECT_EQ(records[0].opacity, 0.6);
  EXPECT_EQ(records[0].rotationDeg, 12.5);
  EXPECT_EQ(records[0].bounds, MakeBounds(1, 2, 3, 4));
  // Closed on load.
  ASSERT_TRUE(records[0].perimeter.size() == 4);
  EXPECT_EQ(records[0].perimeter.front(), records[0].perimeter.back());
  EXPECT_TRUE(records[1].originalBounds.has_value());
  EXPECT_EQ(NextZoneId(records), 8);
  EXPECT_EQ(NextZoneId({}), 1);
  EXPECT_TRUE(FindZoneRecord(records, 7) != nullptr);
  EXPECT_TRUE(FindZoneRecord(records, 4) == nullptr);

  const fs::path p = MakeTempPath("hazmap_zones").string() + ".json";
  EXPECT_TRUE(WriteZoneRecordsFile(p.string(), records, err));
  std::vector<ZoneRecord> loaded;
  EXPECT_TRUE(LoadZoneRecordsFile(p.string(), loaded, err));
  ASSERT_TRUE(loaded.size() == 2);
  EXPECT_EQ(loaded[1].bounds, records[1].bounds);
  EXPECT_EQ(loaded[1].opacity, 0.25);
  EXPECT_EQ(loaded[0].perimeter.size(), records[0].perimeter.size());
  std::error_code ec;
  fs::remove(p, ec);

  // Degenerate bounds name the zone.
  ASSERT_TRUE(ParseJson(R"([{"id": 5, "bounds": [[3, 2], [1, 4]]}])", root, err));
  EXPECT_FALSE(ParseZoneRecords(root, records, err));
  EXPECT_TRUE(err.find("zone 5") != std::string::npos);

  ASSERT_TRUE(ParseJson(R"([{"id": 1, "bounds": [[0, 0], [1, 1]]}, {"id": 1, "bounds": [[0, 0], [1, 1]]}])", root, err));
  EXPECT_FALSE(ParseZoneRecords(root, records, err));

  ASSERT_TRUE(ParseJson(R"([{"id": 2, "bounds": [[0, 0], [1, 1]], "perimeter": [[0, 0], [1, 1]]}])", root, err));
  EXPECT_FALSE(ParseZoneRecords(root, records, err));

  std::vector<ZoneRecord> bad = {MakeZone(9, "x", MakeBounds(0, 0, 0, 1))};
  EXPECT_FALSE(WriteZoneRecordsFile(p.string(), bad, err));

  const std::vector<ZoneRecord> defaults = DefaultZoneRecords();
  ASSERT_TRUE(defaults.size() == 5);
  EXPECT_EQ(defaults[2].name, std::string("pink"));
  EXPECT_EQ(defaults[2].imagePath, std::string("mapzone/pinkzone.png"));
  EXPECT_EQ(defaults[0].bounds, DefaultAreaBounds());
}

static void TestZoneCategories()
{
  EXPECT_EQ(NormalizeZoneName("  Yellow ZONE "), std::string("yellow"));
  EXPECT_EQ(NormalizeZoneName("pink"), std::string("pink"));

  const ZoneCategory pink = LookupZoneCategory("Pink Zone");
  EXPECT_EQ(pink.key, std::string("pink"));
  EXPECT_EQ(pink.risk, RiskLevel::High);
  EXPECT_EQ(pink.floodType, std::string("100-yr Flood"));
  EXPECT_FALSE(pink.insurance.empty());

  const ZoneCategory orange = LookupZoneCategory("orange");
  EXPECT_EQ(orange.risk, RiskLevel::Low);
  EXPECT_EQ(orange.floodChance, std::string("0.2% chance"));
  EXPECT_TRUE(orange.insurance.empty());

  const ZoneCategory swamp = LookupZoneCategory("Swamp");
  EXPECT_EQ(swamp.title, std::string("Swamp Zone"));
  EXPECT_EQ(swamp.risk, RiskLevel::Unknown);
  EXPECT_EQ(swamp.color, std::string("#666"));
}

static void TestGeoJsonExport()
{
  ZoneRecord a = MakeZone(1, "green", MakeBounds(1, 2, 3, 4));
  ZoneRecord b = MakeZone(2, "pink", MakeBounds(0, 0, 10, 10));
  b.perimeter = {GeoPoint{0, 0}, GeoPoint{10, 0}, GeoPoint{10, 10}, GeoPoint{0, 0}};

  std::ostringstream oss;
  std::string err;
  EXPECT_TRUE(WriteZonesGeoJson(oss, {a, b}, err));
  const std::string text = oss.str();
  EXPECT_TRUE(text.find("FeatureCollection") != std::string::npos);

  JsonValue root;
  ASSERT_TRUE(ParseJson(text, root, err));
  const JsonValue* features = FindJsonMember(root, "features");
  ASSERT_TRUE(features && features->isArray() && features->arrayValue.size() == 2);

  const JsonValue& f0 = features->arrayValue[0];
  const JsonValue* props = FindJsonMember(f0, "properties");
  ASSERT_TRUE(props != nullptr);
  EXPECT_EQ(FindJsonMember(*props, "source")->stringValue, std::string("bounds"));
  EXPECT_EQ(FindJsonMember(*props, "color")->stringValue, std::string("#32cd32"));

  // Bounds ring starts at the south-west corner, emitted as [lng, lat].
  const JsonValue* geom = FindJsonMember(f0, "geometry");
  ASSERT_TRUE(geom != nullptr);
  const JsonValue* coords = FindJsonMember(*geom, "coordinates");
  ASSERT_TRUE(coords && coords->arrayValue.size() == 1);
  const JsonValue& ring = coords->arrayValue[0];
  ASSERT_TRUE(ring.arrayValue.size() == 5);
  EXPECT_EQ(ring.arrayValue[0].arrayValue[0].numberValue, 2.0);
  EXPECT_EQ(ring.arrayValue[0].arrayValue[1].numberValue, 1.0);

  const JsonValue* props1 = FindJsonMember(features->arrayValue[1], "properties");
  ASSERT_TRUE(props1 != nullptr);
  EXPECT_EQ(FindJsonMember(*props1, "source")->stringValue, std::string("perimeter"));

  // Only displayed zones, in stacking order.
  ZoneStore store;
  EXPECT_TRUE(store.UpsertZone(a, err));
  EXPECT_TRUE(store.UpsertZone(b, err));
  EXPECT_TRUE(store.ActivateZone(2));
  std::ostringstream active;
  EXPECT_TRUE(WriteActiveZonesGeoJson(active, store, err));
  ASSERT_TRUE(ParseJson(active.str(), root, err));
  features = FindJsonMember(root, "features");
  ASSERT_TRUE(features && features->arrayValue.size() == 1);
}

static void TestLogTeeWritesPrefixedLines()
{
  const fs::path p = MakeTempPath("hazmap_log").string() + ".log";
  std::string err;
  {
    LogTee tee;
    LogTeeOptions opt;
    opt.path = p;
    opt.header = "hazmap_tests";
    ASSERT_TRUE(tee.start(opt, err));
    EXPECT_TRUE(tee.active());
    std::cout << "logtee probe line\n";
    std::cout.flush();
  }
  const std::string first = ReadWholeFile(p);
  EXPECT_TRUE(first.find("hazmap_tests") != std::string::npos);
  EXPECT_TRUE(first.find("[OUT] logtee probe line") != std::string::npos);

  {
    LogTee tee;
    LogTeeOptions opt;
    opt.path = p;
    ASSERT_TRUE(tee.start(opt, err));
  }
  std::error_code ec;
  const fs::path rotated = p.string() + ".1";
  EXPECT_TRUE(fs::exists(rotated, ec));
  EXPECT_TRUE(ReadWholeFile(rotated).find("logtee probe line") != std::string::npos);

  fs::remove(p, ec);
  fs::remove(rotated, ec);
}

int main()
{
  TestCoordinateRoundTrip();
  TestValidateBoundsRejectsDegenerate();
  TestRasterSampling();
  TestContentBoundsCenteredSquare();
  TestContentBoundsNoContent();
  TestEdgePixelsAndThinning();
  TestNearestNeighborJumpRule();
  TestDouglasPeucker();
  TestPerimeterOfSquare();
  TestPerimeterSimplifiesLargeOutlines();

  TestStackingOrderResolvesOverlap();
  TestCheckPixelsOnlyRemovesMatches();
  TestAlphaHitTest();
  TestUnavailableRasterFallsBackToBounds();
  TestPipelineLoadsRasterFromDisk();

  TestPreviewDoesNotMutateCommitted();
  TestScaleScenarios();
  TestCommitTransform();
  TestBatchTransformsSkipAndContinue();
  TestBoundsOps();

  TestChecksumsAndInflate();
  TestPngRoundTripThroughFile();
  TestPpmDecodesOpaque();
  TestJsonParseAndWrite();
  TestEngineConfigOverrides();
  TestZoneRecordsJson();
  TestZoneCategories();
  TestGeoJsonExport();
  TestLogTeeWritesPrefixedLines();

  if (g_failures == 0) {
    std::cout << "hazmap_tests: OK\n";
    return 0;
  }

  std::cerr << "hazmap_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
