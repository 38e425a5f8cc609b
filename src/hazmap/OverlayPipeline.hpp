#pragma once

#include "hazmap/ContentBounds.hpp"
#include "hazmap/EngineConfig.hpp"
#include "hazmap/Perimeter.hpp"
#include "hazmap/Raster.hpp"
#include "hazmap/ZoneStore.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hazmap {

// Glue between decoded rasters and the zone store.
//
// Once a zone's raster is decoded the pipeline caches its content bounds and
// (optionally) extracts the perimeter ring. Every degraded outcome (no content,
// no perimeter, raster unavailable) is recorded in the report rather than treated
// as an error: the zone keeps working with bounds-only hit testing.

struct OverlayReport {
  ZoneId id = 0;
  RasterState state = RasterState::Pending;

  int imageWidth = 0;
  int imageHeight = 0;

  std::optional<ContentBounds> content;

  bool perimeterRequested = false;
  bool perimeterExtracted = false;
  PerimeterStats perimeterStats;

  // Content-adjusted display bounds at the time of the report.
  GeoBounds displayBounds;

  std::vector<std::string> warnings;

  bool degraded() const { return !warnings.empty(); }
};

// Attach a decoded raster to zone `id`. Returns false only when the zone is unknown or
// the raster buffer is malformed (outError set).
bool AttachRaster(ZoneStore& store, ZoneId id, RasterImage raster, const EngineConfig& cfg, bool wantPerimeter,
                  OverlayReport* outReport, std::string& outError);

// Record a decode failure; the zone falls back to bounds-only geometry.
bool MarkRasterUnavailable(ZoneStore& store, ZoneId id, const std::string& reason, OverlayReport* outReport = nullptr);

// Resolve the record's image_path against assetRoot (a leading '/' is ignored).
std::string ResolveImagePath(const std::string& assetRoot, const std::string& imagePath);

// Decode the zone's raster from disk and attach it. A decode failure is not an error:
// the zone is marked unavailable and the function returns true. Returns false only for
// an unknown zone.
bool LoadZoneRaster(ZoneStore& store, ZoneId id, const std::string& assetRoot, const EngineConfig& cfg,
                    bool wantPerimeter, OverlayReport* outReport, std::string& outError);

// Displayed bounds trimmed to the colored area when content bounds are cached,
// otherwise the displayed (or committed) bounds.
GeoBounds DisplayBounds(const ZoneEntry& e);

} // namespace hazmap
