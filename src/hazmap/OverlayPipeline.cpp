#include "hazmap/OverlayPipeline.hpp"

#include "hazmap/CoordMapper.hpp"
#include "hazmap/RasterIO.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace hazmap {

GeoBounds DisplayBounds(const ZoneEntry& e)
{
  const GeoBounds& shown = e.preview ? e.preview->displayedBounds : e.committed.bounds;
  if (e.rasterState == RasterState::Ready && e.content) return AdjustBoundsToContent(shown, e.content->rect);
  return shown;
}

bool AttachRaster(ZoneStore& store, ZoneId id, RasterImage raster, const EngineConfig& cfg, bool wantPerimeter,
                  OverlayReport* outReport, std::string& outError)
{
  ZoneEntry* e = store.find(id);
  if (!e) {
    outError = "unknown zone id " + std::to_string(id);
    return false;
  }
  if (!IsValidRaster(raster)) {
    outError = "zone " + std::to_string(id) + ": raster buffer does not match its dimensions";
    return false;
  }

  OverlayReport report;
  report.id = id;
  report.perimeterRequested = wantPerimeter;
  report.imageWidth = raster.width;
  report.imageHeight = raster.height;

  const std::uint8_t threshold = cfg.alphaThresholdU8();

  e->rasterState = RasterState::Ready;
  e->rasterError.clear();
  e->content = DetectContentBounds(raster, threshold);
  report.content = e->content;
  if (!e->content) report.warnings.push_back("no colored pixels; using full-image bounds");

  if (wantPerimeter) {
    std::optional<std::vector<GeoPoint>> ring = ExtractPerimeter(raster, e->committed.bounds, cfg,
                                                                 &report.perimeterStats);
    if (ring) {
      e->record.perimeter = std::move(*ring);
      report.perimeterExtracted = true;
    } else {
      report.warnings.push_back("no perimeter; hit testing falls back to bounds");
    }
  }

  e->raster = std::move(raster);
  report.state = e->rasterState;
  report.displayBounds = DisplayBounds(*e);
  if (outReport) *outReport = std::move(report);
  return true;
}

bool MarkRasterUnavailable(ZoneStore& store, ZoneId id, const std::string& reason, OverlayReport* outReport)
{
  ZoneEntry* e = store.find(id);
  if (!e) return false;

  e->rasterState = RasterState::Unavailable;
  e->rasterError = reason;
  e->raster = RasterImage{};
  e->content.reset();

  if (outReport) {
    OverlayReport report;
    report.id = id;
    report.state = e->rasterState;
    report.displayBounds = DisplayBounds(*e);
    report.warnings.push_back("raster unavailable (" + reason + "); bounds-only mode");
    *outReport = std::move(report);
  }
  return true;
}

std::string ResolveImagePath(const std::string& assetRoot, const std::string& imagePath)
{
  std::string rel = imagePath;
  while (!rel.empty() && (rel.front() == '/' || rel.front() == '\\')) rel.erase(rel.begin());
  if (assetRoot.empty()) return rel;
  return (std::filesystem::path(assetRoot) / std::filesystem::path(rel)).string();
}

bool LoadZoneRaster(ZoneStore& store, ZoneId id, const std::string& assetRoot, const EngineConfig& cfg,
                    bool wantPerimeter, OverlayReport* outReport, std::string& outError)
{
  const ZoneEntry* e = store.find(id);
  if (!e) {
    outError = "unknown zone id " + std::to_string(id);
    return false;
  }

  if (e->record.imagePath.empty()) {
    MarkRasterUnavailable(store, id, "zone has no image_path", outReport);
    return true;
  }

  const std::string path = ResolveImagePath(assetRoot, e->record.imagePath);
  RasterImage img;
  std::string err;
  if (!ReadRasterAuto(path, img, err)) {
    MarkRasterUnavailable(store, id, err, outReport);
    return true;
  }

  return AttachRaster(store, id, std::move(img), cfg, wantPerimeter, outReport, outError);
}

} // namespace hazmap
