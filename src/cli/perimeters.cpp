#include "cli/CliParse.hpp"

#include "hazmap/ConfigIO.hpp"
#include "hazmap/ContentBounds.hpp"
#include "hazmap/CoordMapper.hpp"
#include "hazmap/GeoJsonExport.hpp"
#include "hazmap/LogTee.hpp"
#include "hazmap/OverlayPipeline.hpp"
#include "hazmap/Version.hpp"
#include "hazmap/ZoneRecord.hpp"
#include "hazmap/ZoneStore.hpp"

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace hazmap;
using namespace hazmap::cli;

static void PrintHelp()
{
  std::cout
      << "hazmap_perimeters (" << VersionString() << ")\n\n"
      << "Decode each zone's raster, report its content bounds and detect its perimeter ring.\n"
      << "Results are written back into the zone file.\n\n"
      << "Usage:\n"
      << "  hazmap_perimeters --zones <zones.json> [options]\n\n"
      << "Options:\n"
      << "  --zones <path>         Zone file (JSON array of zone records). Required.\n"
      << "  --assets <dir>         Root directory image_path values are resolved against (default: .).\n"
      << "  --out <path>           Write updated records here instead of overwriting --zones.\n"
      << "  --dry-run              Report only; do not write the zone file.\n"
      << "  --no-perimeter         Only report content bounds.\n"
      << "  --adjust-bounds        Trim bounds to the colored area. The image extent is kept in\n"
      << "                         original_bounds so the step can be repeated safely.\n"
      << "  --id <N[,N...]>        Only process these zones.\n"
      << "  --geojson <path>       Also write a GeoJSON FeatureCollection of the result.\n"
      << "  --config <path>        Engine config JSON overrides (see EngineConfig).\n"
      << "  --log <path>           Tee stdout/stderr into a rotated log file.\n"
      << "  -h, --help             Show this help.\n";
}

static void PrintContent(const OverlayReport& r)
{
  if (!r.content) {
    std::cout << "  content: none\n";
    return;
  }
  const ContentBounds& c = *r.content;
  std::cout << "  content: px [" << c.minPx << "," << c.minPy << "]-[" << c.maxPx << "," << c.maxPy << "]"
            << " norm [" << std::fixed << std::setprecision(4) << c.rect.minX << "," << c.rect.minY << "]-["
            << c.rect.maxX << "," << c.rect.maxY << "]" << std::defaultfloat << std::setprecision(6);
  if (c.coversWholeImage()) std::cout << " (whole image)";
  std::cout << "\n";
}

static void PrintPerimeter(const OverlayReport& r)
{
  if (!r.perimeterRequested) return;
  const PerimeterStats& s = r.perimeterStats;
  std::cout << "  perimeter: edge=" << s.edgePixels << " thinned=" << s.thinnedPoints << " segments=" << s.pathSegments
            << " simplified=" << (s.simplified ? "yes" : "no");
  if (r.perimeterExtracted) {
    std::cout << " ring=" << s.ringVertices;
  } else {
    std::cout << " ring=none";
  }
  std::cout << "\n";
}

} // namespace

int main(int argc, char** argv)
{
  std::string zonesPath;
  std::string assetRoot = ".";
  std::string outPath;
  std::string geojsonPath;
  std::string configPath;
  std::string logPath;
  std::vector<int> onlyIds;
  bool dryRun = false;
  bool wantPerimeter = true;
  bool adjustBounds = false;

  auto requireValue = [&](int& i, std::string& out) -> bool {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    } else if (arg == "--zones") {
      if (!requireValue(i, zonesPath)) {
        std::cerr << "--zones expects a path\n";
        return 2;
      }
    } else if (arg == "--assets") {
      if (!requireValue(i, assetRoot)) {
        std::cerr << "--assets expects a directory\n";
        return 2;
      }
    } else if (arg == "--out") {
      if (!requireValue(i, outPath)) {
        std::cerr << "--out expects a path\n";
        return 2;
      }
    } else if (arg == "--geojson") {
      if (!requireValue(i, geojsonPath)) {
        std::cerr << "--geojson expects a path\n";
        return 2;
      }
    } else if (arg == "--config") {
      if (!requireValue(i, configPath)) {
        std::cerr << "--config expects a path\n";
        return 2;
      }
    } else if (arg == "--log") {
      if (!requireValue(i, logPath)) {
        std::cerr << "--log expects a path\n";
        return 2;
      }
    } else if (arg == "--id") {
      std::string v;
      if (!requireValue(i, v) || !ParseIdList(v, &onlyIds) || onlyIds.empty()) {
        std::cerr << "--id expects a comma separated list of zone ids\n";
        return 2;
      }
    } else if (arg == "--dry-run") {
      dryRun = true;
    } else if (arg == "--no-perimeter") {
      wantPerimeter = false;
    } else if (arg == "--adjust-bounds") {
      adjustBounds = true;
    } else {
      std::cerr << "Unknown arg: " << arg << "\n";
      std::cerr << "Use --help for usage.\n";
      return 2;
    }
  }

  if (zonesPath.empty()) {
    std::cerr << "--zones is required\n";
    std::cerr << "Use --help for usage.\n";
    return 2;
  }

  LogTee logTee;
  if (!logPath.empty()) {
    LogTeeOptions opt;
    opt.path = logPath;
    opt.header = "hazmap_perimeters " + VersionString();
    std::string err;
    if (!logTee.start(opt, err)) {
      std::cerr << "Failed to start log: " << err << "\n";
      return 2;
    }
  }

  EngineConfig cfg;
  if (!configPath.empty()) {
    std::string err;
    if (!LoadEngineConfigJsonFile(configPath, cfg, err)) {
      std::cerr << "Failed to load config: " << configPath << "\n";
      std::cerr << err << "\n";
      return 2;
    }
  }

  std::vector<ZoneRecord> records;
  {
    std::string err;
    if (!LoadZoneRecordsFile(zonesPath, records, err)) {
      std::cerr << "Failed to load zones: " << zonesPath << "\n";
      std::cerr << err << "\n";
      return 2;
    }
  }
  std::cout << "loaded " << records.size() << " zones from " << zonesPath << "\n";

  auto selected = [&](ZoneId id) {
    if (onlyIds.empty()) return true;
    for (int v : onlyIds) {
      if (v == id) return true;
    }
    return false;
  };

  ZoneStore store(cfg.alphaThresholdU8());
  std::size_t processed = 0;
  std::size_t degraded = 0;

  for (ZoneRecord& rec : records) {
    if (!selected(rec.id)) continue;

    // The raster always spans the image extent; after an earlier --adjust-bounds run
    // that extent lives in original_bounds.
    const GeoBounds extent = rec.originalBounds.value_or(rec.bounds);

    ZoneRecord work = rec;
    work.bounds = extent;
    std::string err;
    if (!store.UpsertZone(work, err)) {
      std::cerr << "zone " << rec.id << ": " << err << "\n";
      return 2;
    }

    OverlayReport report;
    if (!LoadZoneRaster(store, rec.id, assetRoot, cfg, wantPerimeter, &report, err)) {
      std::cerr << "zone " << rec.id << ": " << err << "\n";
      return 2;
    }
    ++processed;

    std::cout << "zone " << rec.id << " (" << rec.name << "): " << RasterStateName(report.state);
    if (report.state == RasterState::Ready) {
      std::cout << " " << report.imageWidth << "x" << report.imageHeight;
    }
    std::cout << "\n";
    PrintContent(report);
    PrintPerimeter(report);

    if (report.degraded()) {
      ++degraded;
      for (const std::string& w : report.warnings) {
        std::cerr << "zone " << rec.id << " degraded: " << w << "\n";
      }
    }

    const ZoneEntry* e = store.find(rec.id);
    if (e && report.perimeterExtracted) rec.perimeter = e->record.perimeter;

    if (adjustBounds && report.content && !report.content->coversWholeImage()) {
      const GeoBounds adjusted = AdjustBoundsToContent(extent, report.content->rect);
      if (!ValidateBounds(adjusted, err)) {
        std::cerr << "zone " << rec.id << " degraded: adjusted bounds rejected (" << err << ")\n";
        ++degraded;
        continue;
      }
      rec.originalBounds = extent;
      rec.bounds = adjusted;
      std::cout << "  bounds: [[" << adjusted.south << "," << adjusted.west << "],[" << adjusted.north << ","
                << adjusted.east << "]]\n";
    }
  }

  std::cout << "processed " << processed << " zones (" << degraded << " degraded)\n";

  if (!dryRun) {
    const std::string dst = outPath.empty() ? zonesPath : outPath;
    if (!EnsureParentDir(dst)) {
      std::cerr << "Failed to create parent dirs for: " << dst << "\n";
      return 2;
    }
    std::string err;
    if (!WriteZoneRecordsFile(dst, records, err)) {
      std::cerr << "Failed to write zones: " << err << "\n";
      return 2;
    }
    std::cout << "wrote zones -> " << dst << "\n";
  }

  if (!geojsonPath.empty()) {
    if (!EnsureParentDir(geojsonPath)) {
      std::cerr << "Failed to create parent dirs for: " << geojsonPath << "\n";
      return 2;
    }
    std::string err;
    if (!WriteZonesGeoJsonFile(geojsonPath, records, err, true)) {
      std::cerr << "Failed to write GeoJSON: " << err << "\n";
      return 2;
    }
    std::cout << "wrote geojson -> " << geojsonPath << "\n";
  }

  return 0;
}
