#include "cli/CliParse.hpp"

#include "hazmap/ConfigIO.hpp"
#include "hazmap/GeoJsonExport.hpp"
#include "hazmap/LogTee.hpp"
#include "hazmap/OverlayPipeline.hpp"
#include "hazmap/Version.hpp"
#include "hazmap/ZoneCategory.hpp"
#include "hazmap/ZoneRecord.hpp"
#include "hazmap/ZoneStore.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace hazmap;
using namespace hazmap::cli;

static void PrintHelp()
{
  std::cout
      << "hazmap_query (" << VersionString() << ")\n\n"
      << "Report the topmost displayed zone at one or more points.\n\n"
      << "Usage:\n"
      << "  hazmap_query --zones <zones.json> --point <lat,lng> [--point ...] [options]\n\n"
      << "Options:\n"
      << "  --zones <path>         Zone file. Required.\n"
      << "  --point <lat,lng>      Query point (repeatable).\n"
      << "  --active <N[,N...]>    Displayed zones, bottom first (default: all zones by id).\n"
      << "  --check-pixels         Also require the point inside each zone's colored area.\n"
      << "                         Same as --mode content.\n"
      << "  --mode <m>             bounds | content | alpha (default: bounds).\n"
      << "  --assets <dir>         Image root; rasters are decoded when the mode needs them (default: .).\n"
      << "  --geojson <path>       Write the displayed zones as a GeoJSON FeatureCollection.\n"
      << "  --config <path>        Engine config JSON overrides.\n"
      << "  --log <path>           Tee stdout/stderr into a rotated log file.\n"
      << "  -h, --help             Show this help.\n";
}

} // namespace

int main(int argc, char** argv)
{
  std::string zonesPath;
  std::string assetRoot = ".";
  std::string geojsonPath;
  std::string configPath;
  std::string logPath;
  std::vector<GeoPoint> points;
  std::vector<int> activeIds;
  bool haveActive = false;
  HitTestMode mode = HitTestMode::Bounds;

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
    } else if (arg == "--point") {
      std::string v;
      GeoPoint p;
      if (!requireValue(i, v) || !ParseLatLng(v, &p.lat, &p.lng)) {
        std::cerr << "--point expects lat,lng\n";
        return 2;
      }
      points.push_back(p);
    } else if (arg == "--active") {
      std::string v;
      if (!requireValue(i, v) || !ParseIdList(v, &activeIds)) {
        std::cerr << "--active expects a comma separated list of zone ids\n";
        return 2;
      }
      haveActive = true;
    } else if (arg == "--check-pixels") {
      mode = HitTestMode::ContentBounds;
    } else if (arg == "--mode") {
      std::string v;
      if (!requireValue(i, v) || !ParseHitTestMode(v, mode)) {
        std::cerr << "--mode expects bounds|content|alpha\n";
        return 2;
      }
    } else if (arg == "--assets") {
      if (!requireValue(i, assetRoot)) {
        std::cerr << "--assets expects a directory\n";
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
    } else {
      std::cerr << "Unknown arg: " << arg << "\n";
      std::cerr << "Use --help for usage.\n";
      return 2;
    }
  }

  if (zonesPath.empty() || (points.empty() && geojsonPath.empty())) {
    std::cerr << "--zones and at least one --point (or --geojson) are required\n";
    std::cerr << "Use --help for usage.\n";
    return 2;
  }

  LogTee logTee;
  if (!logPath.empty()) {
    LogTeeOptions opt;
    opt.path = logPath;
    opt.header = "hazmap_query " + VersionString();
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

  ZoneStore store(cfg.alphaThresholdU8());
  for (const ZoneRecord& r : records) {
    std::string err;
    if (!store.UpsertZone(r, err)) {
      std::cerr << "zone " << r.id << ": " << err << "\n";
      return 2;
    }
  }

  if (!haveActive) activeIds = store.ids();
  for (int id : activeIds) {
    if (!store.ActivateZone(id)) {
      std::cerr << "unknown zone id " << id << "\n";
      return 2;
    }
  }

  if (mode != HitTestMode::Bounds) {
    for (int id : activeIds) {
      OverlayReport report;
      std::string err;
      if (!LoadZoneRaster(store, id, assetRoot, cfg, false, &report, err)) {
        std::cerr << "zone " << id << ": " << err << "\n";
        return 2;
      }
      for (const std::string& w : report.warnings) {
        std::cerr << "zone " << id << " degraded: " << w << "\n";
      }
    }
  }

  for (const GeoPoint& p : points) {
    const std::optional<ZoneId> hit = store.GetZoneAtPointPrecise(p.lat, p.lng, mode);
    std::cout << p.lat << "," << p.lng << " [" << HitTestModeName(mode) << "]: ";
    if (!hit) {
      std::cout << "none\n";
      continue;
    }
    const ZoneEntry* e = store.find(*hit);
    const ZoneCategory cat = LookupZoneCategory(e ? e->record.name : std::string());
    std::cout << "zone " << *hit << " " << cat.title << " (" << cat.riskLabel;
    if (!cat.floodType.empty()) std::cout << ", " << cat.floodType << ", " << cat.floodChance;
    if (!cat.insurance.empty()) std::cout << ", " << cat.insurance;
    std::cout << ")\n";
  }

  if (!geojsonPath.empty()) {
    if (!EnsureParentDir(geojsonPath)) {
      std::cerr << "Failed to create parent dirs for: " << geojsonPath << "\n";
      return 2;
    }
    std::ofstream f(geojsonPath, std::ios::binary);
    if (!f) {
      std::cerr << "Failed to open: " << geojsonPath << "\n";
      return 2;
    }
    std::string err;
    if (!WriteActiveZonesGeoJson(f, store, err, true)) {
      std::cerr << "Failed to write GeoJSON: " << err << "\n";
      return 2;
    }
    std::cout << "wrote geojson -> " << geojsonPath << "\n";
  }

  return 0;
}
