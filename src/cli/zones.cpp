#include "cli/CliParse.hpp"

#include "hazmap/BoundsOps.hpp"
#include "hazmap/ConfigIO.hpp"
#include "hazmap/CoordMapper.hpp"
#include "hazmap/LogTee.hpp"
#include "hazmap/OverlayPipeline.hpp"
#include "hazmap/RasterIO.hpp"
#include "hazmap/Transform.hpp"
#include "hazmap/Version.hpp"
#include "hazmap/ZoneCategory.hpp"
#include "hazmap/ZoneRecord.hpp"
#include "hazmap/ZoneStore.hpp"

#include <cstddef>
#include <filesystem>
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
      << "hazmap_zones (" << VersionString() << ")\n\n"
      << "Maintain a zone file: create the default zones, list them and batch edit their bounds.\n\n"
      << "Usage:\n"
      << "  hazmap_zones --zones <zones.json> <command> [args] [options]\n\n"
      << "Commands:\n"
      << "  init                   Write the five default category zones (only when the file is\n"
      << "                         missing or empty, unless --force).\n"
      << "  list                   Print every zone with its category defaults.\n"
      << "  scale <factor>         Scale bounds about their centers.\n"
      << "  shift <lat> <lng>      Move bounds (positive lat = south, positive lng = east).\n"
      << "  fit-aspect             Match each zone's longitude span to its image aspect ratio\n"
      << "                         (requires --assets).\n"
      << "  transform              Preview and commit a transform for one zone (requires --id).\n"
      << "      --scale-pct <P>      Size relative to the committed size (100 = unchanged).\n"
      << "      --rotate <deg>       Rotation in degrees.\n"
      << "      --anchor <lat,lng>   New center.\n"
      << "      --position-only      Persist the anchor only; keep size, rotation and scale.\n\n"
      << "Options:\n"
      << "  --zones <path>         Zone file. Required.\n"
      << "  --id <N[,N...]>        Restrict scale/shift/fit-aspect to these zones.\n"
      << "  --assets <dir>         Image root for fit-aspect (default: .).\n"
      << "  --out <path>           Write here instead of overwriting --zones.\n"
      << "  --dry-run              Print the result without writing.\n"
      << "  --force                Allow init to overwrite existing zones.\n"
      << "  --config <path>        Engine config JSON overrides.\n"
      << "  --log <path>           Tee stdout/stderr into a rotated log file.\n"
      << "  -h, --help             Show this help.\n";
}

static void PrintBounds(std::ostream& os, const GeoBounds& b)
{
  os << "[[" << b.south << "," << b.west << "],[" << b.north << "," << b.east << "]]";
}

static GeoBounds RemapBounds(const GeoBounds& b, const GeoBounds& from, const GeoBounds& to)
{
  const std::vector<GeoPoint> corners = RemapRing({GeoPoint{b.south, b.west}, GeoPoint{b.north, b.east}}, from, to);
  return GeoBounds{corners[0].lat, corners[0].lng, corners[1].lat, corners[1].lng};
}

// Carry the parts of a record that are tied to its bounds (perimeter, original image
// extent) over to new bounds.
static void RebaseRecord(ZoneRecord& r, const GeoBounds& newBounds)
{
  const GeoBounds old = r.bounds;
  if (r.hasPerimeter()) r.perimeter = RemapRing(r.perimeter, old, newBounds);
  if (r.originalBounds) r.originalBounds = RemapBounds(*r.originalBounds, old, newBounds);
  r.bounds = newBounds;
}

static void ListZones(const std::vector<ZoneRecord>& records)
{
  for (const ZoneRecord& r : records) {
    const ZoneCategory cat = LookupZoneCategory(r.name);
    std::cout << r.id << "  " << cat.title << "  " << cat.color << "  " << RiskLevelName(cat.risk);
    if (!cat.floodType.empty()) std::cout << " (" << cat.floodType << ", " << cat.floodChance << ")";
    std::cout << "\n    bounds ";
    PrintBounds(std::cout, r.bounds);
    std::cout << "\n    opacity " << r.opacity << "  scale " << r.scale << "  rotation " << r.rotationDeg;
    if (r.hasPerimeter()) std::cout << "  perimeter " << r.perimeter.size() << " vertices";
    if (!r.imagePath.empty()) std::cout << "\n    image " << r.imagePath;
    std::cout << "\n";
  }
}

} // namespace

int main(int argc, char** argv)
{
  std::string zonesPath;
  std::string outPath;
  std::string assetRoot = ".";
  std::string configPath;
  std::string logPath;
  std::vector<int> ids;
  bool dryRun = false;
  bool force = false;

  std::optional<double> scalePct;
  std::optional<double> rotateDeg;
  std::optional<GeoPoint> anchor;
  bool positionOnly = false;

  std::vector<std::string> positional;

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
    } else if (arg == "--out") {
      if (!requireValue(i, outPath)) {
        std::cerr << "--out expects a path\n";
        return 2;
      }
    } else if (arg == "--assets") {
      if (!requireValue(i, assetRoot)) {
        std::cerr << "--assets expects a directory\n";
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
      if (!requireValue(i, v) || !ParseIdList(v, &ids) || ids.empty()) {
        std::cerr << "--id expects a comma separated list of zone ids\n";
        return 2;
      }
    } else if (arg == "--scale-pct") {
      std::string v;
      double d = 0.0;
      if (!requireValue(i, v) || !ParseF64(v, &d) || d <= 0.0) {
        std::cerr << "--scale-pct expects a positive number\n";
        return 2;
      }
      scalePct = d;
    } else if (arg == "--rotate") {
      std::string v;
      double d = 0.0;
      if (!requireValue(i, v) || !ParseF64(v, &d)) {
        std::cerr << "--rotate expects degrees\n";
        return 2;
      }
      rotateDeg = d;
    } else if (arg == "--anchor") {
      std::string v;
      GeoPoint p;
      if (!requireValue(i, v) || !ParseLatLng(v, &p.lat, &p.lng)) {
        std::cerr << "--anchor expects lat,lng\n";
        return 2;
      }
      anchor = p;
    } else if (arg == "--position-only") {
      positionOnly = true;
    } else if (arg == "--dry-run") {
      dryRun = true;
    } else if (arg == "--force") {
      force = true;
    } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
      std::cerr << "Unknown arg: " << arg << "\n";
      std::cerr << "Use --help for usage.\n";
      return 2;
    } else {
      // Commands and their numeric arguments (which may be negative).
      positional.push_back(arg);
    }
  }

  if (zonesPath.empty() || positional.empty()) {
    std::cerr << "--zones and a command are required\n";
    std::cerr << "Use --help for usage.\n";
    return 2;
  }
  const std::string cmd = positional[0];

  LogTee logTee;
  if (!logPath.empty()) {
    LogTeeOptions opt;
    opt.path = logPath;
    opt.header = "hazmap_zones " + VersionString();
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
    std::error_code ec;
    const bool exists = std::filesystem::exists(zonesPath, ec);
    std::string err;
    if (exists && !LoadZoneRecordsFile(zonesPath, records, err)) {
      // init may replace an unreadable file only when forced.
      if (cmd != "init" || !force) {
        std::cerr << "Failed to load zones: " << zonesPath << "\n";
        std::cerr << err << "\n";
        return 2;
      }
      records.clear();
    } else if (!exists && cmd != "init") {
      std::cerr << "Zone file not found: " << zonesPath << "\n";
      return 2;
    }
  }

  auto selected = [&](ZoneId id) {
    if (ids.empty()) return true;
    for (int v : ids) {
      if (v == id) return true;
    }
    return false;
  };

  bool modified = false;

  if (cmd == "list") {
    if (positional.size() != 1) {
      std::cerr << "list takes no arguments\n";
      return 2;
    }
    ListZones(records);
    return 0;
  } else if (cmd == "init") {
    if (!records.empty() && !force) {
      std::cout << zonesPath << " already has " << records.size() << " zones; nothing to do (use --force)\n";
      return 0;
    }
    records = DefaultZoneRecords();
    std::cout << "created " << records.size() << " default zones\n";
    modified = true;
  } else if (cmd == "scale") {
    double factor = 0.0;
    if (positional.size() != 2 || !ParseF64(positional[1], &factor) || factor <= 0.0) {
      std::cerr << "scale expects a positive factor\n";
      return 2;
    }
    for (ZoneRecord& r : records) {
      if (!selected(r.id)) continue;
      RebaseRecord(r, ScaleBoundsAboutCenter(r.bounds, factor));
      std::cout << "zone " << r.id << " -> ";
      PrintBounds(std::cout, r.bounds);
      std::cout << "\n";
      modified = true;
    }
  } else if (cmd == "shift") {
    double dLat = 0.0;
    double dLng = 0.0;
    if (positional.size() != 3 || !ParseF64(positional[1], &dLat) || !ParseF64(positional[2], &dLng)) {
      std::cerr << "shift expects <lat> <lng>\n";
      return 2;
    }
    for (ZoneRecord& r : records) {
      if (!selected(r.id)) continue;
      RebaseRecord(r, ShiftBounds(r.bounds, dLat, dLng));
      std::cout << "zone " << r.id << " -> ";
      PrintBounds(std::cout, r.bounds);
      std::cout << "\n";
      modified = true;
    }
  } else if (cmd == "fit-aspect") {
    for (ZoneRecord& r : records) {
      if (!selected(r.id)) continue;
      RasterImage img;
      std::string err;
      if (r.imagePath.empty() || !ReadRasterAuto(ResolveImagePath(assetRoot, r.imagePath), img, err)) {
        std::cerr << "zone " << r.id << ": skipped, image unavailable"
                  << (err.empty() ? std::string() : " (" + err + ")") << "\n";
        continue;
      }
      bool changed = false;
      const GeoBounds fitted = FitBoundsToAspect(r.bounds, img.width, img.height, cfg.aspectTolerance, &changed);
      if (!changed) {
        std::cout << "zone " << r.id << ": aspect already matches " << img.width << "x" << img.height << "\n";
        continue;
      }
      RebaseRecord(r, fitted);
      std::cout << "zone " << r.id << " (" << img.width << "x" << img.height << ") -> ";
      PrintBounds(std::cout, r.bounds);
      std::cout << "\n";
      modified = true;
    }
  } else if (cmd == "transform") {
    if (ids.size() != 1) {
      std::cerr << "transform expects exactly one --id\n";
      return 2;
    }
    if (!scalePct && !rotateDeg && !anchor) {
      std::cerr << "transform expects at least one of --scale-pct, --rotate, --anchor\n";
      return 2;
    }
    const ZoneId id = ids[0];

    ZoneStore store(cfg.alphaThresholdU8());
    for (const ZoneRecord& r : records) {
      std::string err;
      if (!store.UpsertZone(r, err)) {
        std::cerr << "zone " << r.id << ": " << err << "\n";
        return 2;
      }
    }
    if (!store.ActivateZone(id)) {
      std::cerr << "unknown zone id " << id << "\n";
      return 2;
    }

    auto check = [&](const char* what, TransformStatus st) -> bool {
      if (st == TransformStatus::Ok) return true;
      std::cerr << what << " failed for zone " << id << ": " << TransformStatusName(st) << "\n";
      return false;
    };

    if (anchor && !check("move", MoveAnchor(store, id, *anchor))) return 1;
    if (scalePct && !check("scale", PreviewScalePercent(store, id, *scalePct))) return 1;
    if (rotateDeg && !check("rotate", PreviewRotate(store, id, *rotateDeg))) return 1;

    GeoBounds committed;
    const TransformStatus st =
        positionOnly ? CommitPosition(store, id, &committed) : CommitTransform(store, id, &committed);
    if (!check("commit", st)) return 1;

    const ZoneRecord* prior = FindZoneRecord(records, id);
    const GeoBounds before = prior ? prior->bounds : committed;
    records = store.records();
    ZoneRecord* updated = FindZoneRecord(records, id);
    if (updated && updated->originalBounds) {
      updated->originalBounds = RemapBounds(*updated->originalBounds, before, committed);
    }
    std::cout << "zone " << id << " -> ";
    PrintBounds(std::cout, committed);
    if (updated) std::cout << " rotation " << updated->rotationDeg;
    std::cout << "\n";
    modified = true;
  } else {
    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Use --help for usage.\n";
    return 2;
  }

  if (!modified) {
    std::cout << "no zones changed\n";
    return 0;
  }

  for (const ZoneRecord& r : records) {
    std::string err;
    if (!ValidateBounds(r.bounds, err)) {
      std::cerr << "zone " << r.id << ": result rejected: " << err << "\n";
      return 1;
    }
  }

  if (dryRun) {
    std::cout << ZoneRecordsToJson(records) << "\n";
    return 0;
  }

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
  std::cout << "wrote " << records.size() << " zones -> " << dst << "\n";
  return 0;
}
