#pragma once

#include "hazmap/Json.hpp"
#include "hazmap/Types.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace hazmap {

// Persisted zone record, as exchanged with the zone store collaborator.
//
// JSON form (one element of the zone file array):
//   {
//     "id": 1,
//     "name": "green",
//     "image_path": "mapzone/greenzone.png",
//     "bounds": [[south, west], [north, east]],
//     "opacity": 0.6,
//     "scale": 1.0,
//     "rotation": 0,
//     "perimeter": [[lat, lng], ...],          (optional, closed ring)
//     "original_bounds": [[s, w], [n, e]]      (optional, bounds before content adjustment)
//   }
struct ZoneRecord {
  ZoneId id = 0;
  std::string name;
  std::string imagePath;
  GeoBounds bounds;
  double opacity = 0.6;
  double scale = 1.0;
  double rotationDeg = 0.0;

  std::vector<GeoPoint> perimeter;
  std::optional<GeoBounds> originalBounds;

  bool hasPerimeter() const { return !perimeter.empty(); }
};

// Parse/serialize [[s,w],[n,e]].
bool ParseBoundsJson(const JsonValue& v, GeoBounds& out, std::string& outError);
void WriteBoundsJson(JsonWriter& w, const GeoBounds& b);

// Parse one record. Bounds are validated; a perimeter is closed if needed and must
// have at least 3 distinct vertices.
bool ParseZoneRecord(const JsonValue& v, ZoneRecord& out, std::string& outError);

// Parse a zone file (top-level array). Duplicate ids are rejected.
bool ParseZoneRecords(const JsonValue& root, std::vector<ZoneRecord>& out, std::string& outError);
bool LoadZoneRecordsFile(const std::string& path, std::vector<ZoneRecord>& out, std::string& outError);

void WriteZoneRecord(JsonWriter& w, const ZoneRecord& r);
std::string ZoneRecordsToJson(const std::vector<ZoneRecord>& records, int indentSpaces = 2);
bool WriteZoneRecordsFile(const std::string& path, const std::vector<ZoneRecord>& records, std::string& outError,
                          int indentSpaces = 2);

// Next id for a newly created zone: max existing id + 1 (1 for an empty set).
ZoneId NextZoneId(const std::vector<ZoneRecord>& records);

const ZoneRecord* FindZoneRecord(const std::vector<ZoneRecord>& records, ZoneId id);
ZoneRecord* FindZoneRecord(std::vector<ZoneRecord>& records, ZoneId id);

// Default study area ([[27.7,-97.540496],[27.9,-97.259504]]): lat span 0.2, lng span
// matching a 2550x1815 zone image.
GeoBounds DefaultAreaBounds();

// The five category zones (green, orange, pink, purple, yellow) with ids 1..5.
std::vector<ZoneRecord> DefaultZoneRecords();

} // namespace hazmap
