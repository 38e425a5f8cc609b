#pragma once

#include "hazmap/Types.hpp"
#include "hazmap/ZoneRecord.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace hazmap {

class JsonWriter;
class ZoneStore;

// GeoJSON output for zone geometry.
//
// Coordinates are emitted as [lng, lat] (GeoJSON axis order). Each zone becomes one
// Polygon feature: its perimeter ring when present, otherwise its bounds rectangle.
//
// Feature properties:
//   id, name, color (category default), rotation, opacity,
//   source ("perimeter" | "bounds")

// [[lng,lat], ...]; the ring is expected to be closed.
void WriteGeoJsonRing(JsonWriter& w, const std::vector<GeoPoint>& ring);

// Closed counter-clockwise ring of a rectangle: SW, SE, NE, NW, SW.
std::vector<GeoPoint> BoundsRing(const GeoBounds& b);

void WriteZoneFeature(JsonWriter& w, const ZoneRecord& r);

bool WriteZonesGeoJson(std::ostream& os, const std::vector<ZoneRecord>& records, std::string& outError,
                       bool pretty = false);

// Active zones of a store, in stacking order (bottom first).
bool WriteActiveZonesGeoJson(std::ostream& os, const ZoneStore& store, std::string& outError, bool pretty = false);

bool WriteZonesGeoJsonFile(const std::string& path, const std::vector<ZoneRecord>& records, std::string& outError,
                           bool pretty = false);

} // namespace hazmap
