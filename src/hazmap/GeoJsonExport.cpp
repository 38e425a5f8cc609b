#include "hazmap/GeoJsonExport.hpp"

#include "hazmap/Json.hpp"
#include "hazmap/ZoneCategory.hpp"
#include "hazmap/ZoneStore.hpp"

#include <fstream>
#include <ostream>

namespace hazmap {

void WriteGeoJsonRing(JsonWriter& w, const std::vector<GeoPoint>& ring)
{
  w.beginArray();
  for (const GeoPoint& p : ring) {
    w.beginArray();
    w.numberValue(p.lng);
    w.numberValue(p.lat);
    w.endArray();
  }
  w.endArray();
}

std::vector<GeoPoint> BoundsRing(const GeoBounds& b)
{
  return {GeoPoint{b.south, b.west}, GeoPoint{b.south, b.east}, GeoPoint{b.north, b.east},
          GeoPoint{b.north, b.west}, GeoPoint{b.south, b.west}};
}

void WriteZoneFeature(JsonWriter& w, const ZoneRecord& r)
{
  const bool usePerimeter = r.hasPerimeter();

  w.beginObject();
  w.member("type", std::string("Feature"));

  w.key("properties");
  w.beginObject();
  w.key("id");
  w.intValue(r.id);
  w.member("name", r.name);
  w.member("color", LookupZoneCategory(r.name).color);
  w.member("rotation", r.rotationDeg);
  w.member("opacity", r.opacity);
  w.member("source", std::string(usePerimeter ? "perimeter" : "bounds"));
  w.endObject();

  w.key("geometry");
  w.beginObject();
  w.member("type", std::string("Polygon"));
  w.key("coordinates");
  w.beginArray();
  WriteGeoJsonRing(w, usePerimeter ? r.perimeter : BoundsRing(r.bounds));
  w.endArray();
  w.endObject();

  w.endObject();
}

namespace {

template <typename Range>
bool WriteCollection(std::ostream& os, const Range& records, std::string& outError, bool pretty)
{
  JsonWriteOptions opt;
  opt.pretty = pretty;
  JsonWriter w(os, opt);

  w.beginObject();
  w.member("type", std::string("FeatureCollection"));
  w.key("features");
  w.beginArray();
  for (const ZoneRecord* r : records) WriteZoneFeature(w, *r);
  w.endArray();
  w.endObject();

  if (!w.ok()) {
    outError = w.error();
    return false;
  }
  os << '\n';
  if (!os) {
    outError = "stream write failed";
    return false;
  }
  return true;
}

} // namespace

bool WriteZonesGeoJson(std::ostream& os, const std::vector<ZoneRecord>& records, std::string& outError, bool pretty)
{
  std::vector<const ZoneRecord*> refs;
  refs.reserve(records.size());
  for (const ZoneRecord& r : records) refs.push_back(&r);
  return WriteCollection(os, refs, outError, pretty);
}

bool WriteActiveZonesGeoJson(std::ostream& os, const ZoneStore& store, std::string& outError, bool pretty)
{
  std::vector<const ZoneRecord*> refs;
  for (ZoneId id : store.activeZones()) {
    if (const ZoneEntry* e = store.find(id)) refs.push_back(&e->record);
  }
  return WriteCollection(os, refs, outError, pretty);
}

bool WriteZonesGeoJsonFile(const std::string& path, const std::vector<ZoneRecord>& records, std::string& outError,
                           bool pretty)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  return WriteZonesGeoJson(f, records, outError, pretty);
}

} // namespace hazmap
