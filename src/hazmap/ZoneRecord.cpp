#include "hazmap/ZoneRecord.hpp"

#include "hazmap/CoordMapper.hpp"
#include "hazmap/Perimeter.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace hazmap {

namespace {

std::string ZoneLabel(const ZoneRecord& r)
{
  return "zone " + std::to_string(r.id);
}

bool ParseLatLngPair(const JsonValue& v, double& a, double& b)
{
  if (!v.isArray() || v.arrayValue.size() != 2) return false;
  const JsonValue& x = v.arrayValue[0];
  const JsonValue& y = v.arrayValue[1];
  if (!x.isNumber() || !y.isNumber()) return false;
  a = x.numberValue;
  b = y.numberValue;
  return std::isfinite(a) && std::isfinite(b);
}

bool ApplyOptionalNumber(const JsonValue& obj, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v || v->isNull()) return true;
  if (!v->isNumber() || !std::isfinite(v->numberValue)) {
    err = std::string("expected finite number for '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

bool ApplyOptionalString(const JsonValue& obj, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v || v->isNull()) return true;
  if (!v->isString()) {
    err = std::string("expected string for '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

} // namespace

bool ParseBoundsJson(const JsonValue& v, GeoBounds& out, std::string& outError)
{
  if (!v.isArray() || v.arrayValue.size() != 2) {
    outError = "bounds must be [[south, west], [north, east]]";
    return false;
  }
  GeoBounds b;
  if (!ParseLatLngPair(v.arrayValue[0], b.south, b.west) || !ParseLatLngPair(v.arrayValue[1], b.north, b.east)) {
    outError = "bounds corners must be [lat, lng] number pairs";
    return false;
  }
  if (!ValidateBounds(b, outError)) return false;
  out = b;
  return true;
}

void WriteBoundsJson(JsonWriter& w, const GeoBounds& b)
{
  w.beginArray();
  w.beginArray();
  w.numberValue(b.south);
  w.numberValue(b.west);
  w.endArray();
  w.beginArray();
  w.numberValue(b.north);
  w.numberValue(b.east);
  w.endArray();
  w.endArray();
}

bool ParseZoneRecord(const JsonValue& v, ZoneRecord& out, std::string& outError)
{
  if (!v.isObject()) {
    outError = "zone record must be an object";
    return false;
  }

  ZoneRecord r;
  const JsonValue* id = FindJsonMember(v, "id");
  if (!id || !id->isNumber() || !std::isfinite(id->numberValue) || id->numberValue != std::floor(id->numberValue) ||
      std::fabs(id->numberValue) > 2147483647.0) {
    outError = "zone record is missing an integer 'id'";
    return false;
  }
  r.id = static_cast<ZoneId>(id->numberValue);

  std::string err;
  if (!ApplyOptionalString(v, "name", r.name, err) || !ApplyOptionalString(v, "image_path", r.imagePath, err) ||
      !ApplyOptionalNumber(v, "opacity", r.opacity, err) || !ApplyOptionalNumber(v, "scale", r.scale, err) ||
      !ApplyOptionalNumber(v, "rotation", r.rotationDeg, err)) {
    outError = ZoneLabel(r) + ": " + err;
    return false;
  }
  if (r.opacity < 0.0 || r.opacity > 1.0) {
    outError = ZoneLabel(r) + ": opacity must be in [0,1]";
    return false;
  }
  if (!(r.scale > 0.0)) {
    outError = ZoneLabel(r) + ": scale must be > 0";
    return false;
  }

  const JsonValue* bounds = FindJsonMember(v, "bounds");
  if (!bounds) {
    outError = ZoneLabel(r) + ": missing 'bounds'";
    return false;
  }
  if (!ParseBoundsJson(*bounds, r.bounds, err)) {
    outError = ZoneLabel(r) + ": " + err;
    return false;
  }

  const JsonValue* orig = FindJsonMember(v, "original_bounds");
  if (orig && !orig->isNull()) {
    GeoBounds ob;
    if (!ParseBoundsJson(*orig, ob, err)) {
      outError = ZoneLabel(r) + ": original_bounds: " + err;
      return false;
    }
    r.originalBounds = ob;
  }

  const JsonValue* perim = FindJsonMember(v, "perimeter");
  if (perim && !perim->isNull()) {
    if (!perim->isArray()) {
      outError = ZoneLabel(r) + ": perimeter must be an array of [lat, lng]";
      return false;
    }
    r.perimeter.reserve(perim->arrayValue.size() + 1);
    for (const JsonValue& p : perim->arrayValue) {
      GeoPoint g;
      if (!ParseLatLngPair(p, g.lat, g.lng)) {
        outError = ZoneLabel(r) + ": perimeter vertices must be [lat, lng] number pairs";
        return false;
      }
      r.perimeter.push_back(g);
    }
    if (!r.perimeter.empty()) {
      CloseRing(r.perimeter);
      if (CountDistinctVertices(r.perimeter) < 3) {
        outError = ZoneLabel(r) + ": perimeter needs at least 3 distinct vertices";
        return false;
      }
    }
  }

  out = std::move(r);
  return true;
}

bool ParseZoneRecords(const JsonValue& root, std::vector<ZoneRecord>& out, std::string& outError)
{
  if (!root.isArray()) {
    outError = "zone file must be a JSON array";
    return false;
  }

  std::vector<ZoneRecord> records;
  records.reserve(root.arrayValue.size());
  std::set<ZoneId> seen;
  for (std::size_t i = 0; i < root.arrayValue.size(); ++i) {
    ZoneRecord r;
    std::string err;
    if (!ParseZoneRecord(root.arrayValue[i], r, err)) {
      outError = "record " + std::to_string(i) + ": " + err;
      return false;
    }
    if (!seen.insert(r.id).second) {
      outError = "duplicate zone id " + std::to_string(r.id);
      return false;
    }
    records.push_back(std::move(r));
  }

  out = std::move(records);
  outError.clear();
  return true;
}

bool LoadZoneRecordsFile(const std::string& path, std::vector<ZoneRecord>& out, std::string& outError)
{
  JsonValue root;
  std::string err;
  if (!LoadJsonFile(path, root, err)) {
    outError = err;
    return false;
  }
  if (!ParseZoneRecords(root, out, err)) {
    outError = path + ": " + err;
    return false;
  }
  return true;
}

void WriteZoneRecord(JsonWriter& w, const ZoneRecord& r)
{
  w.beginObject();
  w.key("id");
  w.intValue(r.id);
  w.member("name", r.name);
  w.member("image_path", r.imagePath);
  w.key("bounds");
  WriteBoundsJson(w, r.bounds);
  w.member("opacity", r.opacity);
  w.member("scale", r.scale);
  w.member("rotation", r.rotationDeg);
  if (r.hasPerimeter()) {
    w.key("perimeter");
    w.beginArray();
    for (const GeoPoint& p : r.perimeter) {
      w.beginArray();
      w.numberValue(p.lat);
      w.numberValue(p.lng);
      w.endArray();
    }
    w.endArray();
  }
  if (r.originalBounds) {
    w.key("original_bounds");
    WriteBoundsJson(w, *r.originalBounds);
  }
  w.endObject();
}

std::string ZoneRecordsToJson(const std::vector<ZoneRecord>& records, int indentSpaces)
{
  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;

  JsonWriter w(oss, opt);
  w.beginArray();
  for (const ZoneRecord& r : records) WriteZoneRecord(w, r);
  w.endArray();
  if (opt.pretty) oss << '\n';
  return oss.str();
}

bool WriteZoneRecordsFile(const std::string& path, const std::vector<ZoneRecord>& records, std::string& outError,
                          int indentSpaces)
{
  for (const ZoneRecord& r : records) {
    std::string err;
    if (!ValidateBounds(r.bounds, err)) {
      outError = ZoneLabel(r) + ": " + err;
      return false;
    }
  }

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  f << ZoneRecordsToJson(records, indentSpaces);
  if (!f) {
    outError = "failed while writing: " + path;
    return false;
  }
  outError.clear();
  return true;
}

ZoneId NextZoneId(const std::vector<ZoneRecord>& records)
{
  ZoneId maxId = 0;
  for (const ZoneRecord& r : records) maxId = std::max(maxId, r.id);
  return maxId + 1;
}

const ZoneRecord* FindZoneRecord(const std::vector<ZoneRecord>& records, ZoneId id)
{
  for (const ZoneRecord& r : records) {
    if (r.id == id) return &r;
  }
  return nullptr;
}

ZoneRecord* FindZoneRecord(std::vector<ZoneRecord>& records, ZoneId id)
{
  for (ZoneRecord& r : records) {
    if (r.id == id) return &r;
  }
  return nullptr;
}

GeoBounds DefaultAreaBounds()
{
  GeoBounds b;
  b.south = 27.7;
  b.west = -97.540496;
  b.north = 27.9;
  b.east = -97.259504;
  return b;
}

std::vector<ZoneRecord> DefaultZoneRecords()
{
  static const char* kNames[] = {"green", "orange", "pink", "purple", "yellow"};

  std::vector<ZoneRecord> out;
  ZoneId id = 1;
  for (const char* name : kNames) {
    ZoneRecord r;
    r.id = id++;
    r.name = name;
    r.imagePath = std::string("mapzone/") + name + "zone.png";
    r.bounds = DefaultAreaBounds();
    r.opacity = 0.6;
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace hazmap
