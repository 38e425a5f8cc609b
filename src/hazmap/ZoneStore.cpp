#include "hazmap/ZoneStore.hpp"

#include "hazmap/CoordMapper.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace hazmap {

const char* RasterStateName(RasterState s)
{
  switch (s) {
  case RasterState::Pending: return "pending";
  case RasterState::Ready: return "ready";
  case RasterState::Unavailable: return "unavailable";
  }
  return "unknown";
}

const char* HitTestModeName(HitTestMode m)
{
  switch (m) {
  case HitTestMode::Bounds: return "bounds";
  case HitTestMode::ContentBounds: return "content";
  case HitTestMode::Alpha: return "alpha";
  }
  return "unknown";
}

bool ParseHitTestMode(const std::string& s, HitTestMode& out)
{
  if (s == "bounds") {
    out = HitTestMode::Bounds;
  } else if (s == "content" || s == "content_bounds") {
    out = HitTestMode::ContentBounds;
  } else if (s == "alpha" || s == "pixels") {
    out = HitTestMode::Alpha;
  } else {
    return false;
  }
  return true;
}

PreviewTransform MakeBasePreview(const ZoneEntry& e)
{
  PreviewTransform p;
  p.displayedBounds = e.committed.bounds;
  p.anchor = e.committed.bounds.center();
  p.scale = 1.0;
  p.rotationDeg = e.record.rotationDeg;
  return p;
}

bool ZoneStore::UpsertZone(const ZoneRecord& record, std::string& outError)
{
  std::string err;
  if (!ValidateBounds(record.bounds, err)) {
    outError = "zone " + std::to_string(record.id) + ": " + err;
    return false;
  }

  auto it = m_zones.find(record.id);
  if (it == m_zones.end()) {
    ZoneEntry e;
    e.record = record;
    e.committed.bounds = record.bounds;
    m_zones.emplace(record.id, std::move(e));
    return true;
  }

  ZoneEntry& e = it->second;
  e.record = record;
  e.committed.bounds = record.bounds;
  if (e.preview) e.preview = MakeBasePreview(e);
  return true;
}

bool ZoneStore::RemoveZone(ZoneId id)
{
  if (m_zones.erase(id) == 0) return false;
  m_active.erase(std::remove(m_active.begin(), m_active.end(), id), m_active.end());
  return true;
}

bool ZoneStore::SetActiveZones(const std::vector<ZoneId>& ids, std::string& outError)
{
  std::set<ZoneId> seen;
  for (ZoneId id : ids) {
    if (m_zones.find(id) == m_zones.end()) {
      outError = "unknown zone id " + std::to_string(id);
      return false;
    }
    if (!seen.insert(id).second) {
      outError = "duplicate zone id " + std::to_string(id) + " in active set";
      return false;
    }
  }

  for (ZoneId id : std::vector<ZoneId>(m_active)) {
    if (seen.count(id) == 0) DeactivateZone(id);
  }
  m_active.clear();
  for (ZoneId id : ids) ActivateZone(id);
  return true;
}

bool ZoneStore::ActivateZone(ZoneId id)
{
  ZoneEntry* e = find(id);
  if (!e) return false;

  m_active.erase(std::remove(m_active.begin(), m_active.end(), id), m_active.end());
  m_active.push_back(id);

  // First display this session caches the base size.
  if (!e->committed.baseSize) e->committed.baseSize = SpanOf(e->committed.bounds);
  if (!e->preview) e->preview = MakeBasePreview(*e);
  return true;
}

bool ZoneStore::DeactivateZone(ZoneId id)
{
  auto it = std::find(m_active.begin(), m_active.end(), id);
  if (it == m_active.end()) return false;
  m_active.erase(it);

  // Hiding a zone abandons any unsaved preview.
  if (ZoneEntry* e = find(id)) e->preview.reset();
  return true;
}

bool ZoneStore::isActive(ZoneId id) const
{
  return std::find(m_active.begin(), m_active.end(), id) != m_active.end();
}

const ZoneEntry* ZoneStore::find(ZoneId id) const
{
  auto it = m_zones.find(id);
  return it == m_zones.end() ? nullptr : &it->second;
}

ZoneEntry* ZoneStore::find(ZoneId id)
{
  auto it = m_zones.find(id);
  return it == m_zones.end() ? nullptr : &it->second;
}

std::vector<ZoneId> ZoneStore::ids() const
{
  std::vector<ZoneId> out;
  out.reserve(m_zones.size());
  for (const auto& kv : m_zones) out.push_back(kv.first);
  return out;
}

std::vector<ZoneRecord> ZoneStore::records() const
{
  std::vector<ZoneRecord> out;
  out.reserve(m_zones.size());
  for (const auto& kv : m_zones) out.push_back(kv.second.record);
  return out;
}

bool ZoneStore::ZoneContainsPoint(const ZoneEntry& e, double lat, double lng, HitTestMode mode) const
{
  if (!e.committed.bounds.contains(lat, lng)) return false;
  if (mode == HitTestMode::Bounds) return true;

  // Without a decoded raster there is nothing finer to test against.
  if (e.rasterState != RasterState::Ready || !e.content) return true;

  const GeoBounds& shown = e.preview ? e.preview->displayedBounds : e.committed.bounds;
  const PixelPoint n = GeoToNormalized(lat, lng, shown);
  if (!e.content->rect.contains(n.x, n.y)) return false;
  if (mode == HitTestMode::ContentBounds) return true;

  const int px = static_cast<int>(std::floor(n.x * static_cast<double>(e.raster.width)));
  const int py = static_cast<int>(std::floor(n.y * static_cast<double>(e.raster.height)));
  // The content rectangle is inclusive of its far edge; clamp that edge onto the last pixel.
  const int cx = std::min(px, e.raster.width - 1);
  const int cy = std::min(py, e.raster.height - 1);
  return IsColored(e.raster, cx, cy, m_alphaThreshold);
}

std::optional<ZoneId> ZoneStore::GetZoneAtPoint(double lat, double lng, bool checkPixels) const
{
  return GetZoneAtPointPrecise(lat, lng, checkPixels ? HitTestMode::ContentBounds : HitTestMode::Bounds);
}

std::optional<ZoneId> ZoneStore::GetZoneAtPointPrecise(double lat, double lng, HitTestMode mode) const
{
  for (auto it = m_active.rbegin(); it != m_active.rend(); ++it) {
    const ZoneEntry* e = find(*it);
    if (!e) continue;
    if (ZoneContainsPoint(*e, lat, lng, mode)) return *it;
  }
  return std::nullopt;
}

} // namespace hazmap
