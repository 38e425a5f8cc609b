#include "hazmap/Transform.hpp"

#include "hazmap/BoundsOps.hpp"
#include "hazmap/CoordMapper.hpp"

#include <cmath>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace hazmap {

namespace {

// Common preconditions. On success `outEntry` is the zone and it has both a base size
// and an anchor.
TransformStatus Resolve(ZoneStore& store, ZoneId id, ZoneEntry** outEntry)
{
  ZoneEntry* e = store.find(id);
  if (!e) return TransformStatus::UnknownZone;
  if (!e->committed.baseSize) return TransformStatus::MissingBaseSize;
  if (!e->preview) return TransformStatus::MissingAnchor;
  *outEntry = e;
  return TransformStatus::Ok;
}

GeoBounds ScaledAround(const GeoPoint& anchor, const LatLngSpan& base, double factor)
{
  return BoundsAround(anchor, LatLngSpan{base.lat * factor, base.lng * factor});
}

bool ValidScale(double f)
{
  return std::isfinite(f) && f > 0.0;
}

template <typename Fn>
BatchTransformReport ForEachActive(ZoneStore& store, Fn fn)
{
  BatchTransformReport report;
  // Copy: the callbacks never change the active set, but keep iteration independent of it.
  const std::vector<ZoneId> active = store.activeZones();
  for (ZoneId id : active) {
    const TransformStatus st = fn(id);
    if (st == TransformStatus::Ok) {
      report.applied.push_back(id);
    } else {
      report.skipped.emplace_back(id, st);
    }
  }
  return report;
}

} // namespace

const char* TransformStatusName(TransformStatus s)
{
  switch (s) {
  case TransformStatus::Ok: return "ok";
  case TransformStatus::UnknownZone: return "unknown zone";
  case TransformStatus::MissingBaseSize: return "missing base size";
  case TransformStatus::MissingAnchor: return "missing anchor";
  case TransformStatus::InvalidFactor: return "invalid factor";
  case TransformStatus::DegenerateBounds: return "degenerate bounds";
  }
  return "unknown";
}

TransformStatus PreviewScale(ZoneStore& store, ZoneId id, double factor)
{
  ZoneEntry* e = nullptr;
  const TransformStatus st = Resolve(store, id, &e);
  if (st != TransformStatus::Ok) return st;
  if (!ValidScale(factor)) return TransformStatus::InvalidFactor;

  PreviewTransform& p = *e->preview;
  const GeoBounds shown = ScaledAround(p.anchor, *e->committed.baseSize, factor);
  if (!IsValidBounds(shown)) return TransformStatus::DegenerateBounds;

  p.scale = factor;
  p.displayedBounds = shown;
  return TransformStatus::Ok;
}

TransformStatus PreviewScalePercent(ZoneStore& store, ZoneId id, double percent)
{
  return PreviewScale(store, id, percent / 100.0);
}

TransformStatus PreviewRotate(ZoneStore& store, ZoneId id, double degrees)
{
  ZoneEntry* e = nullptr;
  const TransformStatus st = Resolve(store, id, &e);
  if (st != TransformStatus::Ok) return st;
  if (!std::isfinite(degrees)) return TransformStatus::InvalidFactor;

  e->preview->rotationDeg = degrees;
  return TransformStatus::Ok;
}

TransformStatus MoveAnchor(ZoneStore& store, ZoneId id, const GeoPoint& anchor)
{
  ZoneEntry* e = nullptr;
  const TransformStatus st = Resolve(store, id, &e);
  if (st != TransformStatus::Ok) return st;
  if (!IsFinite(anchor)) return TransformStatus::InvalidFactor;

  PreviewTransform& p = *e->preview;
  const GeoBounds shown = ScaledAround(anchor, *e->committed.baseSize, p.scale);
  if (!IsValidBounds(shown)) return TransformStatus::DegenerateBounds;

  p.anchor = anchor;
  p.displayedBounds = shown;
  return TransformStatus::Ok;
}

TransformStatus DiscardPreview(ZoneStore& store, ZoneId id)
{
  ZoneEntry* e = store.find(id);
  if (!e) return TransformStatus::UnknownZone;
  if (!e->preview) return TransformStatus::MissingAnchor;
  e->preview = MakeBasePreview(*e);
  return TransformStatus::Ok;
}

TransformStatus CommitTransform(ZoneStore& store, ZoneId id, GeoBounds* outBounds)
{
  ZoneEntry* e = nullptr;
  const TransformStatus st = Resolve(store, id, &e);
  if (st != TransformStatus::Ok) return st;

  PreviewTransform& p = *e->preview;
  if (!ValidScale(p.scale)) return TransformStatus::InvalidFactor;

  const LatLngSpan base = *e->committed.baseSize;
  const LatLngSpan newBase{base.lat * p.scale, base.lng * p.scale};
  const GeoBounds newBounds = BoundsAround(p.anchor, newBase);
  if (!IsValidBounds(newBounds)) return TransformStatus::DegenerateBounds;

  const GeoBounds oldBounds = e->committed.bounds;

  // Bounds and base size change together.
  e->committed.bounds = newBounds;
  e->committed.baseSize = newBase;

  e->record.bounds = newBounds;
  e->record.rotationDeg = p.rotationDeg;
  e->record.scale = 1.0;
  if (e->record.hasPerimeter()) e->record.perimeter = RemapRing(e->record.perimeter, oldBounds, newBounds);

  p.scale = 1.0;
  p.displayedBounds = newBounds;

  if (outBounds) *outBounds = newBounds;
  return TransformStatus::Ok;
}

TransformStatus CommitPosition(ZoneStore& store, ZoneId id, GeoBounds* outBounds)
{
  ZoneEntry* e = nullptr;
  const TransformStatus st = Resolve(store, id, &e);
  if (st != TransformStatus::Ok) return st;

  const PreviewTransform& p = *e->preview;
  const GeoBounds newBounds = BoundsAround(p.anchor, *e->committed.baseSize);
  if (!IsValidBounds(newBounds)) return TransformStatus::DegenerateBounds;

  const GeoBounds oldBounds = e->committed.bounds;
  e->committed.bounds = newBounds;
  e->record.bounds = newBounds;
  if (e->record.hasPerimeter()) e->record.perimeter = RemapRing(e->record.perimeter, oldBounds, newBounds);

  if (outBounds) *outBounds = newBounds;
  return TransformStatus::Ok;
}

BatchTransformReport PreviewScaleAll(ZoneStore& store, double factor)
{
  return ForEachActive(store, [&](ZoneId id) { return PreviewScale(store, id, factor); });
}

BatchTransformReport PreviewRotateAll(ZoneStore& store, double degrees, const EngineConfig& cfg)
{
  std::map<ZoneId, GeoPoint> anchors;
  for (ZoneId id : store.activeZones()) {
    const ZoneEntry* e = store.find(id);
    if (e && e->preview) anchors[id] = e->preview->anchor;
  }

  BatchTransformReport report = ForEachActive(store, [&](ZoneId id) { return PreviewRotate(store, id, degrees); });

  // PreviewRotate never touches the anchor, so this only fires for a rotation that
  // also recenters the zone.
  for (const auto& kv : anchors) {
    ZoneEntry* e = store.find(kv.first);
    if (!e || !e->preview) continue;
    const GeoPoint now = e->preview->anchor;
    if (std::fabs(now.lat - kv.second.lat) > cfg.anchorDriftTolerance ||
        std::fabs(now.lng - kv.second.lng) > cfg.anchorDriftTolerance) {
      e->preview->anchor = kv.second;
      ++report.anchorsRestored;
    }
  }
  return report;
}

BatchTransformReport CommitAll(ZoneStore& store)
{
  return ForEachActive(store, [&](ZoneId id) { return CommitTransform(store, id); });
}

BatchTransformReport CommitAllPositions(ZoneStore& store)
{
  return ForEachActive(store, [&](ZoneId id) { return CommitPosition(store, id); });
}

std::string DescribeBatchReport(const BatchTransformReport& r)
{
  std::ostringstream oss;
  oss << "applied " << r.applied.size() << ", skipped " << r.skipped.size();
  if (!r.skipped.empty()) {
    oss << " (";
    for (std::size_t i = 0; i < r.skipped.size(); ++i) {
      if (i) oss << "; ";
      oss << "zone " << r.skipped[i].first << ": " << TransformStatusName(r.skipped[i].second);
    }
    oss << ")";
  }
  if (r.anchorsRestored > 0) oss << ", anchors restored " << r.anchorsRestored;
  return oss.str();
}

} // namespace hazmap
