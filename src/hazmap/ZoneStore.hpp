#pragma once

#include "hazmap/ContentBounds.hpp"
#include "hazmap/Raster.hpp"
#include "hazmap/Types.hpp"
#include "hazmap/ZoneRecord.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hazmap {

// Authoritative geometry of a zone. Changes only through UpsertZone (collaborator
// reload) or a transform commit.
struct CommittedGeometry {
  GeoBounds bounds;

  // Span of the bounds at the time the zone was first displayed this session.
  // Replaced only by a commit; absent until the zone is first activated.
  std::optional<LatLngSpan> baseSize;
};

// Live, never-persisted display state of an active zone.
struct PreviewTransform {
  GeoBounds displayedBounds;
  GeoPoint anchor;
  double scale = 1.0;
  double rotationDeg = 0.0;
};

enum class RasterState : std::uint8_t {
  Pending = 0, // not decoded yet: hit tests use bounds only
  Ready,
  Unavailable, // decode failed: bounds only, permanently for this session
};

const char* RasterStateName(RasterState s);

struct ZoneEntry {
  ZoneRecord record;
  CommittedGeometry committed;

  // Present while the zone is active (displayed). The anchor lives here, so an
  // inactive zone has no anchor.
  std::optional<PreviewTransform> preview;

  RasterState rasterState = RasterState::Pending;
  std::string rasterError;
  RasterImage raster;
  std::optional<ContentBounds> content;
};

enum class HitTestMode : std::uint8_t {
  Bounds = 0,    // rectangle containment only
  ContentBounds, // also require the point inside the colored-pixel rectangle
  Alpha,         // also require the mapped raster pixel to be colored
};

const char* HitTestModeName(HitTestMode m);
bool ParseHitTestMode(const std::string& s, HitTestMode& out);

// In-memory zone registry: one entry per zone id plus the ordered set of active
// (displayed) zones. Stacking order is the active list order; the last element is
// drawn on top.
class ZoneStore {
public:
  explicit ZoneStore(std::uint8_t alphaThreshold = kDefaultAlphaThreshold) : m_alphaThreshold(alphaThreshold) {}

  // Insert or replace a zone record. Bounds are validated. For an existing zone the
  // cached base size and raster caches are kept; an active zone's preview is reset
  // to the new bounds.
  bool UpsertZone(const ZoneRecord& record, std::string& outError);

  // Drop the zone and every cache for it (also removes it from the active set).
  bool RemoveZone(ZoneId id);

  // Replace the active set; ids[0] is the bottom of the stack. Unknown or duplicate
  // ids are rejected and leave the active set unchanged.
  bool SetActiveZones(const std::vector<ZoneId>& ids, std::string& outError);

  // Show a zone on top of the stack (moves it to the top if already active).
  bool ActivateZone(ZoneId id);
  bool DeactivateZone(ZoneId id);

  bool isActive(ZoneId id) const;
  const std::vector<ZoneId>& activeZones() const { return m_active; }

  const ZoneEntry* find(ZoneId id) const;
  ZoneEntry* find(ZoneId id);

  std::size_t size() const { return m_zones.size(); }
  bool empty() const { return m_zones.empty(); }

  // All ids, ascending.
  std::vector<ZoneId> ids() const;

  // Current records (ascending id), reflecting any commits.
  std::vector<ZoneRecord> records() const;

  std::uint8_t alphaThreshold() const { return m_alphaThreshold; }

  // Topmost active zone containing the point.
  //
  // checkPixels=false: base-bounds containment only.
  // checkPixels=true : zones whose raster is decoded and has cached content bounds must
  //                    also contain the point inside the content rectangle (normalized
  //                    against the displayed bounds). Enabling it only removes matches.
  std::optional<ZoneId> GetZoneAtPoint(double lat, double lng, bool checkPixels) const;
  std::optional<ZoneId> GetZoneAtPointPrecise(double lat, double lng, HitTestMode mode) const;

  // Single-zone test used by the queries above.
  bool ZoneContainsPoint(const ZoneEntry& e, double lat, double lng, HitTestMode mode) const;

private:
  std::uint8_t m_alphaThreshold = kDefaultAlphaThreshold;
  std::map<ZoneId, ZoneEntry> m_zones;
  std::vector<ZoneId> m_active;
};

// Fresh preview for an active zone: committed bounds, anchor at their center, scale 1,
// rotation from the record.
PreviewTransform MakeBasePreview(const ZoneEntry& e);

} // namespace hazmap
