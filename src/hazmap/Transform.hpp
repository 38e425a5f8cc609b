#pragma once

#include "hazmap/EngineConfig.hpp"
#include "hazmap/Types.hpp"
#include "hazmap/ZoneStore.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace hazmap {

// Transform engine.
//
// Per-zone state machine:
//   Base --Preview*--> Previewing --CommitTransform--> Base (new bounds + base size)
//                                 --DiscardPreview---> Base (unchanged)
//
// Preview* functions only touch ZoneEntry::preview. Persisted bounds, the record and
// the cached base size change exclusively in Commit*.
//
// Scale and rotation are independent: scaling keeps the accumulated rotation,
// rotating never moves the anchor or the displayed bounds.

enum class TransformStatus : std::uint8_t {
  Ok = 0,
  UnknownZone,
  MissingBaseSize, // zone never displayed this session
  MissingAnchor,   // zone not currently displayed
  InvalidFactor,   // non-finite or non-positive scale, non-finite angle/anchor
  DegenerateBounds,
};

const char* TransformStatusName(TransformStatus s);

struct BatchTransformReport {
  std::vector<ZoneId> applied;
  std::vector<std::pair<ZoneId, TransformStatus>> skipped;

  // PreviewRotateAll only: anchors put back after drifting.
  int anchorsRestored = 0;

  bool allApplied() const { return skipped.empty(); }
};

// Preview scale and MoveAnchor return DegenerateBounds, leaving the preview as it was,
// when the displayed rectangle would collapse to zero span.
TransformStatus PreviewScale(ZoneStore& store, ZoneId id, double factor);

// percent = 100 is the committed size.
TransformStatus PreviewScalePercent(ZoneStore& store, ZoneId id, double percent);

TransformStatus PreviewRotate(ZoneStore& store, ZoneId id, double degrees);

// Translate: recenter the displayed rectangle (at the current preview scale) on `anchor`.
TransformStatus MoveAnchor(ZoneStore& store, ZoneId id, const GeoPoint& anchor);

// Drop preview state back to the committed geometry.
TransformStatus DiscardPreview(ZoneStore& store, ZoneId id);

// Fold scale + anchor into new base bounds (base size * scale, centered on the anchor),
// persist rotation, reset scale to 1. outBounds (optional) receives the new bounds.
// A cached perimeter is carried over to the new bounds.
TransformStatus CommitTransform(ZoneStore& store, ZoneId id, GeoBounds* outBounds = nullptr);

// Persist translation only: bounds = base size centered on the anchor. Scale and
// rotation of the record are left as they are.
TransformStatus CommitPosition(ZoneStore& store, ZoneId id, GeoBounds* outBounds = nullptr);

// Batch variants over the active zones (stacking order). Zones that fail are skipped
// and reported; siblings are unaffected.
BatchTransformReport PreviewScaleAll(ZoneStore& store, double factor);
BatchTransformReport PreviewRotateAll(ZoneStore& store, double degrees, const EngineConfig& cfg = {});
BatchTransformReport CommitAll(ZoneStore& store);
BatchTransformReport CommitAllPositions(ZoneStore& store);

// Human-readable one-line summary ("applied 3, skipped 1 (zone 4: missing anchor)").
std::string DescribeBatchReport(const BatchTransformReport& r);

} // namespace hazmap
