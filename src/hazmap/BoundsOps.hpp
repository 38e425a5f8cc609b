#pragma once

#include "hazmap/Types.hpp"

#include <vector>

namespace hazmap {

// Batch maintenance operations on persisted bounds (used by the zone tool).
// None of these validate their input; callers run ValidateBounds on the result.

// Scale both spans by `factor` about the rectangle center.
GeoBounds ScaleBoundsAboutCenter(const GeoBounds& b, double factor);

// Positive latShift moves the rectangle south, positive lngShift moves it east.
GeoBounds ShiftBounds(const GeoBounds& b, double latShift, double lngShift);

// Match the longitude span to an image aspect ratio (W/H), keeping the latitude span
// and the center. Bounds are left unchanged (and outChanged=false) when the current
// lngSpan/latSpan differs from W/H by no more than `tolerance`.
GeoBounds FitBoundsToAspect(const GeoBounds& b, int imageWidth, int imageHeight, double tolerance,
                            bool* outChanged = nullptr);

// Re-express a ring drawn over `from` so it keeps the same relative position over `to`.
std::vector<GeoPoint> RemapRing(const std::vector<GeoPoint>& ring, const GeoBounds& from, const GeoBounds& to);

// The four corners of `b` rotated by `degrees` (clockwise on screen, i.e. north-up
// maps) about its center, in order NW, NE, SE, SW. Rotation is applied in
// (lng, lat) degree space, matching a CSS rotate() of the overlay.
std::vector<GeoPoint> RotatedCorners(const GeoBounds& b, double degrees);

} // namespace hazmap
