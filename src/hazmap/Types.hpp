#pragma once

#include <cmath>
#include <cstdint>

namespace hazmap {

// Zone identifiers are assigned by the external zone store at creation time.
using ZoneId = int;

// Geographic coordinate in degrees.
struct GeoPoint {
  double lat = 0.0;
  double lng = 0.0;
};

inline bool operator==(const GeoPoint& a, const GeoPoint& b) { return a.lat == b.lat && a.lng == b.lng; }
inline bool operator!=(const GeoPoint& a, const GeoPoint& b) { return !(a == b); }

// Geographic rectangle. Serialized as [[south, west], [north, east]].
//
// A well-formed rectangle satisfies south < north and west < east; see
// ValidateBounds() in CoordMapper.hpp.
struct GeoBounds {
  double south = 0.0;
  double west = 0.0;
  double north = 0.0;
  double east = 0.0;

  double latSpan() const { return north - south; }
  double lngSpan() const { return east - west; }

  GeoPoint center() const { return GeoPoint{(south + north) * 0.5, (west + east) * 0.5}; }

  // Inclusive on all edges (a point on the border is inside).
  bool contains(double lat, double lng) const
  {
    return lat >= south && lat <= north && lng >= west && lng <= east;
  }
};

inline bool operator==(const GeoBounds& a, const GeoBounds& b)
{
  return a.south == b.south && a.west == b.west && a.north == b.north && a.east == b.east;
}
inline bool operator!=(const GeoBounds& a, const GeoBounds& b) { return !(a == b); }

// Latitude/longitude extent of a rectangle ("base size").
struct LatLngSpan {
  double lat = 0.0;
  double lng = 0.0;
};

inline bool operator==(const LatLngSpan& a, const LatLngSpan& b) { return a.lat == b.lat && a.lng == b.lng; }

inline LatLngSpan SpanOf(const GeoBounds& b) { return LatLngSpan{b.latSpan(), b.lngSpan()}; }

// Rectangle of the given span centered on `center`.
inline GeoBounds BoundsAround(const GeoPoint& center, const LatLngSpan& span)
{
  GeoBounds b;
  b.south = center.lat - span.lat / 2.0;
  b.north = center.lat + span.lat / 2.0;
  b.west = center.lng - span.lng / 2.0;
  b.east = center.lng + span.lng / 2.0;
  return b;
}

// Rectangle in image-fraction coordinates:
//   x in [0,1] left -> right
//   y in [0,1] top -> bottom
struct NormalizedRect {
  double minX = 0.0;
  double minY = 0.0;
  double maxX = 1.0;
  double maxY = 1.0;

  bool contains(double x, double y) const { return x >= minX && x <= maxX && y >= minY && y <= maxY; }
};

// Floating-point pixel coordinate (origin top-left, y grows downward).
struct PixelPoint {
  double x = 0.0;
  double y = 0.0;
};

inline bool operator==(const PixelPoint& a, const PixelPoint& b) { return a.x == b.x && a.y == b.y; }

// Integer pixel coordinate.
struct IPoint {
  int x = 0;
  int y = 0;

  bool operator==(const IPoint& o) const { return x == o.x && y == o.y; }
  bool operator!=(const IPoint& o) const { return !(*this == o); }
};

inline bool IsFinite(const GeoPoint& p) { return std::isfinite(p.lat) && std::isfinite(p.lng); }

} // namespace hazmap
