#include "hazmap/BoundsOps.hpp"

#include "hazmap/CoordMapper.hpp"

#include <cmath>
#include <vector>

namespace hazmap {

namespace {

constexpr double kPi = 3.14159265358979323846;

} // namespace

GeoBounds ScaleBoundsAboutCenter(const GeoBounds& b, double factor)
{
  const LatLngSpan span = SpanOf(b);
  return BoundsAround(b.center(), LatLngSpan{span.lat * factor, span.lng * factor});
}

GeoBounds ShiftBounds(const GeoBounds& b, double latShift, double lngShift)
{
  GeoBounds out = b;
  out.south -= latShift;
  out.north -= latShift;
  out.west += lngShift;
  out.east += lngShift;
  return out;
}

GeoBounds FitBoundsToAspect(const GeoBounds& b, int imageWidth, int imageHeight, double tolerance, bool* outChanged)
{
  if (outChanged) *outChanged = false;
  if (imageWidth <= 0 || imageHeight <= 0) return b;

  const double latRange = b.latSpan();
  if (!(latRange > 0.0)) return b;

  const double imageAspect = static_cast<double>(imageWidth) / static_cast<double>(imageHeight);
  const double geoAspect = b.lngSpan() / latRange;
  if (std::fabs(imageAspect - geoAspect) <= tolerance) return b;

  const double centerLng = (b.west + b.east) / 2.0;
  const double newLngRange = latRange * imageAspect;

  GeoBounds out = b;
  out.west = centerLng - newLngRange / 2.0;
  out.east = centerLng + newLngRange / 2.0;
  if (outChanged) *outChanged = true;
  return out;
}

std::vector<GeoPoint> RemapRing(const std::vector<GeoPoint>& ring, const GeoBounds& from, const GeoBounds& to)
{
  std::vector<GeoPoint> out;
  out.reserve(ring.size());
  for (const GeoPoint& p : ring) {
    const PixelPoint n = GeoToNormalized(p.lat, p.lng, from);
    out.push_back(NormalizedToGeo(n.x, n.y, to));
  }
  return out;
}

std::vector<GeoPoint> RotatedCorners(const GeoBounds& b, double degrees)
{
  const GeoPoint c = b.center();
  const double rad = degrees * kPi / 180.0;
  const double cs = std::cos(rad);
  const double sn = std::sin(rad);

  // Screen space has y pointing south, so a clockwise screen rotation is
  // counter-clockwise in (lng, lat).
  auto rot = [&](double lat, double lng) -> GeoPoint {
    const double dx = lng - c.lng;
    const double dy = lat - c.lat;
    GeoPoint p;
    p.lng = c.lng + dx * cs + dy * sn;
    p.lat = c.lat - dx * sn + dy * cs;
    return p;
  };

  return {rot(b.north, b.west), rot(b.north, b.east), rot(b.south, b.east), rot(b.south, b.west)};
}

} // namespace hazmap
