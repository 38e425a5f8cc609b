#include "hazmap/CoordMapper.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

namespace hazmap {

bool ValidateBounds(const GeoBounds& b, std::string& outError)
{
  if (!std::isfinite(b.south) || !std::isfinite(b.west) || !std::isfinite(b.north) || !std::isfinite(b.east)) {
    outError = "bounds contain non-finite values";
    return false;
  }
  if (!(b.south < b.north) || !(b.west < b.east)) {
    std::ostringstream oss;
    oss << "degenerate bounds [[" << b.south << "," << b.west << "],[" << b.north << "," << b.east
        << "]] (expected south < north and west < east)";
    outError = oss.str();
    return false;
  }
  return true;
}

GeoPoint PixelToGeo(double x, double y, int width, int height, const GeoBounds& bounds)
{
  return NormalizedToGeo(x / static_cast<double>(width), y / static_cast<double>(height), bounds);
}

PixelPoint GeoToPixel(double lat, double lng, int width, int height, const GeoBounds& bounds)
{
  const PixelPoint n = GeoToNormalized(lat, lng, bounds);
  return PixelPoint{n.x * static_cast<double>(width), n.y * static_cast<double>(height)};
}

PixelPoint GeoToNormalized(double lat, double lng, const GeoBounds& bounds)
{
  PixelPoint p;
  p.x = (lng - bounds.west) / bounds.lngSpan();
  p.y = (bounds.north - lat) / bounds.latSpan();
  return p;
}

GeoPoint NormalizedToGeo(double nx, double ny, const GeoBounds& bounds)
{
  GeoPoint g;
  g.lng = bounds.west + bounds.lngSpan() * nx;
  g.lat = bounds.north - bounds.latSpan() * ny;
  return g;
}

std::vector<GeoPoint> PixelsToGeo(const std::vector<IPoint>& pixels, int width, int height, const GeoBounds& bounds)
{
  std::vector<GeoPoint> out;
  out.reserve(pixels.size());
  for (const IPoint& p : pixels) {
    out.push_back(PixelToGeo(static_cast<double>(p.x), static_cast<double>(p.y), width, height, bounds));
  }
  return out;
}

} // namespace hazmap
