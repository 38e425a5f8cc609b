#pragma once

#include "hazmap/Types.hpp"

#include <string>
#include <vector>

namespace hazmap {

// Conversions between raster space and geographic space.
//
// Pixel space: x in [0,W] left -> right, y in [0,H] top -> bottom.
// Geographic space: latitude grows northward, so image row 0 is the north edge.
//
//   lng = west  + (east  - west ) * (x / W)
//   lat = north - (north - south) * (y / H)
//
// All mappings assume ValidateBounds(bounds) holds and W,H > 0. Callers that accept
// bounds from outside (zone files, the command line) must validate first.

// Finite values, south < north, west < east.
bool ValidateBounds(const GeoBounds& bounds, std::string& outError);

inline bool IsValidBounds(const GeoBounds& bounds)
{
  std::string err;
  return ValidateBounds(bounds, err);
}

GeoPoint PixelToGeo(double x, double y, int width, int height, const GeoBounds& bounds);
PixelPoint GeoToPixel(double lat, double lng, int width, int height, const GeoBounds& bounds);

// Image-fraction variants (x,y in [0,1] inside the bounds; values outside the
// rectangle map outside [0,1]).
PixelPoint GeoToNormalized(double lat, double lng, const GeoBounds& bounds);
GeoPoint NormalizedToGeo(double nx, double ny, const GeoBounds& bounds);

// Bulk conversion of an integer pixel path.
std::vector<GeoPoint> PixelsToGeo(const std::vector<IPoint>& pixels, int width, int height, const GeoBounds& bounds);

} // namespace hazmap
