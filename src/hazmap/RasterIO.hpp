#pragma once

#include "hazmap/Raster.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hazmap {

// Raster decoding for zone imagery.
//
// Supported inputs:
//   PNG - 8-bit greyscale, greyscale+alpha, RGB, RGBA
//       - 16-bit variants of the above (reduced to 8-bit)
//       - palette images (1/2/4/8-bit) with optional tRNS transparency
//       - non-interlaced only
//   PPM - binary P6, decoded as fully opaque
//
// All decoders return false and set outError on failure. A failed decode is the
// caller's cue to fall back to bounds-only geometry for the zone.

// Decode a PNG held in memory.
bool DecodePng(const std::uint8_t* data, std::size_t size, RasterImage& outImg, std::string& outError);

bool ReadPng(const std::string& path, RasterImage& outImg, std::string& outError);
bool ReadPpm(const std::string& path, RasterImage& outImg, std::string& outError);

// Dispatch on file extension (.png/.ppm/.pnm), then on magic bytes.
bool ReadRasterAuto(const std::string& path, RasterImage& outImg, std::string& outError);

// Encode an RGBA8 PNG using stored (uncompressed) DEFLATE blocks.
// Used for debug overlays and test fixtures.
bool EncodePng(const RasterImage& img, std::vector<std::uint8_t>& outBytes, std::string& outError);
bool WritePng(const std::string& path, const RasterImage& img, std::string& outError);

} // namespace hazmap
