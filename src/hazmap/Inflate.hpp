#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hazmap {

// Dependency-free DEFLATE (RFC1951) / zlib (RFC1950) decoder.
//
// Zone rasters arrive as ordinary PNG files written by image editors, so unlike
// a stored-block-only reader we must handle all three DEFLATE block types:
//   - stored (uncompressed)
//   - fixed Huffman codes
//   - dynamic Huffman codes
//
// The decoder is a straightforward canonical-Huffman implementation that decodes
// one bit at a time. It is not the fastest possible, but it runs once per raster
// load and never per frame.

// Decode a raw DEFLATE stream into `out` (previous contents are discarded).
// If outConsumed is non-null it receives the number of input bytes used
// (rounded up to a whole byte).
bool InflateRaw(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out, std::string& outError,
                std::size_t* outConsumed = nullptr);

// Decode a zlib stream (2-byte header + DEFLATE + big-endian Adler32 trailer).
// sizeHint (optional) is used to reserve the output buffer.
bool InflateZlib(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out, std::string& outError,
                 std::size_t sizeHint = 0);

} // namespace hazmap
