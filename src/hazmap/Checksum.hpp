#pragma once

#include <cstddef>
#include <cstdint>

namespace hazmap {

// Checksums needed to verify PNG rasters.
//
// CRC32: IEEE 802.3 polynomial (0xEDB88320), init 0xFFFFFFFF, final XOR 0xFFFFFFFF.
//        Every PNG chunk carries one over its type + data.
// Adler32: zlib/RFC1950 trailer checksum (init = 1).

// Incremental CRC32 update. Start from 0xFFFFFFFF and XOR the final value with 0xFFFFFFFF.
std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size);

inline std::uint32_t Crc32(const std::uint8_t* data, std::size_t size)
{
  return Crc32Update(0xFFFFFFFFu, data, size) ^ 0xFFFFFFFFu;
}

// Incremental Adler32 update (init with 1).
std::uint32_t Adler32Update(std::uint32_t adler, const std::uint8_t* data, std::size_t size);

inline std::uint32_t Adler32(const std::uint8_t* data, std::size_t size)
{
  return Adler32Update(1u, data, size);
}

} // namespace hazmap
