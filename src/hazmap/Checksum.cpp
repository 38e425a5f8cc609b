#include "hazmap/Checksum.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace hazmap {

namespace {

using CrcTable = std::array<std::uint32_t, 256>;

CrcTable BuildCrcTable()
{
  CrcTable table{};
  for (std::uint32_t n = 0; n < 256u; ++n) {
    std::uint32_t c = n;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    }
    table[n] = c;
  }
  return table;
}

const CrcTable& GetCrcTable()
{
  static const CrcTable table = BuildCrcTable();
  return table;
}

} // namespace

std::uint32_t Crc32Update(std::uint32_t crc, const std::uint8_t* data, std::size_t size)
{
  if (!data || size == 0) return crc;
  const CrcTable& table = GetCrcTable();
  for (std::size_t i = 0; i < size; ++i) {
    crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
  }
  return crc;
}

std::uint32_t Adler32Update(std::uint32_t adler, const std::uint8_t* data, std::size_t size)
{
  constexpr std::uint32_t kBase = 65521u;
  // Largest n such that 255n(n+1)/2 + (n+1)(kBase-1) fits in 32 bits.
  constexpr std::size_t kNMax = 5552u;

  std::uint32_t s1 = adler & 0xFFFFu;
  std::uint32_t s2 = (adler >> 16) & 0xFFFFu;
  if (!data) return (s2 << 16) | s1;

  std::size_t pos = 0;
  while (pos < size) {
    const std::size_t end = (size - pos > kNMax) ? pos + kNMax : size;
    for (; pos < end; ++pos) {
      s1 += data[pos];
      s2 += s1;
    }
    s1 %= kBase;
    s2 %= kBase;
  }

  return (s2 << 16) | s1;
}

} // namespace hazmap
