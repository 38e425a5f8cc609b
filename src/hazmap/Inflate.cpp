#include "hazmap/Inflate.hpp"

#include "hazmap/Checksum.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace hazmap {

namespace {

constexpr int kMaxBits = 15;
constexpr int kMaxLitLenCodes = 286;
constexpr int kMaxDistCodes = 30;
constexpr int kFixedLitLenCodes = 288;

constexpr std::array<std::uint16_t, 29> kLenBase = {3,  4,  5,  6,  7,  8,  9,  10, 11,  13,  15,  17,  19,  23, 27,
                                                    31, 35, 43, 51, 59, 67, 83, 99, 115, 131, 163, 195, 227, 258};
constexpr std::array<std::uint8_t, 29> kLenExtra = {0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 1, 1, 2, 2, 2,
                                                    2, 3, 3, 3, 3, 4, 4, 4, 4, 5, 5, 5, 5, 0};
constexpr std::array<std::uint16_t, 30> kDistBase = {1,   2,   3,   4,   5,   7,    9,    13,   17,   25,
                                                     33,  49,  65,  97,  129, 193,  257,  385,  513,  769,
                                                     1025, 1537, 2049, 3073, 4097, 6145, 8193, 12289, 16385, 24577};
constexpr std::array<std::uint8_t, 30> kDistExtra = {0, 0, 0, 0, 1, 1, 2, 2,  3,  3,  4,  4,  5,  5,  6,
                                                     6, 7, 7, 8, 8, 9, 9, 10, 10, 11, 11, 12, 12, 13, 13};

// Order in which code-length code lengths are transmitted.
constexpr std::array<std::uint8_t, 19> kCodeLenOrder = {16, 17, 18, 0, 8, 7, 9, 6, 10, 5, 11, 4, 12, 3, 13, 2, 14, 1, 15};

class BitReader {
public:
  BitReader(const std::uint8_t* data, std::size_t size) : m_data(data), m_size(size) {}

  // Read n bits (n <= 16), least-significant bit first.
  std::uint32_t bits(int n)
  {
    std::uint32_t v = 0;
    for (int i = 0; i < n; ++i) {
      if (m_byte >= m_size) {
        m_overrun = true;
        return 0;
      }
      const std::uint32_t b = (m_data[m_byte] >> m_bit) & 1u;
      v |= b << i;
      if (++m_bit == 8) {
        m_bit = 0;
        ++m_byte;
      }
    }
    return v;
  }

  void alignToByte()
  {
    if (m_bit != 0) {
      m_bit = 0;
      ++m_byte;
    }
  }

  bool readBytes(std::vector<std::uint8_t>& out, std::size_t n)
  {
    if (m_bit != 0 || m_byte + n > m_size) {
      m_overrun = true;
      return false;
    }
    out.insert(out.end(), m_data + m_byte, m_data + m_byte + n);
    m_byte += n;
    return true;
  }

  bool overrun() const { return m_overrun; }

  std::size_t consumedBytes() const { return m_byte + (m_bit != 0 ? 1u : 0u); }

private:
  const std::uint8_t* m_data = nullptr;
  std::size_t m_size = 0;
  std::size_t m_byte = 0;
  int m_bit = 0;
  bool m_overrun = false;
};

// Canonical Huffman decoding table: number of codes per length and the symbols
// ordered by (length, value).
struct Huffman {
  std::array<std::uint16_t, kMaxBits + 1> count{};
  std::vector<std::uint16_t> symbol;
};

// Returns 0 for a complete code, > 0 for an incomplete code, < 0 for an
// over-subscribed (invalid) code.
int BuildHuffman(Huffman& h, const std::uint8_t* lengths, int n)
{
  h.count.fill(0);
  h.symbol.assign(static_cast<std::size_t>(n), 0);

  for (int s = 0; s < n; ++s) ++h.count[lengths[s]];
  if (h.count[0] == n) return 0;

  int left = 1;
  for (int len = 1; len <= kMaxBits; ++len) {
    left <<= 1;
    left -= h.count[len];
    if (left < 0) return left;
  }

  std::array<std::uint16_t, kMaxBits + 1> offs{};
  for (int len = 1; len < kMaxBits; ++len) {
    offs[len + 1] = static_cast<std::uint16_t>(offs[len] + h.count[len]);
  }
  for (int s = 0; s < n; ++s) {
    if (lengths[s] != 0) h.symbol[offs[lengths[s]]++] = static_cast<std::uint16_t>(s);
  }
  return left;
}

int DecodeSymbol(BitReader& br, const Huffman& h)
{
  int code = 0;
  int first = 0;
  int index = 0;
  for (int len = 1; len <= kMaxBits; ++len) {
    code |= static_cast<int>(br.bits(1));
    if (br.overrun()) return -1;
    const int count = h.count[len];
    if (code - count < first) return h.symbol[static_cast<std::size_t>(index + (code - first))];
    index += count;
    first += count;
    first <<= 1;
    code <<= 1;
  }
  return -1;
}

bool InflateCodes(BitReader& br, const Huffman& lencode, const Huffman& distcode, std::vector<std::uint8_t>& out,
                  std::string& outError)
{
  while (true) {
    const int sym = DecodeSymbol(br, lencode);
    if (sym < 0) {
      outError = br.overrun() ? "truncated DEFLATE stream" : "invalid literal/length code";
      return false;
    }
    if (sym < 256) {
      out.push_back(static_cast<std::uint8_t>(sym));
      continue;
    }
    if (sym == 256) return true;

    const int li = sym - 257;
    if (li >= static_cast<int>(kLenBase.size())) {
      outError = "invalid length symbol";
      return false;
    }
    const std::size_t len = kLenBase[static_cast<std::size_t>(li)] + br.bits(kLenExtra[static_cast<std::size_t>(li)]);

    const int di = DecodeSymbol(br, distcode);
    if (di < 0 || di >= static_cast<int>(kDistBase.size())) {
      outError = br.overrun() ? "truncated DEFLATE stream" : "invalid distance code";
      return false;
    }
    const std::size_t dist =
        kDistBase[static_cast<std::size_t>(di)] + br.bits(kDistExtra[static_cast<std::size_t>(di)]);
    if (br.overrun()) {
      outError = "truncated DEFLATE stream";
      return false;
    }
    if (dist > out.size()) {
      outError = "distance too far back";
      return false;
    }

    // Byte-wise copy: the source may overlap the bytes being produced.
    const std::size_t from = out.size() - dist;
    for (std::size_t k = 0; k < len; ++k) out.push_back(out[from + k]);
  }
}

bool InflateStored(BitReader& br, std::vector<std::uint8_t>& out, std::string& outError)
{
  br.alignToByte();
  const std::uint32_t len = br.bits(16);
  const std::uint32_t nlen = br.bits(16);
  if (br.overrun()) {
    outError = "truncated stored block header";
    return false;
  }
  if ((len ^ 0xFFFFu) != nlen) {
    outError = "stored block LEN/NLEN mismatch";
    return false;
  }
  if (!br.readBytes(out, len)) {
    outError = "truncated stored block payload";
    return false;
  }
  return true;
}

bool InflateFixed(BitReader& br, std::vector<std::uint8_t>& out, std::string& outError)
{
  static const auto tables = [] {
    std::pair<Huffman, Huffman> t;
    std::array<std::uint8_t, kFixedLitLenCodes> lengths{};
    int s = 0;
    for (; s < 144; ++s) lengths[static_cast<std::size_t>(s)] = 8;
    for (; s < 256; ++s) lengths[static_cast<std::size_t>(s)] = 9;
    for (; s < 280; ++s) lengths[static_cast<std::size_t>(s)] = 7;
    for (; s < kFixedLitLenCodes; ++s) lengths[static_cast<std::size_t>(s)] = 8;
    BuildHuffman(t.first, lengths.data(), kFixedLitLenCodes);

    std::array<std::uint8_t, kMaxDistCodes> dl{};
    dl.fill(5);
    BuildHuffman(t.second, dl.data(), kMaxDistCodes);
    return t;
  }();

  return InflateCodes(br, tables.first, tables.second, out, outError);
}

bool InflateDynamic(BitReader& br, std::vector<std::uint8_t>& out, std::string& outError)
{
  const int nlen = static_cast<int>(br.bits(5)) + 257;
  const int ndist = static_cast<int>(br.bits(5)) + 1;
  const int ncode = static_cast<int>(br.bits(4)) + 4;
  if (br.overrun()) {
    outError = "truncated dynamic block header";
    return false;
  }
  if (nlen > kMaxLitLenCodes || ndist > kMaxDistCodes) {
    outError = "bad dynamic block code counts";
    return false;
  }

  std::array<std::uint8_t, kMaxLitLenCodes + kMaxDistCodes> lengths{};
  for (int i = 0; i < ncode; ++i) {
    lengths[kCodeLenOrder[static_cast<std::size_t>(i)]] = static_cast<std::uint8_t>(br.bits(3));
  }
  if (br.overrun()) {
    outError = "truncated code length codes";
    return false;
  }

  Huffman lencode;
  if (BuildHuffman(lencode, lengths.data(), 19) != 0) {
    outError = "incomplete code length code";
    return false;
  }

  int index = 0;
  while (index < nlen + ndist) {
    int sym = DecodeSymbol(br, lencode);
    if (sym < 0) {
      outError = "invalid code length symbol";
      return false;
    }
    if (sym < 16) {
      lengths[static_cast<std::size_t>(index++)] = static_cast<std::uint8_t>(sym);
      continue;
    }

    std::uint8_t len = 0;
    int repeat = 0;
    if (sym == 16) {
      if (index == 0) {
        outError = "repeat with no previous length";
        return false;
      }
      len = lengths[static_cast<std::size_t>(index - 1)];
      repeat = 3 + static_cast<int>(br.bits(2));
    } else if (sym == 17) {
      repeat = 3 + static_cast<int>(br.bits(3));
    } else {
      repeat = 11 + static_cast<int>(br.bits(7));
    }
    if (index + repeat > nlen + ndist) {
      outError = "too many code lengths";
      return false;
    }
    while (repeat-- > 0) lengths[static_cast<std::size_t>(index++)] = len;
  }

  if (lengths[256] == 0) {
    outError = "missing end-of-block code";
    return false;
  }

  // Incomplete codes are only allowed for a single code.
  int err = BuildHuffman(lencode, lengths.data(), nlen);
  if (err < 0 || (err > 0 && nlen - lencode.count[0] != 1)) {
    outError = "invalid literal/length code lengths";
    return false;
  }

  Huffman distcode;
  err = BuildHuffman(distcode, lengths.data() + nlen, ndist);
  if (err < 0 || (err > 0 && ndist - distcode.count[0] != 1)) {
    outError = "invalid distance code lengths";
    return false;
  }

  return InflateCodes(br, lencode, distcode, out, outError);
}

} // namespace

bool InflateRaw(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out, std::string& outError,
                std::size_t* outConsumed)
{
  outError.clear();
  out.clear();
  if (!data || size == 0) {
    outError = "empty DEFLATE stream";
    return false;
  }

  BitReader br(data, size);
  bool last = false;
  while (!last) {
    last = br.bits(1) != 0u;
    const std::uint32_t type = br.bits(2);
    if (br.overrun()) {
      outError = "truncated DEFLATE block header";
      return false;
    }

    bool ok = false;
    switch (type) {
    case 0: ok = InflateStored(br, out, outError); break;
    case 1: ok = InflateFixed(br, out, outError); break;
    case 2: ok = InflateDynamic(br, out, outError); break;
    default: outError = "invalid DEFLATE block type"; break;
    }
    if (!ok) return false;
  }

  if (outConsumed) *outConsumed = br.consumedBytes();
  return true;
}

bool InflateZlib(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& out, std::string& outError,
                 std::size_t sizeHint)
{
  outError.clear();
  out.clear();

  if (!data || size < 2 + 4) {
    outError = "zlib stream too small";
    return false;
  }

  const std::uint8_t cmf = data[0];
  const std::uint8_t flg = data[1];
  if (((static_cast<std::uint32_t>(cmf) << 8) | flg) % 31u != 0u) {
    outError = "invalid zlib header (FCHECK)";
    return false;
  }
  if ((cmf & 0x0Fu) != 8u || (cmf >> 4) > 7u) {
    outError = "unsupported zlib compression method (expected DEFLATE)";
    return false;
  }
  if ((flg & 0x20u) != 0u) {
    outError = "unsupported zlib preset dictionary";
    return false;
  }

  std::vector<std::uint8_t> decoded;
  if (sizeHint > 0) decoded.reserve(sizeHint);

  std::size_t used = 0;
  std::string err;
  if (!InflateRaw(data + 2, size - 2, decoded, err, &used)) {
    outError = "DEFLATE: " + err;
    return false;
  }

  const std::size_t trailer = 2 + used;
  if (trailer + 4 > size) {
    outError = "missing Adler32";
    return false;
  }
  const std::uint32_t expected = (static_cast<std::uint32_t>(data[trailer + 0]) << 24) |
                                 (static_cast<std::uint32_t>(data[trailer + 1]) << 16) |
                                 (static_cast<std::uint32_t>(data[trailer + 2]) << 8) |
                                 static_cast<std::uint32_t>(data[trailer + 3]);
  const std::uint32_t got = Adler32(decoded.data(), decoded.size());
  if (got != expected) {
    std::ostringstream oss;
    oss << "Adler32 mismatch (expected 0x" << std::hex << expected << ", got 0x" << got << ")";
    outError = oss.str();
    return false;
  }

  out = std::move(decoded);
  return true;
}

} // namespace hazmap
