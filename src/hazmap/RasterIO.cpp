#include "hazmap/RasterIO.hpp"

#include "hazmap/Checksum.hpp"
#include "hazmap/Inflate.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace hazmap {

namespace {

constexpr std::array<std::uint8_t, 8> kPngSig = {0x89u, 'P', 'N', 'G', 0x0Du, 0x0Au, 0x1Au, 0x0Au};
constexpr std::uint32_t kMaxChunk = 256u * 1024u * 1024u;

enum PngColorType : std::uint8_t {
  kGray = 0,
  kRgb = 2,
  kPalette = 3,
  kGrayAlpha = 4,
  kRgba = 6,
};

inline std::string LowerExt(const std::string& path)
{
  const std::size_t slash = path.find_last_of("/\\");
  const std::size_t dot = path.find_last_of('.');
  if (dot == std::string::npos) return {};
  if (slash != std::string::npos && dot < slash) return {};
  std::string ext = path.substr(dot);
  for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return ext;
}

inline std::uint32_t LoadU32BE(const std::uint8_t* p)
{
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

inline void AppendU32BE(std::vector<std::uint8_t>& out, std::uint32_t v)
{
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
  out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
}

bool HasPngSignature(const std::uint8_t* b, std::size_t n)
{
  if (!b || n < kPngSig.size()) return false;
  return std::equal(kPngSig.begin(), kPngSig.end(), b);
}

bool ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out, std::string& outError)
{
  out.clear();
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for reading: " + path;
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  if (f.bad()) {
    outError = "failed while reading: " + path;
    return false;
  }
  return true;
}

struct PngHeader {
  int width = 0;
  int height = 0;
  std::uint8_t bitDepth = 0;
  std::uint8_t colorType = 0;
  std::uint8_t interlace = 0;
};

int ChannelCount(std::uint8_t colorType)
{
  switch (colorType) {
  case kGray: return 1;
  case kRgb: return 3;
  case kPalette: return 1;
  case kGrayAlpha: return 2;
  case kRgba: return 4;
  default: return 0;
  }
}

bool ValidateHeader(const PngHeader& h, std::string& outError)
{
  const int d = h.bitDepth;
  bool ok = false;
  switch (h.colorType) {
  case kGray: ok = (d == 8 || d == 16); break;
  case kRgb:
  case kGrayAlpha:
  case kRgba: ok = (d == 8 || d == 16); break;
  case kPalette: ok = (d == 1 || d == 2 || d == 4 || d == 8); break;
  default: ok = false; break;
  }
  if (!ok) {
    std::ostringstream oss;
    oss << "unsupported PNG format (color type " << static_cast<int>(h.colorType) << ", bit depth " << d << ")";
    outError = oss.str();
    return false;
  }
  if (h.interlace != 0) {
    outError = "interlaced PNG is not supported";
    return false;
  }
  return true;
}

inline std::uint8_t Paeth(int a, int b, int c)
{
  const int p = a + b - c;
  const int pa = std::abs(p - a);
  const int pb = std::abs(p - b);
  const int pc = std::abs(p - c);
  if (pa <= pb && pa <= pc) return static_cast<std::uint8_t>(a);
  if (pb <= pc) return static_cast<std::uint8_t>(b);
  return static_cast<std::uint8_t>(c);
}

// Reverse the per-scanline filters in place. `raw` holds (1 + rowBytes) * height bytes;
// the result (filter bytes dropped) is written to `out`.
bool Unfilter(const std::vector<std::uint8_t>& raw, std::size_t rowBytes, int height, std::size_t bpp,
              std::vector<std::uint8_t>& out, std::string& outError)
{
  out.assign(rowBytes * static_cast<std::size_t>(height), 0u);
  const std::uint8_t* prev = nullptr;

  for (int y = 0; y < height; ++y) {
    const std::size_t src = static_cast<std::size_t>(y) * (rowBytes + 1u);
    const std::uint8_t filter = raw[src];
    const std::uint8_t* in = raw.data() + src + 1u;
    std::uint8_t* row = out.data() + static_cast<std::size_t>(y) * rowBytes;

    for (std::size_t i = 0; i < rowBytes; ++i) {
      const int a = (i >= bpp) ? row[i - bpp] : 0;
      const int b = prev ? prev[i] : 0;
      const int c = (prev && i >= bpp) ? prev[i - bpp] : 0;
      int v = in[i];
      switch (filter) {
      case 0: break;
      case 1: v += a; break;
      case 2: v += b; break;
      case 3: v += (a + b) / 2; break;
      case 4: v += Paeth(a, b, c); break;
      default: {
        std::ostringstream oss;
        oss << "invalid PNG filter type " << static_cast<int>(filter) << " on row " << y;
        outError = oss.str();
        return false;
      }
      }
      row[i] = static_cast<std::uint8_t>(v & 0xFF);
    }
    prev = row;
  }
  return true;
}

struct Transparency {
  bool hasKey = false;
  std::uint16_t keyGray = 0;
  std::uint16_t keyR = 0;
  std::uint16_t keyG = 0;
  std::uint16_t keyB = 0;
  std::vector<std::uint8_t> paletteAlpha;
};

bool ExpandToRgba(const PngHeader& h, const std::vector<std::uint8_t>& pixels, std::size_t rowBytes,
                  const std::vector<std::uint8_t>& palette, const Transparency& trns, RasterImage& out,
                  std::string& outError)
{
  out = MakeTransparentRaster(h.width, h.height);
  const bool wide = (h.bitDepth == 16);

  // Sample channel `c` of pixel `x` on a row; 16-bit samples keep their high byte,
  // but the full value is used for tRNS key comparison.
  auto sample16 = [&](const std::uint8_t* row, int x, int c, int channels) -> std::uint16_t {
    if (wide) {
      const std::size_t o = (static_cast<std::size_t>(x) * static_cast<std::size_t>(channels) + static_cast<std::size_t>(c)) * 2u;
      return static_cast<std::uint16_t>((row[o] << 8) | row[o + 1]);
    }
    return row[static_cast<std::size_t>(x) * static_cast<std::size_t>(channels) + static_cast<std::size_t>(c)];
  };
  auto to8 = [&](std::uint16_t v) -> std::uint8_t { return static_cast<std::uint8_t>(wide ? (v >> 8) : v); };

  const int channels = ChannelCount(h.colorType);

  for (int y = 0; y < h.height; ++y) {
    const std::uint8_t* row = pixels.data() + static_cast<std::size_t>(y) * rowBytes;
    for (int x = 0; x < h.width; ++x) {
      std::uint8_t r = 0, g = 0, b = 0, a = 255;
      switch (h.colorType) {
      case kGray: {
        const std::uint16_t v = sample16(row, x, 0, 1);
        r = g = b = to8(v);
        if (trns.hasKey && v == trns.keyGray) a = 0;
        break;
      }
      case kGrayAlpha: {
        r = g = b = to8(sample16(row, x, 0, 2));
        a = to8(sample16(row, x, 1, 2));
        break;
      }
      case kRgb: {
        const std::uint16_t vr = sample16(row, x, 0, 3);
        const std::uint16_t vg = sample16(row, x, 1, 3);
        const std::uint16_t vb = sample16(row, x, 2, 3);
        r = to8(vr);
        g = to8(vg);
        b = to8(vb);
        if (trns.hasKey && vr == trns.keyR && vg == trns.keyG && vb == trns.keyB) a = 0;
        break;
      }
      case kRgba: {
        r = to8(sample16(row, x, 0, 4));
        g = to8(sample16(row, x, 1, 4));
        b = to8(sample16(row, x, 2, 4));
        a = to8(sample16(row, x, 3, 4));
        break;
      }
      case kPalette: {
        const int depth = h.bitDepth;
        const std::size_t bitPos = static_cast<std::size_t>(x) * static_cast<std::size_t>(depth);
        const std::uint8_t byte = row[bitPos / 8u];
        const int shift = 8 - depth - static_cast<int>(bitPos % 8u);
        const std::size_t idx = static_cast<std::size_t>((byte >> shift) & ((1 << depth) - 1));
        if (idx * 3u + 2u >= palette.size()) {
          outError = "palette index out of range";
          return false;
        }
        r = palette[idx * 3u + 0u];
        g = palette[idx * 3u + 1u];
        b = palette[idx * 3u + 2u];
        a = (idx < trns.paletteAlpha.size()) ? trns.paletteAlpha[idx] : 255u;
        break;
      }
      default: outError = "unsupported PNG color type"; return false;
      }
      SetPixel(out, x, y, r, g, b, a);
    }
  }
  return true;
}

bool WritePngChunk(std::vector<std::uint8_t>& out, const char type[4], const std::uint8_t* data, std::size_t size)
{
  if (size > 0x7FFFFFFFu) return false;
  AppendU32BE(out, static_cast<std::uint32_t>(size));
  const std::size_t typeStart = out.size();
  out.insert(out.end(), type, type + 4);
  if (data && size > 0) out.insert(out.end(), data, data + size);
  const std::uint32_t crc = Crc32(out.data() + typeStart, 4u + size);
  AppendU32BE(out, crc);
  return true;
}

std::vector<std::uint8_t> CompressZlibStored(const std::uint8_t* data, std::size_t size)
{
  // CMF=0x78 (deflate, 32k window), FLG=0x01 (no dictionary, valid FCHECK).
  std::vector<std::uint8_t> out;
  out.reserve(size + size / 65535u * 5u + 16u);
  out.push_back(0x78u);
  out.push_back(0x01u);

  std::size_t pos = 0;
  do {
    const std::size_t chunk = std::min<std::size_t>(size - pos, 65535u);
    const bool final = (pos + chunk == size);
    out.push_back(final ? 0x01u : 0x00u);
    const std::uint16_t len = static_cast<std::uint16_t>(chunk);
    const std::uint16_t nlen = static_cast<std::uint16_t>(len ^ 0xFFFFu);
    out.push_back(static_cast<std::uint8_t>(len & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(len >> 8));
    out.push_back(static_cast<std::uint8_t>(nlen & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(nlen >> 8));
    if (chunk > 0) out.insert(out.end(), data + pos, data + pos + chunk);
    pos += chunk;
  } while (pos < size);

  AppendU32BE(out, Adler32(data, size));
  return out;
}

bool ReadPpmToken(std::istream& in, std::string& out)
{
  out.clear();
  char c = 0;
  while (in.get(c)) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    if (c == '#') {
      std::string comment;
      std::getline(in, comment);
      continue;
    }
    out.push_back(c);
    break;
  }
  if (out.empty()) return false;
  while (in.get(c)) {
    if (std::isspace(static_cast<unsigned char>(c))) break;
    out.push_back(c);
  }
  return true;
}

bool ParsePositiveInt(const std::string& tok, int& out)
{
  if (tok.empty()) return false;
  char* end = nullptr;
  const long v = std::strtol(tok.c_str(), &end, 10);
  if (!end || *end != '\0') return false;
  if (v <= 0 || v > std::numeric_limits<int>::max()) return false;
  out = static_cast<int>(v);
  return true;
}

} // namespace

bool DecodePng(const std::uint8_t* data, std::size_t size, RasterImage& outImg, std::string& outError)
{
  outError.clear();
  outImg = RasterImage{};

  if (!HasPngSignature(data, size)) {
    outError = "invalid PNG signature";
    return false;
  }

  PngHeader hdr;
  bool haveIHDR = false;
  std::vector<std::uint8_t> idat;
  std::vector<std::uint8_t> palette;
  Transparency trns;

  std::size_t pos = kPngSig.size();
  bool sawEnd = false;
  while (!sawEnd) {
    if (pos + 8u > size) {
      outError = "truncated PNG (chunk header)";
      return false;
    }
    const std::uint32_t len = LoadU32BE(data + pos);
    if (len > kMaxChunk) {
      outError = "PNG chunk too large";
      return false;
    }
    const std::uint8_t* type = data + pos + 4u;
    const std::uint8_t* body = data + pos + 8u;
    if (pos + 12u + len > size) {
      outError = "truncated PNG (chunk data)";
      return false;
    }
    const std::uint32_t crcFile = LoadU32BE(body + len);
    if (crcFile != Crc32(type, 4u + len)) {
      outError = "PNG CRC mismatch for chunk '" + std::string(reinterpret_cast<const char*>(type), 4) + "'";
      return false;
    }
    pos += 12u + len;

    const std::string t(reinterpret_cast<const char*>(type), 4);
    if (t == "IHDR") {
      if (len != 13u) {
        outError = "invalid IHDR length";
        return false;
      }
      const std::uint32_t w = LoadU32BE(body);
      const std::uint32_t h = LoadU32BE(body + 4);
      if (w == 0 || h == 0 || w > 1u << 24 || h > 1u << 24) {
        outError = "invalid IHDR dimensions";
        return false;
      }
      hdr.width = static_cast<int>(w);
      hdr.height = static_cast<int>(h);
      hdr.bitDepth = body[8];
      hdr.colorType = body[9];
      if (body[10] != 0u || body[11] != 0u) {
        outError = "unsupported PNG compression/filter method";
        return false;
      }
      hdr.interlace = body[12];
      if (!ValidateHeader(hdr, outError)) return false;
      haveIHDR = true;
    } else if (t == "PLTE") {
      if (len % 3u != 0u || len == 0u || len > 256u * 3u) {
        outError = "invalid PLTE chunk";
        return false;
      }
      palette.assign(body, body + len);
    } else if (t == "tRNS") {
      if (!haveIHDR) {
        outError = "tRNS before IHDR";
        return false;
      }
      if (hdr.colorType == kPalette) {
        trns.paletteAlpha.assign(body, body + len);
      } else if (hdr.colorType == kGray && len == 2u) {
        trns.hasKey = true;
        trns.keyGray = static_cast<std::uint16_t>((body[0] << 8) | body[1]);
      } else if (hdr.colorType == kRgb && len == 6u) {
        trns.hasKey = true;
        trns.keyR = static_cast<std::uint16_t>((body[0] << 8) | body[1]);
        trns.keyG = static_cast<std::uint16_t>((body[2] << 8) | body[3]);
        trns.keyB = static_cast<std::uint16_t>((body[4] << 8) | body[5]);
      }
    } else if (t == "IDAT") {
      idat.insert(idat.end(), body, body + len);
    } else if (t == "IEND") {
      sawEnd = true;
    } else if ((type[0] & 0x20u) == 0u) {
      outError = "unknown critical PNG chunk '" + t + "'";
      return false;
    }
  }

  if (!haveIHDR) {
    outError = "missing IHDR";
    return false;
  }
  if (idat.empty()) {
    outError = "missing IDAT";
    return false;
  }
  if (hdr.colorType == kPalette && palette.empty()) {
    outError = "missing PLTE for palette image";
    return false;
  }

  const int channels = ChannelCount(hdr.colorType);
  const std::size_t bitsPerPixel = static_cast<std::size_t>(channels) * hdr.bitDepth;
  const std::size_t rowBytes = (static_cast<std::size_t>(hdr.width) * bitsPerPixel + 7u) / 8u;
  const std::size_t bpp = std::max<std::size_t>(1u, bitsPerPixel / 8u);
  const std::size_t expectedRaw = (rowBytes + 1u) * static_cast<std::size_t>(hdr.height);

  std::vector<std::uint8_t> raw;
  std::string zerr;
  if (!InflateZlib(idat.data(), idat.size(), raw, zerr, expectedRaw)) {
    outError = "failed to decompress IDAT: " + zerr;
    return false;
  }
  if (raw.size() < expectedRaw) {
    std::ostringstream oss;
    oss << "unexpected decompressed size (expected " << expectedRaw << ", got " << raw.size() << ")";
    outError = oss.str();
    return false;
  }

  std::vector<std::uint8_t> pixels;
  if (!Unfilter(raw, rowBytes, hdr.height, bpp, pixels, outError)) return false;

  RasterImage img;
  if (!ExpandToRgba(hdr, pixels, rowBytes, palette, trns, img, outError)) return false;

  outImg = std::move(img);
  return true;
}

bool ReadPng(const std::string& path, RasterImage& outImg, std::string& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!ReadFileBytes(path, bytes, outError)) return false;
  return DecodePng(bytes.data(), bytes.size(), outImg, outError);
}

bool ReadPpm(const std::string& path, RasterImage& outImg, std::string& outError)
{
  outError.clear();
  outImg = RasterImage{};

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for reading: " + path;
    return false;
  }

  std::string tok;
  if (!ReadPpmToken(f, tok) || tok != "P6") {
    outError = "invalid PPM magic (expected P6)";
    return false;
  }
  int w = 0, h = 0, maxv = 0;
  if (!ReadPpmToken(f, tok) || !ParsePositiveInt(tok, w)) {
    outError = "invalid PPM width";
    return false;
  }
  if (!ReadPpmToken(f, tok) || !ParsePositiveInt(tok, h)) {
    outError = "invalid PPM height";
    return false;
  }
  if (!ReadPpmToken(f, tok) || !ParsePositiveInt(tok, maxv) || maxv > 255) {
    outError = "invalid PPM maxval (expected 1..255)";
    return false;
  }

  const std::size_t n = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
  std::vector<std::uint8_t> rgb(n * 3u);
  f.read(reinterpret_cast<char*>(rgb.data()), static_cast<std::streamsize>(rgb.size()));
  if (!f || static_cast<std::size_t>(f.gcount()) != rgb.size()) {
    outError = "failed while reading PPM pixel data";
    return false;
  }

  RasterImage img = MakeTransparentRaster(w, h);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t c = 0; c < 3u; ++c) {
      const int v = rgb[i * 3u + c];
      img.rgba[i * 4u + c] = static_cast<std::uint8_t>(std::clamp((v * 255 + maxv / 2) / maxv, 0, 255));
    }
    img.rgba[i * 4u + 3u] = 255u;
  }

  outImg = std::move(img);
  return true;
}

bool ReadRasterAuto(const std::string& path, RasterImage& outImg, std::string& outError)
{
  const std::string ext = LowerExt(path);
  if (ext == ".png") return ReadPng(path, outImg, outError);
  if (ext == ".ppm" || ext == ".pnm") return ReadPpm(path, outImg, outError);

  std::vector<std::uint8_t> bytes;
  if (!ReadFileBytes(path, bytes, outError)) return false;
  if (HasPngSignature(bytes.data(), bytes.size())) return DecodePng(bytes.data(), bytes.size(), outImg, outError);
  if (bytes.size() >= 2 && bytes[0] == 'P' && bytes[1] == '6') return ReadPpm(path, outImg, outError);

  outError = "unknown raster format (expected .png or .ppm): " + path;
  return false;
}

bool EncodePng(const RasterImage& img, std::vector<std::uint8_t>& outBytes, std::string& outError)
{
  outError.clear();
  outBytes.clear();
  if (!IsValidRaster(img)) {
    outError = "invalid raster dimensions or buffer size";
    return false;
  }

  const std::size_t rowBytes = static_cast<std::size_t>(img.width) * 4u;
  std::vector<std::uint8_t> raw;
  raw.reserve((rowBytes + 1u) * static_cast<std::size_t>(img.height));
  for (int y = 0; y < img.height; ++y) {
    raw.push_back(0u); // filter: none
    const auto rowBegin = img.rgba.begin() + static_cast<std::ptrdiff_t>(static_cast<std::size_t>(y) * rowBytes);
    raw.insert(raw.end(), rowBegin, rowBegin + static_cast<std::ptrdiff_t>(rowBytes));
  }
  const std::vector<std::uint8_t> z = CompressZlibStored(raw.data(), raw.size());

  outBytes.insert(outBytes.end(), kPngSig.begin(), kPngSig.end());

  std::uint8_t ihdr[13] = {};
  const std::uint32_t w = static_cast<std::uint32_t>(img.width);
  const std::uint32_t h = static_cast<std::uint32_t>(img.height);
  for (int i = 0; i < 4; ++i) {
    ihdr[i] = static_cast<std::uint8_t>((w >> (24 - 8 * i)) & 0xFFu);
    ihdr[4 + i] = static_cast<std::uint8_t>((h >> (24 - 8 * i)) & 0xFFu);
  }
  ihdr[8] = 8u;     // bit depth
  ihdr[9] = kRgba;  // color type
  ihdr[10] = 0u;    // compression
  ihdr[11] = 0u;    // filter
  ihdr[12] = 0u;    // interlace

  if (!WritePngChunk(outBytes, "IHDR", ihdr, sizeof(ihdr)) || !WritePngChunk(outBytes, "IDAT", z.data(), z.size()) ||
      !WritePngChunk(outBytes, "IEND", nullptr, 0)) {
    outError = "PNG chunk too large";
    outBytes.clear();
    return false;
  }
  return true;
}

bool WritePng(const std::string& path, const RasterImage& img, std::string& outError)
{
  std::vector<std::uint8_t> bytes;
  if (!EncodePng(img, bytes, outError)) return false;

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!f) {
    outError = "failed while writing: " + path;
    return false;
  }
  return true;
}

} // namespace hazmap
