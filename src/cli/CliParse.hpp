#pragma once

// Shared CLI parsing + a couple of small filesystem helpers.
//
// The HazMap tools all accept the same kinds of values (zone ids, lat/lng
// pairs, strict finite factors). Keeping the parsers in one place keeps the
// tools consistent about what they accept.

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace hazmap::cli {

inline bool EnsureDir(const std::filesystem::path& p)
{
  if (p.empty()) return false;
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec) return false;
  return std::filesystem::exists(p);
}

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  std::error_code ec;
  const std::filesystem::path parent = file.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) return false;
  }
  return true;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  if (s.empty()) return false;

  // std::from_chars does not accept a leading '+' everywhere.
  if (s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* begin = s.data();
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(begin, end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseF64(std::string_view s, double* out)
{
  if (!out) return false;
  if (s.empty()) return false;

  // Strict: the entire string must parse and the value must be finite.
  std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0) return false;
  if (!end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  if (s == "0" || s == "false" || s == "FALSE" || s == "False" || s == "off" || s == "OFF" ||
      s == "Off" || s == "no" || s == "NO" || s == "No") {
    *out = false;
    return true;
  }
  if (s == "1" || s == "true" || s == "TRUE" || s == "True" || s == "on" || s == "ON" ||
      s == "On" || s == "yes" || s == "YES" || s == "Yes") {
    *out = true;
    return true;
  }
  return false;
}

// "lat,lng" with both components finite.
inline bool ParseLatLng(std::string_view s, double* outLat, double* outLng)
{
  if (!outLat || !outLng) return false;
  const std::size_t pos = s.find(',');
  if (pos == std::string_view::npos) return false;
  double lat = 0.0;
  double lng = 0.0;
  if (!ParseF64(s.substr(0, pos), &lat)) return false;
  if (!ParseF64(s.substr(pos + 1), &lng)) return false;
  *outLat = lat;
  *outLng = lng;
  return true;
}

inline std::vector<std::string> SplitCommaList(std::string_view s)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

// Comma separated zone ids ("1,3,4"). Empty input yields an empty list.
inline bool ParseIdList(std::string_view s, std::vector<int>* out)
{
  if (!out) return false;
  std::vector<int> ids;
  for (const std::string& part : SplitCommaList(s)) {
    int v = 0;
    if (!ParseI32(part, &v)) return false;
    ids.push_back(v);
  }
  *out = std::move(ids);
  return true;
}

} // namespace hazmap::cli
