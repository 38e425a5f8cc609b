#include "hazmap/ZoneCategory.hpp"

#include <cctype>
#include <string>

namespace hazmap {

namespace {

struct CategoryRow {
  const char* key;
  const char* title;
  RiskLevel risk;
  const char* color;
};

constexpr CategoryRow kCategories[] = {
    {"pink", "Pink Zone", RiskLevel::High, "#ff69b4"},
    {"yellow", "Yellow Zone", RiskLevel::High, "#ffd700"},
    {"green", "Green Zone", RiskLevel::High, "#32cd32"},
    {"orange", "Orange Zone", RiskLevel::Low, "#ffa500"},
    {"purple", "Purple Zone", RiskLevel::Low, "#9370db"},
};

std::string Trim(const std::string& s)
{
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

} // namespace

const char* RiskLevelName(RiskLevel r)
{
  switch (r) {
  case RiskLevel::High: return "High-risk area";
  case RiskLevel::Low: return "Low-risk area";
  case RiskLevel::Unknown: return "Unknown";
  }
  return "Unknown";
}

std::string NormalizeZoneName(const std::string& name)
{
  std::string s = name;
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  const std::size_t pos = s.find("zone");
  if (pos != std::string::npos) s.erase(pos, 4);
  return Trim(s);
}

ZoneCategory LookupZoneCategory(const std::string& zoneName)
{
  const std::string key = NormalizeZoneName(zoneName);

  for (const CategoryRow& row : kCategories) {
    if (key != row.key) continue;

    ZoneCategory c;
    c.key = row.key;
    c.title = row.title;
    c.risk = row.risk;
    c.riskLabel = RiskLevelName(row.risk);
    c.color = row.color;
    if (row.risk == RiskLevel::High) {
      c.floodType = "100-yr Flood";
      c.floodChance = "1% chance";
      c.insurance = "Requires flood insurance";
    } else {
      c.floodType = "500-yr Flood";
      c.floodChance = "0.2% chance";
    }
    return c;
  }

  ZoneCategory c;
  c.title = zoneName + " Zone";
  c.risk = RiskLevel::Unknown;
  c.riskLabel = "Unknown";
  c.floodType = "Unknown";
  c.floodChance = "Unknown";
  c.color = "#666";
  return c;
}

} // namespace hazmap
