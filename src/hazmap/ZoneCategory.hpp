#pragma once

#include <string>

namespace hazmap {

enum class RiskLevel : unsigned char {
  High = 0,
  Low,
  Unknown,
};

const char* RiskLevelName(RiskLevel r);

// Default styling and flood metadata for a zone category.
struct ZoneCategory {
  std::string key;   // normalized name ("pink"), empty for unknown categories
  std::string title; // "Pink Zone"
  RiskLevel risk = RiskLevel::Unknown;
  std::string riskLabel;   // "High-risk area"
  std::string floodType;   // "100-yr Flood"
  std::string floodChance; // "1% chance"
  std::string insurance;   // empty when not required
  std::string color;       // CSS hex color
};

// Lowercase, drop the first "zone", trim whitespace: "Pink Zone" -> "pink".
std::string NormalizeZoneName(const std::string& name);

// Known categories: pink, yellow, green (high risk, 100-yr) and orange, purple
// (low risk, 500-yr). Anything else maps to an "Unknown" category colored #666.
ZoneCategory LookupZoneCategory(const std::string& zoneName);

} // namespace hazmap
