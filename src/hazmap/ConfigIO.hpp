#pragma once

#include "hazmap/EngineConfig.hpp"
#include "hazmap/Json.hpp"

#include <string>

namespace hazmap {

// JSON helpers for EngineConfig.
//
// Overrides use merge semantics: missing keys leave the existing value unchanged,
// keys of the wrong type are errors, unknown keys are ignored.
//
// The JSON field names are snake_case:
//   alpha_threshold, min_point_spacing, jump_threshold, jump_min_path_points,
//   simplify_trigger_points, simplify_tolerance, anchor_drift_tolerance, aspect_tolerance

std::string EngineConfigToJson(const EngineConfig& cfg, int indentSpaces = 2);

bool ApplyEngineConfigJson(const JsonValue& root, EngineConfig& ioCfg, std::string& outError);

bool LoadEngineConfigJsonFile(const std::string& path, EngineConfig& ioCfg, std::string& outError);
bool WriteEngineConfigJsonFile(const std::string& path, const EngineConfig& cfg, std::string& outError,
                               int indentSpaces = 2);

// Range checks applied after an override (thresholds in range, spacing/tolerances non-negative).
bool ValidateEngineConfig(const EngineConfig& cfg, std::string& outError);

} // namespace hazmap
