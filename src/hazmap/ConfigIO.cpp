#include "hazmap/ConfigIO.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace hazmap {

namespace {

bool GetFiniteNumber(const JsonValue& root, const char* key, const JsonValue** out, std::string& err)
{
  *out = FindJsonMember(root, key);
  if (!*out) return true; // missing => keep
  if (!(*out)->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!std::isfinite((*out)->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  return true;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = nullptr;
  if (!GetFiniteNumber(root, key, &v, err)) return false;
  if (!v) return true;
  const double d = v->numberValue;
  if (d < -2147483648.0 || d > 2147483647.0) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(d));
  return true;
}

bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = nullptr;
  if (!GetFiniteNumber(root, key, &v, err)) return false;
  if (v) io = v->numberValue;
  return true;
}

} // namespace

std::string EngineConfigToJson(const EngineConfig& cfg, int indentSpaces)
{
  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;

  JsonWriter w(oss, opt);
  w.beginObject();
  w.key("alpha_threshold");
  w.intValue(cfg.alphaThreshold);
  w.member("min_point_spacing", cfg.minPointSpacing);
  w.member("jump_threshold", cfg.jumpThreshold);
  w.key("jump_min_path_points");
  w.intValue(cfg.jumpMinPathPoints);
  w.key("simplify_trigger_points");
  w.intValue(cfg.simplifyTriggerPoints);
  w.member("simplify_tolerance", cfg.simplifyTolerance);
  w.member("anchor_drift_tolerance", cfg.anchorDriftTolerance);
  w.member("aspect_tolerance", cfg.aspectTolerance);
  w.endObject();
  if (opt.pretty) oss << '\n';
  return oss.str();
}

bool ApplyEngineConfigJson(const JsonValue& root, EngineConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "EngineConfig JSON must be an object";
    return false;
  }

  // Apply into a copy so a failed override leaves ioCfg untouched.
  EngineConfig cfg = ioCfg;
  std::string err;

  if (!ApplyI32(root, "alpha_threshold", cfg.alphaThreshold, err) ||
      !ApplyF64(root, "min_point_spacing", cfg.minPointSpacing, err) ||
      !ApplyF64(root, "jump_threshold", cfg.jumpThreshold, err) ||
      !ApplyI32(root, "jump_min_path_points", cfg.jumpMinPathPoints, err) ||
      !ApplyI32(root, "simplify_trigger_points", cfg.simplifyTriggerPoints, err) ||
      !ApplyF64(root, "simplify_tolerance", cfg.simplifyTolerance, err) ||
      !ApplyF64(root, "anchor_drift_tolerance", cfg.anchorDriftTolerance, err) ||
      !ApplyF64(root, "aspect_tolerance", cfg.aspectTolerance, err)) {
    outError = err;
    return false;
  }

  if (!ValidateEngineConfig(cfg, err)) {
    outError = err;
    return false;
  }

  ioCfg = cfg;
  outError.clear();
  return true;
}

bool LoadEngineConfigJsonFile(const std::string& path, EngineConfig& ioCfg, std::string& outError)
{
  JsonValue root;
  std::string err;
  if (!LoadJsonFile(path, root, err)) {
    outError = err;
    return false;
  }
  if (!ApplyEngineConfigJson(root, ioCfg, err)) {
    outError = path + ": " + err;
    return false;
  }
  outError.clear();
  return true;
}

bool WriteEngineConfigJsonFile(const std::string& path, const EngineConfig& cfg, std::string& outError,
                               int indentSpaces)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  f << EngineConfigToJson(cfg, indentSpaces);
  if (!f) {
    outError = "failed while writing: " + path;
    return false;
  }
  outError.clear();
  return true;
}

bool ValidateEngineConfig(const EngineConfig& cfg, std::string& outError)
{
  if (cfg.alphaThreshold < 0 || cfg.alphaThreshold > 255) {
    outError = "alpha_threshold must be in [0,255]";
    return false;
  }
  if (cfg.minPointSpacing < 0.0 || cfg.minPointSpacing > kMaxMinPointSpacing) {
    outError = "min_point_spacing must be in [0," + std::to_string(static_cast<int>(kMaxMinPointSpacing)) + "]";
    return false;
  }
  if (cfg.jumpThreshold < 0.0) {
    outError = "jump_threshold must be >= 0";
    return false;
  }
  if (cfg.jumpMinPathPoints < 0) {
    outError = "jump_min_path_points must be >= 0";
    return false;
  }
  if (cfg.simplifyTriggerPoints < 0) {
    outError = "simplify_trigger_points must be >= 0";
    return false;
  }
  if (cfg.simplifyTolerance < 0.0 || cfg.anchorDriftTolerance < 0.0 || cfg.aspectTolerance < 0.0) {
    outError = "tolerances must be >= 0";
    return false;
  }
  return true;
}

} // namespace hazmap
