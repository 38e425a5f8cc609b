#pragma once

#include <cstdint>

namespace hazmap {

// Largest accepted min_point_spacing (pixels); far beyond any raster dimension in use.
constexpr double kMaxMinPointSpacing = 1000000.0;

// Tunables for the overlay engine. Defaults reproduce the behavior zone shapes
// were authored against; change them only for experiments.
struct EngineConfig {
  // --- Raster sampling ---
  // A pixel is "colored" iff alpha >= alphaThreshold (0..255).
  int alphaThreshold = 10;

  // --- Perimeter extraction ---
  // Edge pixels closer than this (in pixels) to an already kept point are dropped.
  double minPointSpacing = 2.0;

  // Nearest-neighbor ordering: when the nearest unvisited point is farther than
  // jumpThreshold and the path already has more than jumpMinPathPoints points,
  // a new disjoint segment starts at the first unvisited point.
  double jumpThreshold = 50.0;
  int jumpMinPathPoints = 10;

  // Douglas-Peucker runs only when the ordered path has more points than this.
  int simplifyTriggerPoints = 500;
  double simplifyTolerance = 1.0;

  // --- Transforms ---
  // Batch rotation restores an anchor that moved by more than this (degrees).
  double anchorDriftTolerance = 1e-4;

  // --- Bounds maintenance ---
  // fit-aspect leaves bounds alone when aspect ratios differ by no more than this.
  double aspectTolerance = 0.01;

  std::uint8_t alphaThresholdU8() const
  {
    if (alphaThreshold < 0) return 0;
    if (alphaThreshold > 255) return 255;
    return static_cast<std::uint8_t>(alphaThreshold);
  }
};

} // namespace hazmap
