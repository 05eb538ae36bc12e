#pragma once
/**
 * @file config.hpp
 * @brief Engine configuration passed explicitly to every stage
 */

#include "core/result.hpp"
#include "engine/script.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace LectureEngine {

/// What the synchronizer does with a cue that overlaps no step
enum class UnmappedCuePolicy {
  Drop,       // warn and leave the audio time unassigned
  NearestStep // assign to the step whose midpoint is closest
};

/// Procedural blackboard background parameters
struct BackgroundConfig {
  std::string base_color = "#1E1E1E";
  double noise_sigma = 5.0;
  uint8_t noise_min = 10;
  uint8_t noise_max = 50;
  double dust_probability = 0.005;
  std::string dust_color = "#464646";
  uint64_t seed = 42;
};

/// Engine configuration
struct EngineConfig {
  Canvas canvas;
  double fps = 30.0;

  // Duration synchronization
  double min_step_duration = 0.1;
  double drift_tolerance_seconds = 1.0;
  double drift_tolerance_ratio = 0.05;
  int duration_decimals = 3;
  UnmappedCuePolicy unmapped_cue_policy = UnmappedCuePolicy::Drop;

  // Layout
  double safe_zone_bottom_floor = 0.15;
  SafeZone default_safe_zone;
  double default_vertical_spacing = 0.02;

  // Default bitmap source
  std::string font_path;
  float font_size = 32.0f;

  BackgroundConfig background;

  bool strict = false;  // fallbacks become errors
  bool verbose = true;

  /// Drift tolerance for a given total of measured audio
  [[nodiscard]] double drift_tolerance(double actual_total) const;

  /// Read fields from JSON; unknown keys ignored, missing keys keep defaults
  static Result<EngineConfig> from_json(const nlohmann::json &j);

  /// Read a JSON configuration file
  static Result<EngineConfig> load(const std::string &path);
};

} // namespace LectureEngine
