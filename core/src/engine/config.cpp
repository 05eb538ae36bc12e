/**
 * @file config.cpp
 * @brief EngineConfig loading
 */

#include "engine/config.hpp"
#include "core/math.hpp"

#include <fstream>

using json = nlohmann::json;

namespace LectureEngine {

namespace {

SafeZone parse_safe_zone(const json &j, SafeZone zone) {
  zone.top = j.value("top", zone.top);
  zone.bottom = j.value("bottom", zone.bottom);
  zone.left = j.value("left", zone.left);
  zone.right = j.value("right", zone.right);
  return zone;
}

BackgroundConfig parse_background(const json &j, BackgroundConfig bg) {
  bg.base_color = j.value("base_color", bg.base_color);
  bg.noise_sigma = j.value("noise_sigma", bg.noise_sigma);
  bg.noise_min = j.value("noise_min", bg.noise_min);
  bg.noise_max = j.value("noise_max", bg.noise_max);
  bg.dust_probability = j.value("dust_probability", bg.dust_probability);
  bg.dust_color = j.value("dust_color", bg.dust_color);
  bg.seed = j.value("seed", bg.seed);
  return bg;
}

} // anonymous namespace

double EngineConfig::drift_tolerance(double actual_total) const {
  return Math::max(drift_tolerance_seconds,
                   drift_tolerance_ratio * actual_total);
}

Result<EngineConfig> EngineConfig::from_json(const json &j) {
  if (!j.is_object()) {
    return Error{"configuration must be a JSON object",
                 ErrorCode::InvalidDocument};
  }

  EngineConfig config;
  try {
    if (j.contains("canvas")) {
      const int64_t width =
          j["canvas"].value("width", static_cast<int64_t>(config.canvas.width));
      const int64_t height =
          j["canvas"].value("height", static_cast<int64_t>(config.canvas.height));
      if (width <= 0 || height <= 0 || width > kMaxCanvasSide ||
          height > kMaxCanvasSide) {
        return Error{"canvas dimensions must be in [1, " +
                         std::to_string(kMaxCanvasSide) + "]",
                     ErrorCode::InvalidDocument};
      }
      config.canvas.width = static_cast<uint32_t>(width);
      config.canvas.height = static_cast<uint32_t>(height);
    }
    config.fps = j.value("fps", config.fps);

    config.min_step_duration =
        j.value("min_step_duration", config.min_step_duration);
    config.drift_tolerance_seconds =
        j.value("drift_tolerance_seconds", config.drift_tolerance_seconds);
    config.drift_tolerance_ratio =
        j.value("drift_tolerance_ratio", config.drift_tolerance_ratio);
    config.duration_decimals =
        j.value("duration_decimals", config.duration_decimals);

    const std::string policy = j.value("unmapped_cue_policy", "drop");
    if (policy == "nearest_step") {
      config.unmapped_cue_policy = UnmappedCuePolicy::NearestStep;
    } else if (policy != "drop") {
      return Error{"unknown unmapped_cue_policy '" + policy + "'",
                   ErrorCode::InvalidDocument};
    }

    config.safe_zone_bottom_floor =
        j.value("safe_zone_bottom_floor", config.safe_zone_bottom_floor);
    if (j.contains("default_safe_zone")) {
      config.default_safe_zone =
          parse_safe_zone(j["default_safe_zone"], config.default_safe_zone);
    }
    config.default_vertical_spacing =
        j.value("default_vertical_spacing", config.default_vertical_spacing);

    config.font_path = j.value("font_path", config.font_path);
    config.font_size = j.value("font_size", config.font_size);

    if (j.contains("background")) {
      config.background = parse_background(j["background"], config.background);
    }

    config.strict = j.value("strict", config.strict);
    config.verbose = j.value("verbose", config.verbose);
  } catch (const json::exception &e) {
    return Error{std::string("malformed configuration: ") + e.what(),
                 ErrorCode::InvalidDocument};
  }

  if (!(config.fps > 0.0) || config.fps > kMaxFps) {
    return Error{"fps must be in (0, " + std::to_string(static_cast<int>(kMaxFps)) + "]",
                 ErrorCode::InvalidDocument};
  }
  return config;
}

Result<EngineConfig> EngineConfig::load(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Error{"cannot open configuration file: " + path,
                 ErrorCode::IoError};
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::parse_error &e) {
    return Error{std::string("configuration is not valid JSON: ") + e.what(),
                 ErrorCode::InvalidDocument};
  }
  return from_json(j);
}

} // namespace LectureEngine
