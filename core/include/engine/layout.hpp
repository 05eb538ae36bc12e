#pragma once
/**
 * @file layout.hpp
 * @brief Scene layout: uniform rescale into the safe area and anchor placement
 */

#include "core/result.hpp"
#include "engine/config.hpp"
#include "engine/script.hpp"

#include <glm/glm.hpp>

#include <vector>

namespace LectureEngine {

/// Fallbacks and adjustments applied while laying out a step
enum class LayoutFallback {
  DegenerateSafeZone, ///< non-positive safe extent; full-canvas placement
  BottomFloorApplied, ///< declared bottom margin raised to the caption floor
  MissingBitmap,      ///< element had no bitmap; placed with its declared size
  ScaledDown          ///< content did not fit; bitmaps resampled
};

const char *layout_fallback_name(LayoutFallback fallback);

struct LayoutReport {
  double scale = 1.0;
  SafeZone safe_zone;                   ///< zone actually used
  std::vector<LayoutFallback> fallbacks;
  std::vector<size_t> missing_bitmaps;  ///< element indices

  [[nodiscard]] bool has(LayoutFallback f) const;
};

struct LayoutOutcome {
  Step step;
  LayoutReport report;
};

/**
 * @brief Lay out one step's elements
 *
 * Scales every element uniformly (never up) so the stack fits the safe area,
 * then stores each element's bitmap-center anchor as a canvas fraction in
 * Element::position. Pure; the input step is untouched. Only fails under
 * config.strict, when a degenerate safe zone or missing bitmap was met.
 */
[[nodiscard]] Result<LayoutOutcome> layout_step(const Step &step,
                                                const EngineConfig &config);

/// Safe zone the step will use, with the caption floor enforced
[[nodiscard]] SafeZone effective_safe_zone(const Step &step,
                                           const EngineConfig &config);

/// Canvas-fraction anchor to pixel anchor
[[nodiscard]] glm::ivec2 pixel_anchor(const glm::dvec2 &fraction,
                                      const Canvas &canvas);

} // namespace LectureEngine
