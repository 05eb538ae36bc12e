#pragma once
/**
 * @file math.hpp
 * @brief Header-only numeric helpers shared by timing, layout and compositing
 *
 * Everything here is constexpr or inline so the stages can use them in tight
 * per-pixel and per-cue loops without crossing translation units.
 */

#include <cmath>
#include <cstdint>
#include <type_traits>

namespace LectureEngine::Math {

// ============================================================================
// Basic Math Utilities
// ============================================================================

/// Constexpr lerp (linear interpolation)
template <typename T> [[nodiscard]] constexpr T lerp(T a, T b, T t) noexcept {
  return a + t * (b - a);
}

/// Constexpr clamp
template <typename T>
[[nodiscard]] constexpr T clamp(T val, T min_val, T max_val) noexcept {
  return val < min_val ? min_val : (val > max_val ? max_val : val);
}

/// Constexpr saturate (clamp to [0, 1])
template <typename T> [[nodiscard]] constexpr T saturate(T val) noexcept {
  return clamp(val, T{0}, T{1});
}

/// Constexpr min
template <typename T> [[nodiscard]] constexpr T min(T a, T b) noexcept {
  return a < b ? a : b;
}

/// Constexpr max
template <typename T> [[nodiscard]] constexpr T max(T a, T b) noexcept {
  return a > b ? a : b;
}

// ============================================================================
// Rounding
// ============================================================================

/// Round to a fixed number of decimal places (half away from zero)
[[nodiscard]] inline double round_to(double value, int decimals) noexcept {
  const double factor = std::pow(10.0, decimals);
  return std::round(value * factor) / factor;
}

/// Seconds -> frame count, rounded to nearest frame and never negative
[[nodiscard]] inline int64_t seconds_to_frames(double seconds,
                                               double fps) noexcept {
  if (!(seconds > 0.0) || !(fps > 0.0))
    return 0;
  return static_cast<int64_t>(std::llround(seconds * fps));
}

/// Approximate equality for durations and fractions
[[nodiscard]] inline bool nearly_equal(double a, double b,
                                       double epsilon = 1e-9) noexcept {
  return std::fabs(a - b) <= epsilon;
}

// ============================================================================
// Intervals
// ============================================================================

/// Length of the intersection of [a0, a1) and [b0, b1); 0 when disjoint
[[nodiscard]] constexpr double overlap(double a0, double a1, double b0,
                                       double b1) noexcept {
  const double lo = max(a0, b0);
  const double hi = min(a1, b1);
  return hi > lo ? hi - lo : 0.0;
}

} // namespace LectureEngine::Math
