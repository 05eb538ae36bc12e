#pragma once
/**
 * @file color.hpp
 * @brief Header-only color utilities
 *
 * Provides RGBA color storage, hex parsing for script colors, and the
 * linear "over" blend used by the compositor.
 */

#include <cstdint>
#include <string_view>

namespace LectureEngine::Color {

// ============================================================================
// RGBA Color Structure
// ============================================================================

/**
 * @brief RGBA color with 8-bit components
 *
 * Memory layout is R, G, B, A (matches ImageBuffer pixel layout)
 */
struct RGBA {
  uint8_t r, g, b, a;

  /// Default constructor (white, opaque)
  constexpr RGBA() noexcept : r(255), g(255), b(255), a(255) {}

  /// Component constructor
  constexpr RGBA(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255) noexcept
      : r(r_), g(g_), b(b_), a(a_) {}

  /// Equality comparison
  [[nodiscard]] constexpr bool operator==(const RGBA &other) const noexcept {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
};

// ============================================================================
// Predefined Colors
// ============================================================================

namespace Colors {
constexpr RGBA White{255, 255, 255, 255};
constexpr RGBA Black{0, 0, 0, 255};
constexpr RGBA Transparent{0, 0, 0, 0};

// Blackboard palette
constexpr RGBA Slate{30, 30, 30, 255};
constexpr RGBA ChalkDust{70, 70, 70, 255};
constexpr RGBA Chalk{240, 240, 235, 255};
} // namespace Colors

// ============================================================================
// Hex Color Parsing
// ============================================================================

/**
 * @brief Parse hex color string
 * @param hex Color string (#RGB, #RGBA, #RRGGBB, #RRGGBBAA)
 * @param fallback Returned when the string is empty or malformed
 */
[[nodiscard]] constexpr RGBA parse_hex(std::string_view hex,
                                       RGBA fallback = Colors::White) noexcept {
  if (hex.empty()) {
    return fallback;
  }

  if (hex[0] == '#') {
    hex.remove_prefix(1);
  }

  uint32_t val = 0;
  for (char c : hex) {
    val *= 16;
    if (c >= '0' && c <= '9') {
      val += c - '0';
    } else if (c >= 'a' && c <= 'f') {
      val += c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      val += c - 'A' + 10;
    } else {
      return fallback;
    }
  }

  switch (hex.size()) {
  case 3: // #RGB -> #RRGGBB
    return {static_cast<uint8_t>(((val >> 8) & 0xF) * 17),
            static_cast<uint8_t>(((val >> 4) & 0xF) * 17),
            static_cast<uint8_t>((val & 0xF) * 17), 255};

  case 4: // #RGBA -> #RRGGBBAA
    return {static_cast<uint8_t>(((val >> 12) & 0xF) * 17),
            static_cast<uint8_t>(((val >> 8) & 0xF) * 17),
            static_cast<uint8_t>(((val >> 4) & 0xF) * 17),
            static_cast<uint8_t>((val & 0xF) * 17)};

  case 6:
    return {static_cast<uint8_t>((val >> 16) & 0xFF),
            static_cast<uint8_t>((val >> 8) & 0xFF),
            static_cast<uint8_t>(val & 0xFF), 255};

  case 8:
    return {static_cast<uint8_t>((val >> 24) & 0xFF),
            static_cast<uint8_t>((val >> 16) & 0xFF),
            static_cast<uint8_t>((val >> 8) & 0xFF),
            static_cast<uint8_t>(val & 0xFF)};

  default:
    return fallback;
  }
}

// ============================================================================
// Color Blending
// ============================================================================

/**
 * @brief Blend one channel: dst * (1 - a) + src * a
 *
 * Truncates toward zero so an opaque source reproduces itself exactly and a
 * zero alpha leaves the destination untouched.
 */
[[nodiscard]] constexpr uint8_t blend_channel(uint8_t dst, uint8_t src,
                                              float a) noexcept {
  const float v = dst * (1.0f - a) + src * a;
  return static_cast<uint8_t>(v < 0.0f ? 0.0f : (v > 255.0f ? 255.0f : v));
}

} // namespace LectureEngine::Color
