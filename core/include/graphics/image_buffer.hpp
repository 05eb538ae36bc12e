#pragma once
/**
 * @file image_buffer.hpp
 * @brief CPU pixel buffer shared by bitmap sources, layout and compositor
 */

#include "core/color.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace LectureEngine {

/// Interleaved 8-bit image buffer (RGB or RGBA)
struct ImageBuffer {
  std::vector<uint8_t> data;
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t channels = 4; // RGBA

  /// Create transparent (or black, for RGB) buffer with dimensions
  static ImageBuffer create(uint32_t w, uint32_t h, uint32_t channels = 4);

  /// Get pixel at (x, y); nullptr outside the buffer
  [[nodiscard]] uint8_t *pixel(uint32_t x, uint32_t y);
  [[nodiscard]] const uint8_t *pixel(uint32_t x, uint32_t y) const;

  /// Fill with color
  void fill(Color::RGBA color);

  /// Clear to transparent
  void clear();

  [[nodiscard]] bool empty() const { return width == 0 || height == 0; }
  [[nodiscard]] bool has_alpha() const { return channels == 4; }
  [[nodiscard]] size_t stride() const {
    return static_cast<size_t>(width) * channels;
  }

  [[nodiscard]] std::span<const uint8_t> bytes() const { return data; }

  /**
   * @brief Resample to a new size
   *
   * Box-filters when shrinking (area average over the covered source
   * pixels) and interpolates bilinearly when enlarging. Channel count is
   * preserved. A zero target dimension yields an empty buffer.
   */
  [[nodiscard]] ImageBuffer resized(uint32_t new_width,
                                    uint32_t new_height) const;

  /**
   * @brief Crop to the drawn pixels plus a padding border
   *
   * Drawn means alpha > 0 for RGBA, or any channel above 60 for RGB (light
   * content on a dark board). A buffer with nothing drawn is returned as is.
   */
  [[nodiscard]] ImageBuffer trimmed(uint32_t padding = 2) const;
};

} // namespace LectureEngine
