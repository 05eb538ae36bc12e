/**
 * @file blackboard.cpp
 * @brief Procedural blackboard background
 */

#include "graphics/blackboard.hpp"
#include "core/color.hpp"
#include "core/deterministic.hpp"
#include "core/math.hpp"

#include <cmath>

namespace LectureEngine::Graphics {

ImageBuffer generate_blackboard(const Canvas &canvas,
                                const BackgroundConfig &config) {
  ImageBuffer board = ImageBuffer::create(canvas.width, canvas.height, 3);

  const Color::RGBA base = Color::parse_hex(config.base_color, Color::Colors::Slate);
  const Color::RGBA dust = Color::parse_hex(config.dust_color, Color::Colors::ChalkDust);
  const double lo = config.noise_min;
  const double hi = Math::max(lo, static_cast<double>(config.noise_max));

  Deterministic::DeterministicRNG rng(config.seed);

  for (uint32_t y = 0; y < canvas.height; ++y) {
    for (uint32_t x = 0; x < canvas.width; ++x) {
      uint8_t *p = board.pixel(x, y);

      // Draw both samples every pixel so the sequence is layout independent
      const double grain = rng.next_gaussian() * config.noise_sigma;
      const bool speck = rng.next_double() < config.dust_probability;

      if (speck) {
        p[0] = dust.r;
        p[1] = dust.g;
        p[2] = dust.b;
        continue;
      }

      const uint8_t channels[3] = {base.r, base.g, base.b};
      for (int c = 0; c < 3; ++c) {
        const double v = Math::clamp(channels[c] + grain, lo, hi);
        p[c] = static_cast<uint8_t>(v);
      }
    }
  }
  return board;
}

} // namespace LectureEngine::Graphics
