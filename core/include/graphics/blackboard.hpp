#pragma once
/**
 * @file blackboard.hpp
 * @brief Procedural blackboard background
 */

#include "engine/config.hpp"
#include "graphics/image_buffer.hpp"

namespace LectureEngine::Graphics {

/**
 * @brief Generate the immutable per-step background
 *
 * Dark base color with per-pixel Gaussian grain clipped to
 * [noise_min, noise_max], plus sparse chalk-dust specks. Output is RGB
 * (3 channels). Identical config and size give identical bytes.
 */
[[nodiscard]] ImageBuffer generate_blackboard(const Canvas &canvas,
                                              const BackgroundConfig &config);

} // namespace LectureEngine::Graphics
