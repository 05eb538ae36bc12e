#pragma once
/**
 * @file timeline.hpp
 * @brief Per-element frame timeline built from a laid-out step
 */

#include "engine/script.hpp"
#include "graphics/image_buffer.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace LectureEngine {

/// Visibility phase of an element at a frame
enum class ElementPhase { NotYetVisible, FadingIn, Visible, FadingOut, Gone };

const char *element_phase_name(ElementPhase phase);

/// Everything the compositor needs to draw one element
struct TimelineEntry {
  std::shared_ptr<const ImageBuffer> bitmap;
  glm::ivec2 center{0, 0};  ///< pixel anchor of the bitmap center
  int64_t start_frame = 0;
  int64_t end_frame = 0;    ///< exclusive
  int64_t fade_in_frames = 0;
  int64_t fade_out_frames = 0;
  int z_index = 0;
  size_t order = 0;         ///< position in the step's element list

  [[nodiscard]] ElementPhase phase_at(int64_t frame) const;

  /// Opacity in [0, 1] at a frame; 0 outside [start_frame, end_frame)
  [[nodiscard]] float alpha_at(int64_t frame) const;

  [[nodiscard]] bool active_at(int64_t frame) const {
    return frame >= start_frame && frame < end_frame;
  }
};

/// Frame count of a step at a frame rate
[[nodiscard]] int64_t step_frame_count(const Step &step, double fps);

/**
 * @brief Build the z-ordered timeline for a laid-out step
 *
 * Elements without a bitmap or resolved position are left out. Entries are
 * stably sorted by ascending z_index, so equal keys keep document order.
 */
[[nodiscard]] std::vector<TimelineEntry>
build_timeline(const Step &step, const Canvas &canvas, double fps);

} // namespace LectureEngine
