#pragma once
/**
 * @file compositor.hpp
 * @brief Per-frame compositing of a step's timeline over the background
 */

#include "core/result.hpp"
#include "engine/script.hpp"
#include "engine/timeline.hpp"
#include "graphics/image_buffer.hpp"
#include "output/frame_sink.hpp"

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace LectureEngine {

/**
 * @brief Blend a bitmap centered at a pixel anchor
 *
 * The bitmap is shifted (never scaled) to stay inside the canvas and cropped
 * where it is larger than the canvas. Per channel:
 * dst' = dst * (1 - a) + src * a, with a = src.alpha / 255 * global_alpha
 * for RGBA sources and a = global_alpha for opaque ones.
 */
void blend_bitmap(ImageBuffer &canvas, const ImageBuffer &bitmap,
                  glm::ivec2 center, float global_alpha);

/**
 * @brief Single-pass frame sequence for one step
 *
 * Each call to next() restores the canvas from the immutable background and
 * blends the active entries in z-order. The returned buffer is reused by the
 * following call. Not restartable and not copyable.
 */
class StepFrameSequence {
public:
  StepFrameSequence(std::vector<TimelineEntry> entries,
                    std::shared_ptr<const ImageBuffer> background,
                    int64_t frame_count);

  StepFrameSequence(StepFrameSequence &&) noexcept = default;
  StepFrameSequence &operator=(StepFrameSequence &&) noexcept = default;
  StepFrameSequence(const StepFrameSequence &) = delete;
  StepFrameSequence &operator=(const StepFrameSequence &) = delete;

  [[nodiscard]] bool has_next() const { return next_index_ < frame_count_; }
  [[nodiscard]] int64_t frame_count() const { return frame_count_; }

  /// Index the next call to next() will produce
  [[nodiscard]] int64_t next_index() const { return next_index_; }

  /// Compose the next frame; nullptr once exhausted
  const ImageBuffer *next();

private:
  std::vector<TimelineEntry> entries_;
  std::shared_ptr<const ImageBuffer> background_;
  ImageBuffer canvas_;
  int64_t frame_count_ = 0;
  int64_t next_index_ = 0;
};

/// Build the frame sequence for a laid-out step
[[nodiscard]] StepFrameSequence
make_frame_sequence(const Step &step, std::shared_ptr<const ImageBuffer> background,
                    const Canvas &canvas, double fps);

/**
 * @brief Render a laid-out step into a sink
 *
 * Frames are handed to the sink one at a time as they are composed.
 * Returns the number of frames written.
 */
Result<int64_t> render_step(const Step &step, size_t step_index,
                            std::shared_ptr<const ImageBuffer> background,
                            const Canvas &canvas, double fps, FrameSink &sink);

} // namespace LectureEngine
