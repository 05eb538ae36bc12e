/**
 * @file compositor.cpp
 * @brief Z-ordered alpha compositing
 */

#include "engine/compositor.hpp"
#include "core/color.hpp"
#include "core/math.hpp"

#include <algorithm>

namespace LectureEngine {

void blend_bitmap(ImageBuffer &canvas, const ImageBuffer &bitmap,
                  glm::ivec2 center, float global_alpha) {
  if (canvas.empty() || bitmap.empty() || !(global_alpha > 0.0f)) {
    return;
  }

  const int cw = static_cast<int>(canvas.width);
  const int ch = static_cast<int>(canvas.height);
  const int bw = static_cast<int>(bitmap.width);
  const int bh = static_cast<int>(bitmap.height);

  // Shift inside the canvas, then crop what still does not fit
  const int x0 = Math::clamp(center.x - bw / 2, 0, Math::max(0, cw - bw));
  const int y0 = Math::clamp(center.y - bh / 2, 0, Math::max(0, ch - bh));
  const int w = Math::min(bw, cw - x0);
  const int h = Math::min(bh, ch - y0);

  const float g = Math::saturate(global_alpha);
  const bool source_alpha = bitmap.has_alpha();

  for (int y = 0; y < h; ++y) {
    const uint8_t *src = bitmap.pixel(0, y);
    uint8_t *dst = canvas.pixel(x0, y0 + y);
    for (int x = 0; x < w; ++x) {
      const float a = source_alpha ? (src[3] / 255.0f) * g : g;
      if (a > 0.0f) {
        dst[0] = Color::blend_channel(dst[0], src[0], a);
        dst[1] = Color::blend_channel(dst[1], src[1], a);
        dst[2] = Color::blend_channel(dst[2], src[2], a);
      }
      src += bitmap.channels;
      dst += canvas.channels;
    }
  }
}

StepFrameSequence::StepFrameSequence(
    std::vector<TimelineEntry> entries,
    std::shared_ptr<const ImageBuffer> background, int64_t frame_count)
    : entries_(std::move(entries)), background_(std::move(background)),
      frame_count_(Math::max(int64_t{0}, frame_count)) {}

const ImageBuffer *StepFrameSequence::next() {
  if (!has_next() || !background_) {
    return nullptr;
  }

  const int64_t f = next_index_++;
  canvas_ = *background_;
  for (const auto &entry : entries_) {
    if (!entry.active_at(f))
      continue;
    const float alpha = entry.alpha_at(f);
    if (alpha > 0.0f) {
      blend_bitmap(canvas_, *entry.bitmap, entry.center, alpha);
    }
  }
  return &canvas_;
}

StepFrameSequence make_frame_sequence(const Step &step,
                                      std::shared_ptr<const ImageBuffer> background,
                                      const Canvas &canvas, double fps) {
  return StepFrameSequence(build_timeline(step, canvas, fps),
                           std::move(background), step_frame_count(step, fps));
}

Result<int64_t> render_step(const Step &step, size_t step_index,
                            std::shared_ptr<const ImageBuffer> background,
                            const Canvas &canvas, double fps, FrameSink &sink) {
  if (!background || background->width != canvas.width ||
      background->height != canvas.height) {
    return Error{"background does not match the canvas",
                 ErrorCode::InvalidDocument};
  }

  auto frames = make_frame_sequence(step, std::move(background), canvas, fps);

  StepInfo info;
  info.index = step_index;
  info.step_id = step.id;
  info.title = step.title;
  info.width = canvas.width;
  info.height = canvas.height;
  info.fps = fps;
  info.frame_count = frames.frame_count();

  if (auto r = sink.begin_step(info); !r) {
    return r.error();
  }

  int64_t written = 0;
  while (frames.has_next()) {
    const int64_t index = frames.next_index();
    const ImageBuffer *frame = frames.next();
    if (auto r = sink.write_frame(*frame, index); !r) {
      return r.error();
    }
    ++written;
  }

  if (auto r = sink.end_step(); !r) {
    return r.error();
  }
  return written;
}

} // namespace LectureEngine
