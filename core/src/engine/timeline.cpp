/**
 * @file timeline.cpp
 * @brief Element phases and opacity ramps
 */

#include "engine/timeline.hpp"
#include "core/math.hpp"
#include "engine/layout.hpp"

#include <algorithm>

namespace LectureEngine {

const char *element_phase_name(ElementPhase phase) {
  switch (phase) {
  case ElementPhase::NotYetVisible:
    return "not_yet_visible";
  case ElementPhase::FadingIn:
    return "fading_in";
  case ElementPhase::Visible:
    return "visible";
  case ElementPhase::FadingOut:
    return "fading_out";
  case ElementPhase::Gone:
    return "gone";
  }
  return "unknown";
}

ElementPhase TimelineEntry::phase_at(int64_t frame) const {
  if (frame < start_frame)
    return ElementPhase::NotYetVisible;
  if (frame >= end_frame)
    return ElementPhase::Gone;
  if (fade_in_frames > 0 && frame < start_frame + fade_in_frames)
    return ElementPhase::FadingIn;
  if (fade_out_frames > 0 && frame > end_frame - fade_out_frames)
    return ElementPhase::FadingOut;
  return ElementPhase::Visible;
}

float TimelineEntry::alpha_at(int64_t frame) const {
  if (!active_at(frame)) {
    return 0.0f;
  }

  double alpha = 1.0;
  if (fade_in_frames > 0) {
    alpha = Math::min(alpha, static_cast<double>(frame - start_frame) /
                                 static_cast<double>(fade_in_frames));
  }
  if (fade_out_frames > 0 && frame > end_frame - fade_out_frames) {
    alpha = Math::min(alpha, static_cast<double>(end_frame - frame) /
                                 static_cast<double>(fade_out_frames));
  }
  return static_cast<float>(Math::saturate(alpha));
}

int64_t step_frame_count(const Step &step, double fps) {
  return Math::seconds_to_frames(step.duration, fps);
}

std::vector<TimelineEntry> build_timeline(const Step &step,
                                          const Canvas &canvas, double fps) {
  const int64_t total = step_frame_count(step, fps);

  std::vector<TimelineEntry> entries;
  entries.reserve(step.elements.size());

  for (size_t i = 0; i < step.elements.size(); ++i) {
    const Element &e = step.elements[i];
    if (!e.bitmap || e.bitmap->empty() || !e.position) {
      continue;
    }

    TimelineEntry entry;
    entry.bitmap = e.bitmap;
    entry.center = pixel_anchor(*e.position, canvas);
    entry.z_index = e.z_index;
    entry.order = i;
    entry.start_frame = 0;
    entry.end_frame = total;

    if (const auto &anim = e.animation) {
      if (anim->start) {
        entry.start_frame =
            Math::clamp(Math::seconds_to_frames(*anim->start, fps),
                        int64_t{0}, total);
      }
      if (anim->end) {
        entry.end_frame = Math::clamp(Math::seconds_to_frames(*anim->end, fps),
                                      entry.start_frame, total);
      }
      const int64_t ramp = Math::seconds_to_frames(anim->duration, fps);
      if (anim->enter != EnterKind::None)
        entry.fade_in_frames = ramp;
      if (anim->exit != ExitKind::None)
        entry.fade_out_frames = ramp;
    }
    entries.push_back(std::move(entry));
  }

  std::stable_sort(entries.begin(), entries.end(),
                   [](const TimelineEntry &a, const TimelineEntry &b) {
                     return a.z_index < b.z_index;
                   });
  return entries;
}

} // namespace LectureEngine
