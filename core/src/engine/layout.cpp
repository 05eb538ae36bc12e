/**
 * @file layout.cpp
 * @brief Scene layout engine
 */

#include "engine/layout.hpp"
#include "core/math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace LectureEngine {

namespace {

struct Placement {
  glm::dvec2 origin;
  glm::dvec2 extent;

  [[nodiscard]] glm::dvec2 center() const { return origin + extent * 0.5; }
};

double fit_scale(const std::vector<Element> &elements, double spacing,
                 const SafeZone &zone) {
  double total_height = 0.0;
  double widest = 0.0;
  for (const auto &e : elements) {
    total_height += e.size.y;
    widest = Math::max(widest, e.size.x);
  }
  total_height += spacing * static_cast<double>(elements.size() - 1);

  constexpr double unbounded = std::numeric_limits<double>::infinity();
  const double s_v =
      total_height > 0.0 ? zone.available_height() / total_height : unbounded;
  const double s_h = widest > 0.0 ? zone.available_width() / widest : unbounded;
  return Math::min(Math::min(s_v, s_h), 1.0);
}

void rescale(Element &element, double scale, const Canvas &canvas) {
  element.size *= scale;
  if (!element.bitmap || element.bitmap->empty()) {
    return;
  }
  const auto w = static_cast<uint32_t>(Math::max(
      1L, std::lround(element.size.x * canvas.width)));
  const auto h = static_cast<uint32_t>(Math::max(
      1L, std::lround(element.size.y * canvas.height)));
  element.bitmap = std::make_shared<const ImageBuffer>(
      element.bitmap->resized(w, h));
}

// Stacks from the top of the area, or centered in it when `centered`
void place_stacked(std::vector<Element> &elements, const Placement &area,
                   double spacing, bool centered) {
  double cursor = area.origin.y;
  if (centered) {
    double total = spacing * static_cast<double>(elements.size() - 1);
    for (const auto &e : elements)
      total += e.size.y;
    cursor += (area.extent.y - total) * 0.5;
  }
  for (auto &e : elements) {
    const double x = e.declared_position
                         ? area.origin.x + e.declared_position->x * area.extent.x
                         : area.center().x;
    e.position = glm::dvec2{x, cursor + e.size.y * 0.5};
    cursor += e.size.y + spacing;
  }
}

void place_explicit(std::vector<Element> &elements, const Placement &area) {
  for (auto &e : elements) {
    e.position = e.declared_position
                     ? area.origin + *e.declared_position * area.extent
                     : area.center();
  }
}

} // anonymous namespace

const char *layout_fallback_name(LayoutFallback fallback) {
  switch (fallback) {
  case LayoutFallback::DegenerateSafeZone:
    return "degenerate_safe_zone";
  case LayoutFallback::BottomFloorApplied:
    return "bottom_floor_applied";
  case LayoutFallback::MissingBitmap:
    return "missing_bitmap";
  case LayoutFallback::ScaledDown:
    return "scaled_down";
  }
  return "unknown";
}

bool LayoutReport::has(LayoutFallback f) const {
  return std::find(fallbacks.begin(), fallbacks.end(), f) != fallbacks.end();
}

SafeZone effective_safe_zone(const Step &step, const EngineConfig &config) {
  SafeZone zone = step.safe_zone.value_or(config.default_safe_zone);
  zone.bottom = Math::max(zone.bottom, config.safe_zone_bottom_floor);
  return zone;
}

glm::ivec2 pixel_anchor(const glm::dvec2 &fraction, const Canvas &canvas) {
  return {static_cast<int>(std::lround(fraction.x * canvas.width)),
          static_cast<int>(std::lround(fraction.y * canvas.height))};
}

Result<LayoutOutcome> layout_step(const Step &step,
                                  const EngineConfig &config) {
  LayoutOutcome outcome{step, {}};
  LayoutReport &report = outcome.report;
  auto &elements = outcome.step.elements;

  const SafeZone declared = step.safe_zone.value_or(config.default_safe_zone);
  report.safe_zone = effective_safe_zone(step, config);
  if (report.safe_zone.bottom > declared.bottom) {
    report.fallbacks.push_back(LayoutFallback::BottomFloorApplied);
  }

  Placement area{{report.safe_zone.left, report.safe_zone.top},
                 {report.safe_zone.available_width(),
                  report.safe_zone.available_height()}};
  const bool degenerate = !(area.extent.x > 0.0) || !(area.extent.y > 0.0);
  if (degenerate) {
    report.fallbacks.push_back(LayoutFallback::DegenerateSafeZone);
    area = Placement{{0.0, 0.0}, {1.0, 1.0}};
  }

  for (size_t i = 0; i < elements.size(); ++i) {
    if (!elements[i].bitmap || elements[i].bitmap->empty()) {
      report.missing_bitmaps.push_back(i);
    }
  }
  if (!report.missing_bitmaps.empty()) {
    report.fallbacks.push_back(LayoutFallback::MissingBitmap);
  }

  if (config.strict && (degenerate || !report.missing_bitmaps.empty())) {
    return Error{"step " + std::to_string(step.id) + ": " +
                     (degenerate ? "safe zone leaves no content area"
                                 : "element without bitmap"),
                 ErrorCode::StrictFallback};
  }

  if (elements.empty()) {
    return outcome;
  }

  double spacing =
      step.vertical_spacing.value_or(config.default_vertical_spacing);

  if (!degenerate) {
    report.scale = fit_scale(elements, spacing, report.safe_zone);
    if (report.scale < 1.0) {
      report.fallbacks.push_back(LayoutFallback::ScaledDown);
      for (auto &e : elements) {
        rescale(e, report.scale, config.canvas);
      }
      spacing *= report.scale;
    }
  }

  if (step.layout_mode == LayoutMode::AutoStack) {
    place_stacked(elements, area, spacing, degenerate);
  } else {
    place_explicit(elements, area);
  }
  return outcome;
}

} // namespace LectureEngine
