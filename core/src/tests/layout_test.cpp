/**
 * @file layout_test.cpp
 * @brief Scene layout: safe zones, stacking, fit scaling, fallbacks
 */

#include "core/math.hpp"
#include "engine/layout.hpp"
#include "testing/test_support.hpp"

using namespace LectureEngine;
using LectureEngine::Testing::TestSuite;
using LectureEngine::Testing::make_element;
using LectureEngine::Testing::make_step;

namespace {

constexpr double kEps = 1e-9;

EngineConfig config_for(const Canvas &canvas) {
  EngineConfig config;
  config.canvas = canvas;
  config.verbose = false;
  return config;
}

void test_stacked_anchors(TestSuite &suite) {
  // 1000x1000 canvas so pixel sizes map to exact fractions
  const Canvas canvas{1000, 1000};
  Step step = make_step(1, 2.0);
  step.layout_mode = LayoutMode::AutoStack;
  step.safe_zone = SafeZone{0.05, 0.15, 0.05, 0.40};
  step.vertical_spacing = 0.02;
  step.elements.push_back(make_element("wide", 300, 200, canvas));
  step.elements.push_back(make_element("narrow", 200, 100, canvas));

  auto outcome = layout_step(step, config_for(canvas));
  suite.check("stack lays out", outcome.has_value());
  if (!outcome)
    return;

  const auto &elements = outcome->step.elements;
  suite.check_near("scale stays 1", outcome->report.scale, 1.0);
  suite.check("no scaling fallback",
              !outcome->report.has(LayoutFallback::ScaledDown));
  suite.check_near("first anchor x is safe-area center", elements[0].position->x,
                   0.325, kEps);
  suite.check_near("first anchor y", elements[0].position->y, 0.15, kEps);
  suite.check_near("second anchor x", elements[1].position->x, 0.325, kEps);
  suite.check_near("second anchor y", elements[1].position->y, 0.32, kEps);
  suite.check("sizes unchanged",
              elements[0].size == glm::dvec2{0.3, 0.2} &&
                  elements[1].bitmap->width == 200);
  suite.check("input step untouched", !step.elements[0].position);
}

void test_stack_never_overlaps(TestSuite &suite) {
  const Canvas canvas{800, 800};
  Step step = make_step(1, 1.0);
  step.layout_mode = LayoutMode::AutoStack;
  step.vertical_spacing = 0.01;
  for (uint32_t h : {80u, 40u, 120u, 8u}) {
    step.elements.push_back(make_element("row", 100, h, canvas));
  }

  auto outcome = layout_step(step, config_for(canvas));
  if (!outcome) {
    suite.check("overlap layout", false, outcome.error().message);
    return;
  }

  const auto &elements = outcome->step.elements;
  const double top = outcome->report.safe_zone.top;
  suite.check_near("first row starts at the safe top",
                   elements[0].position->y - elements[0].size.y / 2, top, kEps);
  bool ordered = true;
  for (size_t i = 1; i < elements.size(); ++i) {
    const double prev_bottom = elements[i - 1].position->y +
                               elements[i - 1].size.y / 2;
    const double this_top = elements[i].position->y - elements[i].size.y / 2;
    ordered = ordered && Math::nearly_equal(this_top - prev_bottom, 0.01, kEps);
  }
  suite.check("rows separated by exactly the spacing", ordered);
}

void test_scale_to_fit(TestSuite &suite) {
  // Two 600px rows cannot fit in 0.8 of a 1000px canvas
  const Canvas canvas{1000, 1000};
  Step step = make_step(1, 1.0);
  step.layout_mode = LayoutMode::AutoStack;
  step.vertical_spacing = 0.0;
  step.elements.push_back(make_element("tall", 200, 600, canvas));
  step.elements.push_back(make_element("tall", 200, 600, canvas));

  auto outcome = layout_step(step, config_for(canvas));
  suite.check("scaled layout", outcome.has_value());
  if (!outcome)
    return;

  const auto &report = outcome->report;
  const auto &elements = outcome->step.elements;
  suite.check_near("uniform scale from height", report.scale, 0.8 / 1.2, kEps);
  suite.check("scaling reported", report.has(LayoutFallback::ScaledDown));
  suite.check_near("size scaled", elements[0].size.y, 0.4, kEps);
  suite.check("bitmap resampled", elements[0].bitmap->height == 400 &&
                                      elements[0].bitmap->width == 133);
  suite.check_near("stack fills the safe area",
                   elements[1].position->y + elements[1].size.y / 2, 0.85, kEps);

  // Width-bound case
  Step wide = make_step(2, 1.0);
  wide.elements.push_back(make_element("banner", 1800, 100, canvas));
  auto wide_outcome = layout_step(wide, config_for(canvas));
  suite.check_near("scale from width",
                   wide_outcome ? wide_outcome->report.scale : 0.0, 0.9 / 1.8,
                   kEps);
}

void test_explicit_positions(TestSuite &suite) {
  const Canvas canvas{1000, 500};
  Step step = make_step(1, 1.0);
  Element placed = make_element("placed", 100, 50, canvas);
  placed.declared_position = glm::dvec2{0.0, 1.0};
  step.elements.push_back(placed);
  step.elements.push_back(make_element("centered", 100, 50, canvas));

  auto outcome = layout_step(step, config_for(canvas));
  suite.check("explicit layout", outcome.has_value());
  if (!outcome)
    return;

  const SafeZone zone = outcome->report.safe_zone;
  const auto &elements = outcome->step.elements;
  suite.check_near("declared x maps into the safe area", elements[0].position->x,
                   zone.left, kEps);
  suite.check_near("declared y maps into the safe area", elements[0].position->y,
                   1.0 - zone.bottom, kEps);
  suite.check_near("undeclared centered x", elements[1].position->x,
                   zone.left + zone.available_width() / 2, kEps);
  suite.check_near("undeclared centered y", elements[1].position->y,
                   zone.top + zone.available_height() / 2, kEps);
}

void test_bottom_floor(TestSuite &suite) {
  const Canvas canvas{1000, 1000};
  Step step = make_step(1, 1.0);
  step.safe_zone = SafeZone{0.05, 0.02, 0.05, 0.05};
  step.elements.push_back(make_element("a", 10, 10, canvas));

  EngineConfig config = config_for(canvas);
  auto outcome = layout_step(step, config);
  suite.check("floor layout", outcome.has_value());
  if (!outcome)
    return;
  suite.check_near("bottom raised to the floor", outcome->report.safe_zone.bottom,
                   config.safe_zone_bottom_floor);
  suite.check("floor reported",
              outcome->report.has(LayoutFallback::BottomFloorApplied));

  config.strict = true;
  suite.check("floor is informational in strict mode",
              layout_step(step, config).has_value());

  const SafeZone effective = effective_safe_zone(make_step(2, 1.0), config);
  suite.check_near("default zone used when none declared", effective.top,
                   config.default_safe_zone.top);
}

void test_degenerate_zone(TestSuite &suite) {
  const Canvas canvas{1000, 1000};
  Step step = make_step(1, 1.0);
  step.safe_zone = SafeZone{0.5, 0.5, 0.1, 0.1};
  step.layout_mode = LayoutMode::AutoStack;
  step.elements.push_back(make_element("a", 100, 100, canvas));

  EngineConfig config = config_for(canvas);
  auto outcome = layout_step(step, config);
  suite.check("degenerate zone still lays out", outcome.has_value());
  if (!outcome)
    return;
  suite.check("degenerate zone reported",
              outcome->report.has(LayoutFallback::DegenerateSafeZone));
  suite.check_near("scale forced to 1", outcome->report.scale, 1.0);
  suite.check_near("full-canvas center x", outcome->step.elements[0].position->x,
                   0.5, kEps);
  suite.check_near("full-canvas center y", outcome->step.elements[0].position->y,
                   0.5, kEps);

  // Two 0.1-tall elements with 0.02 spacing occupy [0.39, 0.61]
  Step pair = step;
  pair.vertical_spacing = 0.02;
  pair.elements.push_back(make_element("b", 100, 100, canvas));
  auto stacked = layout_step(pair, config);
  suite.check("degenerate pair lays out", stacked.has_value());
  if (stacked) {
    suite.check_near("stack centered, first",
                     stacked->step.elements[0].position->y, 0.44, kEps);
    suite.check_near("stack centered, second",
                     stacked->step.elements[1].position->y, 0.56, kEps);
  }

  config.strict = true;
  auto rejected = layout_step(step, config);
  suite.check("strict mode rejects degenerate zone",
              !rejected && rejected.error().code == ErrorCode::StrictFallback);
}

void test_missing_bitmap(TestSuite &suite) {
  const Canvas canvas{1000, 1000};
  Step step = make_step(1, 1.0);
  step.elements.push_back(make_element("ok", 100, 100, canvas));
  Element bare;
  bare.content = TextContent{"no pixels", std::nullopt, "#FFFFFF"};
  step.elements.push_back(bare);

  EngineConfig config = config_for(canvas);
  auto outcome = layout_step(step, config);
  suite.check("missing bitmap lays out", outcome.has_value());
  if (outcome) {
    suite.check("missing bitmap reported",
                outcome->report.has(LayoutFallback::MissingBitmap) &&
                    outcome->report.missing_bitmaps ==
                        std::vector<size_t>{1});
    suite.check("element still positioned",
                outcome->step.elements[1].position.has_value());
  }

  config.strict = true;
  suite.check("strict mode rejects missing bitmap",
              !layout_step(step, config).has_value());
}

void test_pixel_anchor(TestSuite &suite) {
  const Canvas canvas{1920, 1080};
  const glm::ivec2 anchor = pixel_anchor({0.5, 0.25}, canvas);
  suite.check("pixel anchor", anchor == glm::ivec2{960, 270});
  suite.check("pixel anchor rounds",
              pixel_anchor({0.3333, 0.0}, canvas) == glm::ivec2{640, 0});
}

} // anonymous namespace

int main() {
  TestSuite suite("Scene Layout Tests");

  suite.run("stacked anchors", [&] { test_stacked_anchors(suite); });
  suite.run("stack spacing", [&] { test_stack_never_overlaps(suite); });
  suite.run("scale to fit", [&] { test_scale_to_fit(suite); });
  suite.run("explicit positions", [&] { test_explicit_positions(suite); });
  suite.run("bottom floor", [&] { test_bottom_floor(suite); });
  suite.run("degenerate zone", [&] { test_degenerate_zone(suite); });
  suite.run("missing bitmap", [&] { test_missing_bitmap(suite); });
  suite.run("pixel anchor", [&] { test_pixel_anchor(suite); });

  return suite.finish();
}
