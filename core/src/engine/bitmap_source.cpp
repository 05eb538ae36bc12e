/**
 * @file bitmap_source.cpp
 * @brief Default element rasterization
 */

#include "engine/bitmap_source.hpp"
#include "core/color.hpp"
#include "graphics/path_rasterizer.hpp"

#include <memory>
#include <type_traits>

namespace LectureEngine {

DefaultBitmapSource::DefaultBitmapSource(const EngineConfig &config)
    : config_(config) {}

Result<ImageBuffer> render_geometry(const GeometryContent &geometry,
                                    const LabelRenderer &labels) {
  std::vector<Graphics::StrokeGroup> groups;
  size_t point_count = 0;
  for (const auto &shape : geometry.shapes) {
    auto paths = Graphics::parse_path(shape.path);
    if (!paths) {
      return Error{"shape '" + shape.name + "': " + paths.error().message,
                   paths.error().code};
    }
    for (const auto &p : *paths)
      point_count += p.points.size();

    Graphics::StrokeGroup group;
    group.paths = std::move(*paths);
    group.stroke_width = shape.stroke_width.value_or(geometry.stroke_width);
    group.color = Color::parse_hex(shape.color.value_or(geometry.color));
    groups.push_back(std::move(group));
  }

  std::vector<Graphics::PlacedBitmap> placed;
  for (const auto &label : geometry.labels) {
    auto bitmap = labels(label, geometry.color);
    if (!bitmap || bitmap->empty())
      continue;
    placed.push_back({std::move(bitmap.value()), label.position});
  }

  if (point_count == 0 && placed.empty()) {
    return Error{"geometry has no path points or drawable labels",
                 ErrorCode::InvalidDocument};
  }

  return Graphics::rasterize_figure(groups, placed, 256.0 * geometry.scale)
      .trimmed();
}

Result<ImageBuffer>
DefaultBitmapSource::render_line(const std::string &text,
                                 std::optional<float> font_size,
                                 const std::string &color) {
  if (!font_attempted_) {
    font_attempted_ = true;
    if (auto loaded = text_.load_font(config_.font_path); !loaded) {
      font_error_ = loaded.error();
    }
  }
  if (font_error_) {
    return *font_error_;
  }
  auto line = text_.rasterize(text, font_size.value_or(config_.font_size),
                              Color::parse_hex(color));
  if (!line) {
    return line.error();
  }
  return line->trimmed();
}

Result<ImageBuffer>
DefaultBitmapSource::rasterize(const ElementContent &content) {
  return std::visit(
      [this](const auto &c) -> Result<ImageBuffer> {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, TextContent>) {
          return render_line(c.text, c.font_size, c.color);
        } else if constexpr (std::is_same_v<T, FormulaContent>) {
          return render_line(formula_to_text(c.source), c.font_size, c.color);
        } else {
          return render_geometry(
              c, [this](const GeometryLabel &label, const std::string &color) {
                return render_line(label.text, label.font_size, color);
              });
        }
      },
      content);
}

std::vector<BitmapFailure> attach_bitmaps(Script &script,
                                          BitmapSource &source) {
  std::vector<BitmapFailure> failures;
  const double cw = script.canvas.width;
  const double ch = script.canvas.height;

  for (auto &step : script.steps) {
    for (size_t i = 0; i < step.elements.size(); ++i) {
      Element &element = step.elements[i];
      auto bitmap = source.rasterize(element.content);
      if (!bitmap || bitmap->empty()) {
        element.bitmap.reset();
        failures.push_back(
            {step.id, i,
             bitmap ? Error{"empty bitmap", ErrorCode::InvalidDocument}
                    : bitmap.error()});
        continue;
      }
      element.size = {bitmap->width / cw, bitmap->height / ch};
      element.bitmap =
          std::make_shared<const ImageBuffer>(std::move(bitmap.value()));
    }
  }
  return failures;
}

} // namespace LectureEngine
