#pragma once
/**
 * @file bitmap_source.hpp
 * @brief Element rasterization seam
 */

#include "core/result.hpp"
#include "engine/config.hpp"
#include "engine/script.hpp"
#include "graphics/image_buffer.hpp"
#include "text/text_rasterizer.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace LectureEngine {

/**
 * @brief Produces the bitmap for an element's content
 *
 * Queried once per element; the core derives the element's canvas-fraction
 * size from the returned pixel dimensions and never asks again.
 */
class BitmapSource {
public:
  virtual ~BitmapSource() = default;

  virtual Result<ImageBuffer> rasterize(const ElementContent &content) = 0;
};

/// Draws one geometry label in the figure's color
using LabelRenderer = std::function<Result<ImageBuffer>(
    const GeometryLabel &label, const std::string &color)>;

/**
 * @brief Stroke every shape of a figure and place its labels
 *
 * Shapes are fitted together into a square of 256 * scale pixels. A label
 * that fails to render is left out. Fails when a shape's path is malformed
 * or when nothing is left to draw. The result is trimmed to the drawn
 * pixels.
 */
Result<ImageBuffer> render_geometry(const GeometryContent &geometry,
                                    const LabelRenderer &labels);

/**
 * @brief Built-in source: stb_truetype glyphs and stroked SVG paths
 *
 * Text and formula content are drawn as one line with the configured font;
 * geometry goes through render_geometry with labels in the same font.
 * Every bitmap is trimmed to its drawn pixels.
 */
class DefaultBitmapSource : public BitmapSource {
public:
  explicit DefaultBitmapSource(const EngineConfig &config);

  Result<ImageBuffer> rasterize(const ElementContent &content) override;

private:
  Result<ImageBuffer> render_line(const std::string &text,
                                  std::optional<float> font_size,
                                  const std::string &color);

  EngineConfig config_;
  TextRasterizer text_;
  bool font_attempted_ = false;
  std::optional<Error> font_error_;
};

/// Element that could not be rasterized
struct BitmapFailure {
  int step_id = 0;
  size_t element = 0;
  Error error;
};

/**
 * @brief Rasterize every element and derive its canvas-fraction size
 *
 * Elements whose rasterization fails keep no bitmap and are reported; the
 * layout engine then records them as missing.
 */
std::vector<BitmapFailure> attach_bitmaps(Script &script, BitmapSource &source);

} // namespace LectureEngine
