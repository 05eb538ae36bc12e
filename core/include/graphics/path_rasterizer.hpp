#pragma once
/**
 * @file path_rasterizer.hpp
 * @brief SVG path subset parsing and stroked polyline rasterization
 */

#include "core/color.hpp"
#include "core/result.hpp"
#include "graphics/image_buffer.hpp"

#include <glm/glm.hpp>

#include <string>
#include <vector>

namespace LectureEngine::Graphics {

/// One connected run of points; closed runs end where they began
struct Polyline {
  std::vector<glm::dvec2> points;
  bool closed = false;
};

/**
 * @brief Parse straight-line SVG path data
 *
 * Supports M m L l H h V v A a Z z with comma or whitespace separated
 * numbers and implicit command repetition. Elliptical arcs are flattened
 * into line segments. Any other command is an error.
 */
[[nodiscard]] Result<std::vector<Polyline>> parse_path(const std::string &data);

/// Stroke parameters for geometry bitmaps
struct StrokeStyle {
  double box_size = 256.0;  ///< square output side in pixels
  double margin = 0.1;      ///< fraction of box_size kept clear on each side
  float stroke_width = 3.0f;
  Color::RGBA color = Color::Colors::White;
};

/**
 * @brief Rasterize polylines into a square RGBA bitmap
 *
 * Paths are scaled uniformly to fit the box inside the margin and centered.
 * Strokes are antialiased by distance to each segment.
 */
[[nodiscard]] ImageBuffer rasterize_paths(const std::vector<Polyline> &paths,
                                          const StrokeStyle &style);

/// Polylines stroked with one width and color
struct StrokeGroup {
  std::vector<Polyline> paths;
  float stroke_width = 3.0f;
  Color::RGBA color = Color::Colors::White;
};

/// Bitmap centered on a point given in path coordinates
struct PlacedBitmap {
  ImageBuffer bitmap;
  glm::dvec2 anchor{0.0, 0.0};
};

/**
 * @brief Rasterize a figure made of several stroke groups and labels
 *
 * Path points and label anchors share one coordinate frame and are fitted
 * together into a box_size square, like rasterize_paths. Labels keep their
 * pixel size and are composited over the strokes; the bitmap grows past the
 * square where a label would otherwise be cut off.
 */
[[nodiscard]] ImageBuffer
rasterize_figure(const std::vector<StrokeGroup> &groups,
                 const std::vector<PlacedBitmap> &labels, double box_size,
                 double margin = 0.1);

} // namespace LectureEngine::Graphics
