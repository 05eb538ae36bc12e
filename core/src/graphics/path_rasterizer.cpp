/**
 * @file path_rasterizer.cpp
 * @brief SVG path subset and stroked polylines
 */

#include "graphics/path_rasterizer.hpp"
#include "core/math.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <numbers>

namespace LectureEngine::Graphics {

namespace {

class PathTokenizer {
public:
  explicit PathTokenizer(const std::string &data) : data_(data) {}

  void skip_separators() {
    while (pos_ < data_.size() &&
           (std::isspace(static_cast<unsigned char>(data_[pos_])) ||
            data_[pos_] == ','))
      ++pos_;
  }

  [[nodiscard]] bool done() {
    skip_separators();
    return pos_ >= data_.size();
  }

  [[nodiscard]] bool next_is_number() {
    skip_separators();
    if (pos_ >= data_.size())
      return false;
    const char c = data_[pos_];
    return std::isdigit(static_cast<unsigned char>(c)) || c == '-' ||
           c == '+' || c == '.';
  }

  char command() { return data_[pos_++]; }

  bool number(double &out) {
    skip_separators();
    const char *begin = data_.c_str() + pos_;
    char *end = nullptr;
    out = std::strtod(begin, &end);
    if (end == begin)
      return false;
    pos_ += static_cast<size_t>(end - begin);
    return true;
  }

  [[nodiscard]] size_t position() const { return pos_; }

private:
  const std::string &data_;
  size_t pos_ = 0;
};

double segment_distance(const glm::dvec2 &p, const glm::dvec2 &a,
                        const glm::dvec2 &b) {
  const glm::dvec2 ab = b - a;
  const double len2 = glm::dot(ab, ab);
  const double t =
      len2 > 0.0 ? Math::saturate(glm::dot(p - a, ab) / len2) : 0.0;
  return glm::length(p - (a + ab * t));
}

void stroke_segment(ImageBuffer &img, const glm::dvec2 &a, const glm::dvec2 &b,
                    float stroke_width, Color::RGBA color) {
  const double half = Math::max(0.5, stroke_width * 0.5);
  const double reach = half + 1.0;
  const int x0 = Math::max(0, static_cast<int>(std::floor(Math::min(a.x, b.x) - reach)));
  const int y0 = Math::max(0, static_cast<int>(std::floor(Math::min(a.y, b.y) - reach)));
  const int x1 = Math::min(static_cast<int>(img.width) - 1,
                           static_cast<int>(std::ceil(Math::max(a.x, b.x) + reach)));
  const int y1 = Math::min(static_cast<int>(img.height) - 1,
                           static_cast<int>(std::ceil(Math::max(a.y, b.y) + reach)));

  for (int y = y0; y <= y1; ++y) {
    for (int x = x0; x <= x1; ++x) {
      const double d = segment_distance({x + 0.5, y + 0.5}, a, b);
      const double coverage = Math::saturate(half + 0.5 - d);
      if (coverage <= 0.0)
        continue;
      uint8_t *p = img.pixel(x, y);
      const auto alpha = static_cast<uint8_t>(coverage * color.a);
      p[0] = color.r;
      p[1] = color.g;
      p[2] = color.b;
      p[3] = Math::max(p[3], alpha);
    }
  }
}

// Source-over of an RGB or RGBA bitmap onto an RGBA bitmap
void composite_over(ImageBuffer &dst, const ImageBuffer &src, int left,
                    int top) {
  for (uint32_t sy = 0; sy < src.height; ++sy) {
    for (uint32_t sx = 0; sx < src.width; ++sx) {
      const int dx = left + static_cast<int>(sx);
      const int dy = top + static_cast<int>(sy);
      if (dx < 0 || dy < 0)
        continue;
      uint8_t *d = dst.pixel(static_cast<uint32_t>(dx), static_cast<uint32_t>(dy));
      if (!d)
        continue;
      const uint8_t *s = src.pixel(sx, sy);
      const double sa = src.has_alpha() ? s[3] / 255.0 : 1.0;
      if (sa <= 0.0)
        continue;
      const double da = d[3] / 255.0;
      const double out_a = sa + da * (1.0 - sa);
      for (int c = 0; c < 3; ++c) {
        const double v = (s[c] * sa + d[c] * da * (1.0 - sa)) / out_a;
        d[c] = static_cast<uint8_t>(Math::clamp(v, 0.0, 255.0));
      }
      d[3] = static_cast<uint8_t>(Math::clamp(out_a * 255.0, 0.0, 255.0));
    }
  }
}

// Endpoint-parameterized elliptical arc flattened into points after `from`
void append_arc(std::vector<glm::dvec2> &out, const glm::dvec2 &from,
                double rx, double ry, double rotation_deg, bool large_arc,
                bool sweep, const glm::dvec2 &to) {
  if (from == to)
    return;
  rx = std::abs(rx);
  ry = std::abs(ry);
  if (rx == 0.0 || ry == 0.0) {
    out.push_back(to);
    return;
  }

  const double phi = rotation_deg * std::numbers::pi / 180.0;
  const double cos_phi = std::cos(phi);
  const double sin_phi = std::sin(phi);

  // Midpoint in the ellipse's rotated frame
  const glm::dvec2 half = (from - to) * 0.5;
  const double x1 = cos_phi * half.x + sin_phi * half.y;
  const double y1 = -sin_phi * half.x + cos_phi * half.y;

  // Radii too small to reach the endpoint are scaled up
  const double lambda = (x1 * x1) / (rx * rx) + (y1 * y1) / (ry * ry);
  if (lambda > 1.0) {
    rx *= std::sqrt(lambda);
    ry *= std::sqrt(lambda);
  }

  const double num =
      rx * rx * ry * ry - rx * rx * y1 * y1 - ry * ry * x1 * x1;
  const double den = rx * rx * y1 * y1 + ry * ry * x1 * x1;
  const double coef = (large_arc == sweep ? -1.0 : 1.0) *
                      std::sqrt(Math::max(0.0, num / den));
  const double cxp = coef * rx * y1 / ry;
  const double cyp = -coef * ry * x1 / rx;
  const glm::dvec2 center{cos_phi * cxp - sin_phi * cyp + (from.x + to.x) * 0.5,
                          sin_phi * cxp + cos_phi * cyp + (from.y + to.y) * 0.5};

  const double theta1 = std::atan2((y1 - cyp) / ry, (x1 - cxp) / rx);
  const double theta2 = std::atan2((-y1 - cyp) / ry, (-x1 - cxp) / rx);
  double delta = theta2 - theta1;
  if (!sweep && delta > 0.0)
    delta -= 2.0 * std::numbers::pi;
  else if (sweep && delta < 0.0)
    delta += 2.0 * std::numbers::pi;

  // Sixteen segments per half turn
  const int segments = Math::max(
      4, static_cast<int>(std::ceil(std::abs(delta) * 16.0 / std::numbers::pi - 1e-9)));
  for (int i = 1; i < segments; ++i) {
    const double t = theta1 + delta * i / segments;
    const double ex = rx * std::cos(t);
    const double ey = ry * std::sin(t);
    out.push_back({center.x + ex * cos_phi - ey * sin_phi,
                   center.y + ex * sin_phi + ey * cos_phi});
  }
  out.push_back(to);
}

} // anonymous namespace

Result<std::vector<Polyline>> parse_path(const std::string &data) {
  std::vector<Polyline> paths;
  PathTokenizer tok(data);
  glm::dvec2 cursor{0.0, 0.0};
  glm::dvec2 subpath_start{0.0, 0.0};
  char current = 0;

  auto fail = [&](const std::string &why) {
    return Error{"path data at offset " + std::to_string(tok.position()) +
                     ": " + why,
                 ErrorCode::InvalidDocument};
  };

  while (!tok.done()) {
    if (!tok.next_is_number()) {
      current = tok.command();
    } else if (current == 0) {
      return fail("coordinates before the first command");
    }

    const bool relative = std::islower(static_cast<unsigned char>(current));
    switch (std::toupper(static_cast<unsigned char>(current))) {
    case 'M': {
      glm::dvec2 p;
      if (!tok.number(p.x) || !tok.number(p.y))
        return fail("moveto needs two numbers");
      cursor = relative ? cursor + p : p;
      subpath_start = cursor;
      paths.push_back({{cursor}, false});
      // Further pairs are implicit lineto
      current = relative ? 'l' : 'L';
      break;
    }
    case 'L': {
      glm::dvec2 p;
      if (!tok.number(p.x) || !tok.number(p.y))
        return fail("lineto needs two numbers");
      cursor = relative ? cursor + p : p;
      if (paths.empty())
        paths.push_back({{subpath_start}, false});
      paths.back().points.push_back(cursor);
      break;
    }
    case 'H': {
      double x;
      if (!tok.number(x))
        return fail("horizontal lineto needs a number");
      cursor.x = relative ? cursor.x + x : x;
      if (paths.empty())
        paths.push_back({{subpath_start}, false});
      paths.back().points.push_back(cursor);
      break;
    }
    case 'V': {
      double y;
      if (!tok.number(y))
        return fail("vertical lineto needs a number");
      cursor.y = relative ? cursor.y + y : y;
      if (paths.empty())
        paths.push_back({{subpath_start}, false});
      paths.back().points.push_back(cursor);
      break;
    }
    case 'A': {
      double rx, ry, rotation, large, sweep;
      glm::dvec2 p;
      if (!tok.number(rx) || !tok.number(ry) || !tok.number(rotation) ||
          !tok.number(large) || !tok.number(sweep) || !tok.number(p.x) ||
          !tok.number(p.y))
        return fail("arc needs seven numbers");
      const glm::dvec2 end = relative ? cursor + p : p;
      if (paths.empty())
        paths.push_back({{subpath_start}, false});
      append_arc(paths.back().points, cursor, rx, ry, rotation, large != 0.0,
                 sweep != 0.0, end);
      cursor = end;
      break;
    }
    case 'Z':
      if (!paths.empty())
        paths.back().closed = true;
      cursor = subpath_start;
      current = 0;
      break;
    default:
      return fail(std::string("unsupported command '") + current + "'");
    }
  }
  return paths;
}

ImageBuffer rasterize_paths(const std::vector<Polyline> &paths,
                            const StrokeStyle &style) {
  return rasterize_figure({{paths, style.stroke_width, style.color}}, {},
                          style.box_size, style.margin);
}

ImageBuffer rasterize_figure(const std::vector<StrokeGroup> &groups,
                             const std::vector<PlacedBitmap> &labels,
                             double box_size, double margin) {
  const auto side =
      static_cast<uint32_t>(Math::max(1L, std::lround(box_size)));

  glm::dvec2 lo{std::numeric_limits<double>::max()};
  glm::dvec2 hi{std::numeric_limits<double>::lowest()};
  size_t point_count = 0;
  auto include = [&](const glm::dvec2 &p) {
    lo = glm::min(lo, p);
    hi = glm::max(hi, p);
    ++point_count;
  };
  for (const auto &group : groups) {
    for (const auto &path : group.paths) {
      for (const auto &p : path.points)
        include(p);
    }
  }
  for (const auto &label : labels)
    include(label.anchor);
  if (point_count == 0) {
    return ImageBuffer::create(side, side, 4);
  }

  const glm::dvec2 extent = hi - lo;
  const double usable = side * (1.0 - 2.0 * margin);
  const double longest = Math::max(extent.x, extent.y);
  const double factor = longest > 0.0 ? usable / longest : 1.0;
  const glm::dvec2 offset =
      glm::dvec2{side * 0.5} - extent * factor * 0.5;
  auto map = [&](const glm::dvec2 &p) { return (p - lo) * factor + offset; };

  // Label rectangles in box pixels; the bitmap covers their union with the box
  std::vector<glm::ivec2> corners;
  glm::ivec2 min_corner{0, 0};
  glm::ivec2 max_corner{static_cast<int>(side), static_cast<int>(side)};
  for (const auto &label : labels) {
    const glm::dvec2 c = map(label.anchor);
    const glm::ivec2 corner{
        static_cast<int>(std::lround(c.x - label.bitmap.width * 0.5)),
        static_cast<int>(std::lround(c.y - label.bitmap.height * 0.5))};
    corners.push_back(corner);
    min_corner = glm::min(min_corner, corner);
    max_corner = glm::max(
        max_corner, corner + glm::ivec2{static_cast<int>(label.bitmap.width),
                                        static_cast<int>(label.bitmap.height)});
  }

  const glm::ivec2 size = max_corner - min_corner;
  ImageBuffer img = ImageBuffer::create(static_cast<uint32_t>(size.x),
                                        static_cast<uint32_t>(size.y), 4);
  const glm::dvec2 shift = -glm::dvec2(min_corner);

  for (const auto &group : groups) {
    for (const auto &path : group.paths) {
      const auto &pts = path.points;
      if (pts.size() == 1) {
        stroke_segment(img, map(pts[0]) + shift, map(pts[0]) + shift,
                       group.stroke_width, group.color);
        continue;
      }
      for (size_t i = 1; i < pts.size(); ++i) {
        stroke_segment(img, map(pts[i - 1]) + shift, map(pts[i]) + shift,
                       group.stroke_width, group.color);
      }
      if (path.closed && pts.size() > 2) {
        stroke_segment(img, map(pts.back()) + shift, map(pts.front()) + shift,
                       group.stroke_width, group.color);
      }
    }
  }

  for (size_t i = 0; i < labels.size(); ++i) {
    composite_over(img, labels[i].bitmap, corners[i].x - min_corner.x,
                   corners[i].y - min_corner.y);
  }
  return img;
}

} // namespace LectureEngine::Graphics
