/**
 * @file image_buffer.cpp
 * @brief ImageBuffer storage and resampling
 */

#include "graphics/image_buffer.hpp"
#include "core/math.hpp"

#include <algorithm>
#include <cmath>

namespace LectureEngine {

ImageBuffer ImageBuffer::create(uint32_t w, uint32_t h, uint32_t channels) {
  ImageBuffer buf;
  buf.width = w;
  buf.height = h;
  buf.channels = channels;
  buf.data.resize(static_cast<size_t>(w) * h * channels, 0);
  return buf;
}

uint8_t *ImageBuffer::pixel(uint32_t x, uint32_t y) {
  if (x >= width || y >= height)
    return nullptr;
  return &data[(static_cast<size_t>(y) * width + x) * channels];
}

const uint8_t *ImageBuffer::pixel(uint32_t x, uint32_t y) const {
  if (x >= width || y >= height)
    return nullptr;
  return &data[(static_cast<size_t>(y) * width + x) * channels];
}

void ImageBuffer::fill(Color::RGBA color) {
  const uint8_t rgba[4] = {color.r, color.g, color.b, color.a};
  for (size_t i = 0; i < data.size(); i += channels) {
    for (uint32_t c = 0; c < channels; ++c) {
      data[i + c] = rgba[c];
    }
  }
}

void ImageBuffer::clear() { std::fill(data.begin(), data.end(), 0); }

namespace {

// Area average of the source rectangle [x0, x1) x [y0, y1) in source pixels
void box_sample(const ImageBuffer &src, double x0, double x1, double y0,
                double y1, uint8_t *out) {
  double acc[4] = {0.0, 0.0, 0.0, 0.0};
  double total = 0.0;

  const auto ix0 = static_cast<uint32_t>(std::floor(x0));
  const auto iy0 = static_cast<uint32_t>(std::floor(y0));
  const auto ix1 = std::min(src.width, static_cast<uint32_t>(std::ceil(x1)));
  const auto iy1 = std::min(src.height, static_cast<uint32_t>(std::ceil(y1)));

  for (uint32_t sy = iy0; sy < iy1; ++sy) {
    const double wy = Math::overlap(y0, y1, sy, sy + 1.0);
    for (uint32_t sx = ix0; sx < ix1; ++sx) {
      const double w = wy * Math::overlap(x0, x1, sx, sx + 1.0);
      if (w <= 0.0)
        continue;
      const uint8_t *p = src.pixel(sx, sy);
      for (uint32_t c = 0; c < src.channels; ++c) {
        acc[c] += p[c] * w;
      }
      total += w;
    }
  }

  for (uint32_t c = 0; c < src.channels; ++c) {
    const double v = total > 0.0 ? acc[c] / total : 0.0;
    out[c] = static_cast<uint8_t>(Math::clamp(std::lround(v), 0L, 255L));
  }
}

void bilinear_sample(const ImageBuffer &src, double fx, double fy,
                     uint8_t *out) {
  fx = Math::clamp(fx, 0.0, static_cast<double>(src.width - 1));
  fy = Math::clamp(fy, 0.0, static_cast<double>(src.height - 1));
  const auto x0 = static_cast<uint32_t>(fx);
  const auto y0 = static_cast<uint32_t>(fy);
  const uint32_t x1 = std::min(x0 + 1, src.width - 1);
  const uint32_t y1 = std::min(y0 + 1, src.height - 1);
  const double tx = fx - x0;
  const double ty = fy - y0;

  const uint8_t *p00 = src.pixel(x0, y0);
  const uint8_t *p10 = src.pixel(x1, y0);
  const uint8_t *p01 = src.pixel(x0, y1);
  const uint8_t *p11 = src.pixel(x1, y1);

  for (uint32_t c = 0; c < src.channels; ++c) {
    const double top = Math::lerp<double>(p00[c], p10[c], tx);
    const double bottom = Math::lerp<double>(p01[c], p11[c], tx);
    const double v = Math::lerp(top, bottom, ty);
    out[c] = static_cast<uint8_t>(Math::clamp(std::lround(v), 0L, 255L));
  }
}

} // anonymous namespace

ImageBuffer ImageBuffer::resized(uint32_t new_width,
                                 uint32_t new_height) const {
  if (new_width == 0 || new_height == 0 || empty()) {
    return ImageBuffer::create(0, 0, channels);
  }
  if (new_width == width && new_height == height) {
    return *this;
  }

  ImageBuffer out = ImageBuffer::create(new_width, new_height, channels);
  const double sx = static_cast<double>(width) / new_width;
  const double sy = static_cast<double>(height) / new_height;
  const bool shrinking = sx >= 1.0 && sy >= 1.0;

  for (uint32_t y = 0; y < new_height; ++y) {
    for (uint32_t x = 0; x < new_width; ++x) {
      uint8_t *dst = out.pixel(x, y);
      if (shrinking) {
        box_sample(*this, x * sx, (x + 1) * sx, y * sy, (y + 1) * sy, dst);
      } else {
        bilinear_sample(*this, (x + 0.5) * sx - 0.5, (y + 0.5) * sy - 0.5,
                        dst);
      }
    }
  }
  return out;
}

ImageBuffer ImageBuffer::trimmed(uint32_t padding) const {
  uint32_t x0 = width, y0 = height, x1 = 0, y1 = 0;
  bool drawn = false;

  for (uint32_t y = 0; y < height; ++y) {
    for (uint32_t x = 0; x < width; ++x) {
      const uint8_t *p = pixel(x, y);
      const bool ink = channels == 4
                           ? p[3] > 0
                           : (p[0] > 60 || p[1] > 60 || p[2] > 60);
      if (!ink)
        continue;
      drawn = true;
      x0 = std::min(x0, x);
      y0 = std::min(y0, y);
      x1 = std::max(x1, x);
      y1 = std::max(y1, y);
    }
  }
  if (!drawn) {
    return *this;
  }

  x0 = x0 > padding ? x0 - padding : 0;
  y0 = y0 > padding ? y0 - padding : 0;
  x1 = std::min(width - 1, x1 + padding);
  y1 = std::min(height - 1, y1 + padding);

  ImageBuffer out = create(x1 - x0 + 1, y1 - y0 + 1, channels);
  for (uint32_t y = 0; y < out.height; ++y) {
    const uint8_t *src = pixel(x0, y0 + y);
    std::copy(src, src + out.stride(), out.pixel(0, y));
  }
  return out;
}

} // namespace LectureEngine
