#pragma once
/**
 * @file text_rasterizer.hpp
 * @brief Single-line glyph rasterization with stb_truetype
 */

#include "core/color.hpp"
#include "core/result.hpp"
#include "graphics/image_buffer.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace LectureEngine {

/// Decode UTF-8 into codepoints; malformed bytes become U+FFFD
[[nodiscard]] std::vector<uint32_t> decode_utf8(const std::string &text);

/**
 * @brief TrueType text rasterizer
 *
 * Owns the font file bytes for its lifetime. Rasterized text is returned as
 * a tightly cropped RGBA bitmap: the requested color with glyph coverage in
 * the alpha channel, height = ascent - descent at the requested pixel size.
 */
class TextRasterizer {
public:
  TextRasterizer();
  ~TextRasterizer();

  TextRasterizer(TextRasterizer &&) noexcept;
  TextRasterizer &operator=(TextRasterizer &&) noexcept;
  TextRasterizer(const TextRasterizer &) = delete;
  TextRasterizer &operator=(const TextRasterizer &) = delete;

  /// Load a .ttf/.otf file; replaces any previously loaded font
  Result<bool> load_font(const std::string &font_path);

  [[nodiscard]] bool has_font() const;

  /// Advance width of a line in pixels (kerning included)
  [[nodiscard]] float measure(const std::string &text, float font_size) const;

  /// Render one line of text
  [[nodiscard]] Result<ImageBuffer> rasterize(const std::string &text,
                                              float font_size,
                                              Color::RGBA color) const;

private:
  struct Impl;
  std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Formula source to a displayable line
 *
 * Strips math delimiters and maps common LaTeX commands (\alpha, \times,
 * \sqrt, \frac{a}{b}, ...) to their Unicode forms.
 */
[[nodiscard]] std::string formula_to_text(const std::string &source);

} // namespace LectureEngine
