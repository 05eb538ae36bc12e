/**
 * @file text_rasterizer.cpp
 * @brief Text rasterization using stb_truetype with a file-loaded font
 */

#include "text/text_rasterizer.hpp"
#include "core/math.hpp"

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb/stb_truetype.h>

#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>
#include <unordered_map>

namespace LectureEngine {

std::vector<uint32_t> decode_utf8(const std::string &text) {
  std::vector<uint32_t> out;
  out.reserve(text.size());
  constexpr uint32_t replacement = 0xFFFD;

  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<uint8_t>(text[i]);
    int extra = 0;
    uint32_t cp = 0;
    if (lead < 0x80) {
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      cp = lead & 0x1F;
      extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
      cp = lead & 0x0F;
      extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
      cp = lead & 0x07;
      extra = 3;
    } else {
      out.push_back(replacement);
      ++i;
      continue;
    }

    if (i + extra >= text.size()) {
      out.push_back(replacement);
      break;
    }

    bool valid = true;
    for (int k = 1; k <= extra; ++k) {
      const auto cont = static_cast<uint8_t>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }
    out.push_back(valid ? cp : replacement);
    i += valid ? extra + 1 : 1;
  }
  return out;
}

struct TextRasterizer::Impl {
  stbtt_fontinfo font{};
  std::vector<uint8_t> font_data;
  std::string font_path;
  bool loaded = false;
};

TextRasterizer::TextRasterizer() : pimpl_(std::make_unique<Impl>()) {}
TextRasterizer::~TextRasterizer() = default;
TextRasterizer::TextRasterizer(TextRasterizer &&) noexcept = default;
TextRasterizer &TextRasterizer::operator=(TextRasterizer &&) noexcept = default;

Result<bool> TextRasterizer::load_font(const std::string &font_path) {
  if (font_path.empty()) {
    return Error{"no font path configured", ErrorCode::IoError};
  }
  if (pimpl_->loaded && pimpl_->font_path == font_path) {
    return true;
  }

  std::ifstream file(font_path, std::ios::binary);
  if (!file.is_open()) {
    return Error{"cannot open font file: " + font_path, ErrorCode::IoError};
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
  if (data.empty()) {
    return Error{"font file is empty: " + font_path, ErrorCode::IoError};
  }

  const int offset = stbtt_GetFontOffsetForIndex(data.data(), 0);
  if (offset < 0) {
    return Error{"invalid font file format: " + font_path,
                 ErrorCode::InvalidDocument};
  }

  // stbtt_fontinfo points into font_data, so the buffer moves in first
  pimpl_->font_data = std::move(data);
  pimpl_->loaded = false;
  if (!stbtt_InitFont(&pimpl_->font, pimpl_->font_data.data(), offset)) {
    pimpl_->font_data.clear();
    return Error{"failed to initialize font: " + font_path,
                 ErrorCode::InvalidDocument};
  }
  pimpl_->loaded = true;
  pimpl_->font_path = font_path;
  return true;
}

bool TextRasterizer::has_font() const { return pimpl_->loaded; }

float TextRasterizer::measure(const std::string &text, float font_size) const {
  const auto codepoints = decode_utf8(text);
  if (!pimpl_->loaded) {
    // Approximate width without a font
    return codepoints.size() * font_size * 0.6f;
  }

  const float scale = stbtt_ScaleForPixelHeight(&pimpl_->font, font_size);
  float width = 0.0f;
  for (size_t i = 0; i < codepoints.size(); ++i) {
    int advance, lsb;
    stbtt_GetCodepointHMetrics(&pimpl_->font, codepoints[i], &advance, &lsb);
    width += advance * scale;
    if (i + 1 < codepoints.size()) {
      width += stbtt_GetCodepointKernAdvance(&pimpl_->font, codepoints[i],
                                             codepoints[i + 1]) *
               scale;
    }
  }
  return width;
}

Result<ImageBuffer> TextRasterizer::rasterize(const std::string &text,
                                              float font_size,
                                              Color::RGBA color) const {
  if (!pimpl_->loaded) {
    return Error{"no font loaded", ErrorCode::IoError};
  }
  if (!(font_size > 0.0f)) {
    return Error{"font size must be positive", ErrorCode::InvalidDocument};
  }

  const auto codepoints = decode_utf8(text);
  const float scale = stbtt_ScaleForPixelHeight(&pimpl_->font, font_size);

  int ascent, descent, line_gap;
  stbtt_GetFontVMetrics(&pimpl_->font, &ascent, &descent, &line_gap);

  const auto width = static_cast<uint32_t>(
      Math::max(1.0f, std::ceil(measure(text, font_size))));
  const auto height = static_cast<uint32_t>(
      Math::max(1.0f, std::ceil((ascent - descent) * scale)));
  ImageBuffer img = ImageBuffer::create(width, height, 4);

  const float baseline = ascent * scale;
  float cursor_x = 0.0f;
  std::vector<uint8_t> glyph;

  for (size_t i = 0; i < codepoints.size(); ++i) {
    const int c = static_cast<int>(codepoints[i]);

    int advance, lsb;
    stbtt_GetCodepointHMetrics(&pimpl_->font, c, &advance, &lsb);

    int x0, y0, x1, y1;
    stbtt_GetCodepointBitmapBox(&pimpl_->font, c, scale, scale, &x0, &y0, &x1,
                                &y1);
    const int glyph_w = x1 - x0;
    const int glyph_h = y1 - y0;

    if (glyph_w > 0 && glyph_h > 0) {
      glyph.assign(static_cast<size_t>(glyph_w) * glyph_h, 0);
      stbtt_MakeCodepointBitmap(&pimpl_->font, glyph.data(), glyph_w, glyph_h,
                                glyph_w, scale, scale, c);

      const int px = static_cast<int>(std::floor(cursor_x)) + x0;
      const int py = static_cast<int>(std::floor(baseline)) + y0;

      for (int gy = 0; gy < glyph_h; ++gy) {
        for (int gx = 0; gx < glyph_w; ++gx) {
          const int ix = px + gx;
          const int iy = py + gy;
          if (ix < 0 || iy < 0)
            continue;
          uint8_t *pixel = img.pixel(ix, iy);
          if (!pixel)
            continue;

          const uint8_t coverage = glyph[gy * glyph_w + gx];
          const auto a = static_cast<uint8_t>((coverage * color.a) / 255);
          pixel[0] = color.r;
          pixel[1] = color.g;
          pixel[2] = color.b;
          pixel[3] = Math::max(pixel[3], a);
        }
      }
    }

    cursor_x += advance * scale;
    if (i + 1 < codepoints.size()) {
      cursor_x += stbtt_GetCodepointKernAdvance(&pimpl_->font, c,
                                                codepoints[i + 1]) *
                  scale;
    }
  }
  return img;
}

namespace {

const std::unordered_map<std::string, std::string> &latex_symbols() {
  static const std::unordered_map<std::string, std::string> table = {
      {"alpha", "α"},   {"beta", "β"},     {"gamma", "γ"},  {"delta", "δ"},
      {"theta", "θ"},   {"lambda", "λ"},   {"mu", "μ"},     {"pi", "π"},
      {"sigma", "σ"},   {"omega", "ω"},    {"Delta", "Δ"},  {"Sigma", "Σ"},
      {"times", "×"},   {"cdot", "·"},     {"div", "÷"},    {"pm", "±"},
      {"le", "≤"},      {"leq", "≤"},      {"ge", "≥"},     {"geq", "≥"},
      {"neq", "≠"},     {"approx", "≈"},   {"infty", "∞"},  {"sum", "Σ"},
      {"int", "∫"},     {"angle", "∠"},    {"triangle", "△"}, {"circ", "°"},
      {"rightarrow", "→"}, {"Rightarrow", "⇒"}, {"perp", "⊥"}, {"parallel", "∥"},
      {"left", ""},     {"right", ""},     {",", " "},      {"quad", "  "},
  };
  return table;
}

// Reads a {group} or single character starting at i; advances i
std::string read_group(const std::string &s, size_t &i) {
  if (i >= s.size())
    return {};
  if (s[i] != '{')
    return std::string(1, s[i++]);

  int depth = 0;
  const size_t begin = i + 1;
  for (; i < s.size(); ++i) {
    if (s[i] == '{') {
      ++depth;
    } else if (s[i] == '}' && --depth == 0) {
      std::string group = s.substr(begin, i - begin);
      ++i;
      return group;
    }
  }
  return s.substr(begin);
}

std::string superscript(const std::string &group) {
  static const std::unordered_map<char, std::string> digits = {
      {'0', "⁰"}, {'1', "¹"}, {'2', "²"}, {'3', "³"}, {'4', "⁴"},
      {'5', "⁵"}, {'6', "⁶"}, {'7', "⁷"}, {'8', "⁸"}, {'9', "⁹"},
      {'n', "ⁿ"}, {'+', "⁺"}, {'-', "⁻"}};
  std::string out;
  for (char c : group) {
    auto it = digits.find(c);
    if (it == digits.end())
      return "^" + (group.size() > 1 ? "(" + group + ")" : group);
    out += it->second;
  }
  return out;
}

} // anonymous namespace

std::string formula_to_text(const std::string &source) {
  std::string out;
  size_t i = 0;
  while (i < source.size()) {
    const char c = source[i];
    if (c == '$') {
      ++i;
    } else if (c == '\\') {
      ++i;
      size_t end = i;
      while (end < source.size() && std::isalpha(static_cast<unsigned char>(source[end])))
        ++end;
      if (end == i && i < source.size())
        ++end; // single-character command like "\,"
      const std::string command = source.substr(i, end - i);
      i = end;

      if (command == "frac") {
        const std::string num = formula_to_text(read_group(source, i));
        const std::string den = formula_to_text(read_group(source, i));
        out += (num.size() > 1 ? "(" + num + ")" : num) + "/" +
               (den.size() > 1 ? "(" + den + ")" : den);
      } else if (command == "sqrt") {
        out += "√(" + formula_to_text(read_group(source, i)) + ")";
      } else if (auto it = latex_symbols().find(command);
                 it != latex_symbols().end()) {
        out += it->second;
      } else {
        out += command;
      }
    } else if (c == '^') {
      ++i;
      out += superscript(formula_to_text(read_group(source, i)));
    } else if (c == '_') {
      ++i;
      out += formula_to_text(read_group(source, i));
    } else if (c == '{' || c == '}') {
      ++i;
    } else {
      out += c;
      ++i;
    }
  }
  return out;
}

} // namespace LectureEngine
