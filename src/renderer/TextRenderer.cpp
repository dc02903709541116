// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "TextRenderer.hpp"
#include "Font.hpp"
#include "GlyphCache.hpp"
#include "Rasterizer.hpp"

#include <algorithm>

namespace sig {

auto decode_utf8(std::string_view text) -> std::u32string {
  constexpr char32_t Replacement = 0xFFFD;
  std::u32string result;
  result.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t length = 0;
    char32_t codepoint = 0;
    char32_t minimum = 0;
    if (lead < 0x80) {
      result.push_back(lead);
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      length = 2;
      codepoint = lead & 0x1F;
      minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      codepoint = lead & 0x0F;
      minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      codepoint = lead & 0x07;
      minimum = 0x10000;
    } else {
      result.push_back(Replacement);
      ++i;
      continue;
    }

    std::size_t consumed = 1;
    while (consumed < length && i + consumed < text.size() &&
           (static_cast<unsigned char>(text[i + consumed]) & 0xC0) == 0x80) {
      codepoint = (codepoint << 6) | (static_cast<unsigned char>(text[i + consumed]) & 0x3F);
      ++consumed;
    }
    if (consumed != length || codepoint < minimum || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
      result.push_back(Replacement);
    } else {
      result.push_back(codepoint);
    }
    i += consumed;
  }
  return result;
}

struct TextRendererImpl {
  GlyphCache* cache;

  explicit TextRendererImpl(GlyphCache& cache) : cache(&cache) {}

  // Calls fn(glyph, penX) for every glyph of the text, pen positions relative to the start.
  template <class Fn> static auto for_each_glyph(Font const& font, std::string_view text, Fn&& fn) {
    std::int32_t penX = 0;
    std::uint32_t previous = 0;
    for (char32_t codepoint : decode_utf8(text)) {
      std::uint32_t glyphIndex = font.get_glyph_index(codepoint);
      if (glyphIndex == 0) {
        continue;
      }
      if (previous != 0) {
        penX += font.get_kerning(previous, glyphIndex);
      }
      penX += fn(glyphIndex, penX);
      previous = glyphIndex;
    }
    return penX;
  }

  auto draw(PixelsView buffer, Font const& font, std::string_view text, Position position,
            Color color) -> void {
    const std::int32_t baseline = position.y + font.metrics().ascent;
    for_each_glyph(font, text, [&](std::uint32_t glyphIndex, std::int32_t penX) {
      CachedGlyph glyph = cache->get(font, glyphIndex);
      if (!glyph.bitmap.empty()) {
        Position origin{position.x + penX + glyph.metrics.bearing_x,
                        baseline - glyph.metrics.bearing_y};
        Rasterizer::draw_mask(buffer, origin,
                              CoverageMask{.coverage = glyph.bitmap,
                                           .width = glyph.metrics.width,
                                           .height = glyph.metrics.height},
                              color);
      }
      return glyph.metrics.advance_x;
    });
  }
};

TextRenderer::TextRenderer(GlyphCache& cache) : mImpl(std::make_unique<TextRendererImpl>(cache)) {}

TextRenderer::TextRenderer(TextRenderer&&) noexcept = default;
auto TextRenderer::operator=(TextRenderer&&) noexcept -> TextRenderer& = default;
TextRenderer::~TextRenderer() = default;

auto TextRenderer::draw_text(PixelsView buffer, Font const& font, std::string_view text,
                             Position position, Color color) -> void {
  if (!font.is_valid()) {
    return;
  }
  mImpl->draw(buffer, font, text, position, color);
}

auto TextRenderer::draw_halo_text(PixelsView buffer, Font const& font, std::string_view text,
                                  Position position, Color fill, Color outline, int outlineWidth)
    -> void {
  if (!font.is_valid()) {
    return;
  }
  for (int dy = -outlineWidth; dy <= outlineWidth; ++dy) {
    for (int dx = -outlineWidth; dx <= outlineWidth; ++dx) {
      if (dx == 0 && dy == 0) {
        continue;
      }
      mImpl->draw(buffer, font, text, Position{position.x + dx, position.y + dy}, outline);
    }
  }
  mImpl->draw(buffer, font, text, position, fill);
}

auto TextRenderer::measure_text(Font const& font, std::string_view text) const -> Extents {
  if (!font.is_valid()) {
    return {0, 0};
  }

  GlyphCache& cache = *mImpl->cache;
  std::int32_t width = TextRendererImpl::for_each_glyph(
      font, text,
      [&](std::uint32_t glyphIndex, std::int32_t) { return cache.advance(font, glyphIndex); });
  const FontMetrics metrics = font.metrics();
  return Extents{static_cast<std::size_t>(std::max(width, 0)),
                 static_cast<std::size_t>(std::max(metrics.line_height, 0))};
}

} // namespace sig
