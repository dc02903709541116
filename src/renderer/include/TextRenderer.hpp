// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "PixelsView.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace sig {

class Font;
class GlyphCache;

// Decodes UTF-8. Malformed sequences become U+FFFD.
auto decode_utf8(std::string_view text) -> std::u32string;

// Text width measurement, separated so layout can run without a glyph rasterizer.
class TextMeasure {
public:
  virtual ~TextMeasure() = default;

  // Advance width and line height of `text` in pixels.
  virtual auto measure_text(Font const& font, std::string_view text) const -> Extents = 0;
};

// Renders UTF-8 text onto RGBA views using FreeType glyphs from a GlyphCache.
// Code points the font has no glyph for are skipped.
class TextRenderer : public TextMeasure {
public:
  explicit TextRenderer(GlyphCache& cache);
  TextRenderer(TextRenderer&&) noexcept;
  auto operator=(TextRenderer&&) noexcept -> TextRenderer&;
  ~TextRenderer() override;

  // `position` is the top-left of the line box; the baseline sits at position.y + ascent.
  auto draw_text(PixelsView buffer, Font const& font, std::string_view text, Position position,
                 Color color) -> void;

  // Paints the text in `outline` at every offset (dx, dy) with |dx|, |dy| <= outlineWidth
  // except (0, 0), then paints it in `fill` at `position`. Every pixel the fill covers fully
  // is therefore surrounded by opaque outline or fill when the outline color is opaque.
  auto draw_halo_text(PixelsView buffer, Font const& font, std::string_view text,
                      Position position, Color fill, Color outline, int outlineWidth) -> void;

  auto measure_text(Font const& font, std::string_view text) const -> Extents override;

private:
  std::unique_ptr<struct TextRendererImpl> mImpl;
};

} // namespace sig
