// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace sig {

struct FontImpl;

struct FontMetrics {
  std::int32_t ascent;      // Distance from baseline to highest point
  std::int32_t descent;     // Distance from baseline to lowest point, negative
  std::int32_t line_height; // Recommended line spacing
  std::uint32_t size_px;
};

// Placement of a rendered glyph bitmap relative to the pen position on the baseline.
struct GlyphMetrics {
  std::uint32_t width;
  std::uint32_t height;
  std::int32_t bearing_x; // Pen to left edge of the bitmap
  std::int32_t bearing_y; // Baseline to top edge of the bitmap, positive upwards
  std::int32_t advance_x;
};

struct RenderedGlyph {
  std::vector<std::uint8_t> coverage; // width * height, no padding
  GlyphMetrics metrics;
};

// A loaded font face at a fixed pixel size. Copies share the face.
class Font {
public:
  Font() = default;

  auto metrics() const -> FontMetrics;

  // 0 if the font has no glyph for the code point.
  auto get_glyph_index(char32_t codepoint) const -> std::uint32_t;

  // Grayscale rasterization. Empty coverage for glyphs without ink, e.g. spaces.
  auto render_glyph(std::uint32_t glyphIndex) const -> RenderedGlyph;

  // Kerning adjustment between two glyphs in pixels.
  auto get_kerning(std::uint32_t leftGlyph, std::uint32_t rightGlyph) const -> std::int32_t;

  auto is_valid() const -> bool;

  // File the face was loaded from.
  auto path() const -> std::filesystem::path const&;

  // Identifies the underlying face; equal for copies of the same Font and never reused for
  // another face. 0 for an invalid Font.
  auto id() const noexcept -> std::uint64_t;

private:
  explicit Font(std::shared_ptr<FontImpl> impl);
  friend class FontManager;
  std::shared_ptr<FontImpl> mImpl;
};

} // namespace sig
