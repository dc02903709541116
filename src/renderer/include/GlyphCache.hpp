// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Font.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace sig {

struct CachedGlyph {
  std::span<std::uint8_t const> bitmap; // Grayscale coverage, metrics.width per row
  GlyphMetrics metrics;
};

struct GlyphCacheStats {
  std::size_t glyphs;
  std::size_t bitmap_bytes;
  std::size_t hits;
  std::size_t misses;
};

// Rasterized glyphs per font face and glyph index.
//
// A halo line draws the same string up to (2w + 1)^2 times, and measuring a line touches the
// same glyphs again, so every glyph is rasterized once and then served from here. Measuring
// and drawing both read advances from the cached glyph and therefore agree exactly.
class GlyphCache {
public:
  GlyphCache();
  GlyphCache(GlyphCache&&) noexcept;
  auto operator=(GlyphCache&&) noexcept -> GlyphCache&;
  ~GlyphCache();

  // The returned bitmap stays valid until clear() or destruction.
  // Throws RenderError if the glyph cannot be rasterized.
  auto get(Font const& font, std::uint32_t glyphIndex) -> CachedGlyph;

  auto advance(Font const& font, std::uint32_t glyphIndex) -> std::int32_t;

  auto clear() -> void;

  auto stats() const -> GlyphCacheStats;

private:
  std::unique_ptr<struct GlyphCacheImpl> mImpl;
};

} // namespace sig
