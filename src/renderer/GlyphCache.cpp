// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "GlyphCache.hpp"

#include <functional>
#include <unordered_map>

namespace sig {

namespace {

struct GlyphKey {
  std::uint64_t face;
  std::uint32_t glyph;

  auto operator==(GlyphKey const&) const -> bool = default;
};

struct GlyphKeyHash {
  auto operator()(GlyphKey const& key) const noexcept -> std::size_t {
    std::size_t seed = std::hash<std::uint64_t>{}(key.face);
    seed ^= std::hash<std::uint32_t>{}(key.glyph) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};

} // namespace

struct GlyphCacheImpl {
  // Node-based, so spans into cached bitmaps survive rehashing.
  std::unordered_map<GlyphKey, RenderedGlyph, GlyphKeyHash> glyphs;
  std::size_t bitmapBytes = 0;
  std::size_t hits = 0;
  std::size_t misses = 0;

  auto lookup(Font const& font, std::uint32_t glyphIndex) -> RenderedGlyph const& {
    const GlyphKey key{font.id(), glyphIndex};
    if (auto it = glyphs.find(key); it != glyphs.end()) {
      ++hits;
      return it->second;
    }
    ++misses;
    RenderedGlyph glyph = font.render_glyph(glyphIndex);
    bitmapBytes += glyph.coverage.size();
    return glyphs.emplace(key, std::move(glyph)).first->second;
  }
};

GlyphCache::GlyphCache() : mImpl(std::make_unique<GlyphCacheImpl>()) {}

GlyphCache::GlyphCache(GlyphCache&&) noexcept = default;
auto GlyphCache::operator=(GlyphCache&&) noexcept -> GlyphCache& = default;
GlyphCache::~GlyphCache() = default;

auto GlyphCache::get(Font const& font, std::uint32_t glyphIndex) -> CachedGlyph {
  RenderedGlyph const& glyph = mImpl->lookup(font, glyphIndex);
  return CachedGlyph{.bitmap = glyph.coverage, .metrics = glyph.metrics};
}

auto GlyphCache::advance(Font const& font, std::uint32_t glyphIndex) -> std::int32_t {
  return mImpl->lookup(font, glyphIndex).metrics.advance_x;
}

auto GlyphCache::clear() -> void {
  mImpl->glyphs.clear();
  mImpl->bitmapBytes = 0;
  mImpl->hits = 0;
  mImpl->misses = 0;
}

auto GlyphCache::stats() const -> GlyphCacheStats {
  return GlyphCacheStats{.glyphs = mImpl->glyphs.size(),
                         .bitmap_bytes = mImpl->bitmapBytes,
                         .hits = mImpl->hits,
                         .misses = mImpl->misses};
}

} // namespace sig
