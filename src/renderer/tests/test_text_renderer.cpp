// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Errors.hpp"
#include "FontResolver.hpp"
#include "GlyphCache.hpp"
#include "TextRenderer.hpp"

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <filesystem>

namespace {

constexpr int Skipped = 77;

} // namespace

void test_decode_utf8() {
  assert(sig::decode_utf8("Ab") == U"Ab");
  assert(sig::decode_utf8("M\xC3\xBCller") == U"Müller");
  assert(sig::decode_utf8("\xE2\x82\xAC") == U"€");
  assert(sig::decode_utf8("\xF0\x9F\x98\x80") == U"\U0001F600");
  assert(sig::decode_utf8("a\xFFz") == U"a�z");
  assert(sig::decode_utf8("\xC0\xAF") == U"�");
  assert(sig::decode_utf8("\xE2\x82") == U"�");
}

void test_measure_grows_with_text(sig::Font const& font, sig::TextRenderer const& renderer) {
  sig::Extents empty = renderer.measure_text(font, "");
  sig::Extents one = renderer.measure_text(font, "John");
  sig::Extents two = renderer.measure_text(font, "John Doe");
  assert(empty.width == 0);
  assert(one.width > 0 && two.width > one.width);
  assert(two.height == static_cast<std::size_t>(font.metrics().line_height));
}

void test_draw_text_stays_inside_line_box(sig::Font const& font, sig::TextRenderer& renderer) {
  sig::Extents size = renderer.measure_text(font, "Software Engineer");
  sig::Canvas canvas(size.width + 40, size.height + 40);
  renderer.draw_text(canvas.view(), font, "Software Engineer", sig::Position{20, 20},
                     sig::Color{100, 100, 100});

  std::size_t inked = 0;
  for (std::size_t y = 0; y < canvas.height(); ++y) {
    for (std::size_t x = 0; x < canvas.width(); ++x) {
      if (canvas.at(x, y).a == 0) {
        continue;
      }
      ++inked;
      assert(x >= 18 && x < 22 + size.width);
      assert(y >= 18 && y < 22 + size.height);
    }
  }
  assert(inked > 0);
}

void test_halo_surrounds_fill(sig::Font const& font, sig::TextRenderer& renderer) {
  const sig::Color fill{51, 51, 51};
  const sig::Color outline{255, 255, 255};
  const char* text = "John Doe";

  sig::Extents size = renderer.measure_text(font, text);
  sig::Canvas fillOnly(size.width + 20, size.height + 20);
  sig::Canvas halo(size.width + 20, size.height + 20);
  renderer.draw_text(fillOnly.view(), font, text, sig::Position{10, 10}, fill);
  renderer.draw_halo_text(halo.view(), font, text, sig::Position{10, 10}, fill, outline, 1);

  std::size_t solid = 0;
  for (std::size_t y = 1; y + 1 < fillOnly.height(); ++y) {
    for (std::size_t x = 1; x + 1 < fillOnly.width(); ++x) {
      if (fillOnly.at(x, y).a != 255) {
        continue;
      }
      ++solid;
      for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
          assert(halo.at(x + dx, y + dy).a == 255);
        }
      }
    }
  }
  assert(solid > 0);
}

void test_zero_width_halo_is_plain_text(sig::Font const& font, sig::TextRenderer& renderer) {
  sig::Canvas plain(120, 40);
  sig::Canvas halo(120, 40);
  renderer.draw_text(plain.view(), font, "Tel: 555", sig::Position{2, 2}, sig::Color{1, 2, 3});
  renderer.draw_halo_text(halo.view(), font, "Tel: 555", sig::Position{2, 2}, sig::Color{1, 2, 3},
                          sig::colors::WHITE, 0);
  assert(plain == halo);
}

void test_reloaded_font_gets_fresh_cache_entries(sig::FontManager& manager,
                                                 std::filesystem::path const& path) {
  sig::GlyphCache cache;
  std::uint64_t firstId = 0;
  std::uint32_t glyph = 0;
  {
    sig::Font first = manager.load_font_file(path, 12);
    sig::Font copy = first;
    assert(copy.id() == first.id() && first.id() != 0);
    firstId = first.id();
    glyph = first.get_glyph_index('A');
    cache.get(first, glyph);
  }
  // The old face is gone, so the allocator may hand its address to the next one. The larger
  // size must still be rasterized instead of served from the 12 px entry.
  sig::Font second = manager.load_font_file(path, 40);
  assert(second.id() != firstId);
  sig::CachedGlyph big = cache.get(second, glyph);
  assert(cache.stats().misses == 2);
  assert(cache.stats().hits == 0);
  assert(big.metrics.height > 12);
  assert(sig::Font{}.id() == 0);
}

int main() {
  test_decode_utf8();

  sig::FontManager manager;
  sig::Font font;
  try {
    font = sig::resolve_font(manager, sig::TextRole::Name, sig::SignatureConfig{});
  } catch (sig::RenderError const& error) {
    std::fprintf(stderr, "skipping: %s\n", error.what());
    return Skipped;
  }

  sig::GlyphCache cache;
  sig::TextRenderer renderer(cache);
  test_measure_grows_with_text(font, renderer);
  test_draw_text_stays_inside_line_box(font, renderer);
  test_halo_surrounds_fill(font, renderer);
  test_zero_width_halo_is_plain_text(font, renderer);
  test_reloaded_font_gets_fresh_cache_entries(manager, font.path());
  const sig::GlyphCacheStats stats = cache.stats();
  assert(stats.glyphs > 0);
  assert(stats.misses == stats.glyphs);
  assert(stats.hits > stats.misses);
}
