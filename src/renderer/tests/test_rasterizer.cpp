// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Rasterizer.hpp"

#include <array>
#include <cassert>
#include <stdexcept>

void test_blend_over_transparent_keeps_source_color() {
  sig::Color dest = sig::colors::TRANSPARENT;
  sig::Rasterizer::blend_pixel(dest, sig::Color{200, 0, 40, 200});
  assert(dest == (sig::Color{200, 0, 40, 200}));

  dest = sig::colors::TRANSPARENT;
  sig::Rasterizer::blend_pixel(dest, sig::Color{10, 20, 30}, 128);
  assert(dest == (sig::Color{10, 20, 30, 128}));
}

void test_blend_opaque_source_replaces_destination() {
  sig::Color dest{1, 2, 3, 77};
  sig::Rasterizer::blend_pixel(dest, sig::Color{51, 51, 51});
  assert(dest == (sig::Color{51, 51, 51, 255}));
}

void test_blend_partial_over_opaque_mixes_and_stays_opaque() {
  sig::Color dest = sig::colors::WHITE;
  sig::Rasterizer::blend_pixel(dest, sig::colors::BLACK, 128);
  assert(dest.a == 255);
  assert(dest.r == 127 && dest.g == 127 && dest.b == 127);

  sig::Color untouched{9, 9, 9, 9};
  sig::Rasterizer::blend_pixel(untouched, sig::colors::BLACK, 0);
  assert(untouched == (sig::Color{9, 9, 9, 9}));
}

void test_fill_rectangle_clips_to_view() {
  sig::Canvas canvas(4, 3);
  sig::Rasterizer::fill_rectangle(canvas.view(), sig::Region{{2, 1}, {5, 5}}, sig::colors::WHITE);
  for (std::size_t y = 0; y < 3; ++y) {
    for (std::size_t x = 0; x < 4; ++x) {
      const bool inside = x >= 2 && y >= 1;
      assert(canvas.at(x, y) == (inside ? sig::colors::WHITE : sig::colors::TRANSPARENT));
    }
  }
  sig::Rasterizer::fill_rectangle(canvas.view(), sig::Region{{-3, -3}, {2, 2}}, sig::colors::BLACK);
  assert(canvas.at(0, 0) == sig::colors::TRANSPARENT);
}

void test_draw_mask_scales_alpha_by_coverage() {
  sig::Canvas canvas(3, 1);
  const std::array<std::uint8_t, 2> coverage{255, 51};
  sig::Rasterizer::draw_mask(canvas.view(), sig::Position{1, 0},
                             sig::CoverageMask{.coverage = coverage, .width = 2, .height = 1},
                             sig::Color{100, 100, 100});
  assert(canvas.at(0, 0) == sig::colors::TRANSPARENT);
  assert(canvas.at(1, 0) == (sig::Color{100, 100, 100, 255}));
  assert(canvas.at(2, 0) == (sig::Color{100, 100, 100, 51}));
}

void test_draw_image_preserves_image_alpha() {
  sig::Canvas image(2, 1);
  image.view()[0, 0] = sig::Color{10, 20, 30, 0};
  image.view()[1, 0] = sig::Color{10, 20, 30, 90};

  sig::Canvas canvas(4, 4);
  sig::Rasterizer::draw_image(canvas.view(), sig::Position{2, 3}, image);
  assert(canvas.at(2, 3) == sig::colors::TRANSPARENT);
  assert(canvas.at(3, 3) == (sig::Color{10, 20, 30, 90}));
}

void test_subview_offsets_and_bounds() {
  sig::Canvas canvas(5, 5);
  sig::PixelsView sub = canvas.view().subview(sig::Position{1, 2}, sig::Extents{3, 2});
  assert(sub.width() == 3 && sub.height() == 2 && sub.row_stride() == 5);
  sub[2, 1] = sig::colors::WHITE;
  assert(canvas.at(3, 3) == sig::colors::WHITE);

  bool threw = false;
  try {
    canvas.view().subview(sig::Position{4, 4}, sig::Extents{2, 1});
  } catch (std::out_of_range const&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_blend_over_transparent_keeps_source_color();
  test_blend_opaque_source_replaces_destination();
  test_blend_partial_over_opaque_mixes_and_stays_opaque();
  test_fill_rectangle_clips_to_view();
  test_draw_mask_scales_alpha_by_coverage();
  test_draw_image_preserves_image_alpha();
  test_subview_offsets_and_bounds();
}
