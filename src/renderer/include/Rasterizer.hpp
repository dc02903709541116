// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "PixelsView.hpp"

#include <cstdint>
#include <span>

namespace sig {

// 8-bit coverage mask, e.g. a rasterized glyph.
struct CoverageMask {
  std::span<std::uint8_t const> coverage;
  std::uint32_t width;
  std::uint32_t height;
};

/**
 * Compositing primitives on straight-alpha RGBA views.
 *
 * Everything blends with Porter-Duff "over" in integer arithmetic, so identical inputs give
 * identical pixels. Coordinates outside the view are clipped.
 */
class Rasterizer {
public:
  /**
   * Composite `color`, scaled by `coverage`, over `dest`.
   *
   * Source alpha is coverage * color.a / 255. The result alpha is sa + da * (1 - sa), and
   * each channel is the alpha-weighted mix of source and destination.
   */
  static void blend_pixel(Color& dest, Color color, std::uint8_t coverage = 255) noexcept;

  static void fill_rectangle(PixelsView buffer, Region region, Color color);

  // Blends `mask` with its top-left corner at `origin`.
  static void draw_mask(PixelsView buffer, Position origin, CoverageMask mask, Color color);

  // Blends every pixel of `image` over the buffer with the image's top-left at `origin`.
  static void draw_image(PixelsView buffer, Position origin, Canvas const& image);
};

} // namespace sig
