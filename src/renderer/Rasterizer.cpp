// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Rasterizer.hpp"

#include <algorithm>

namespace sig {

namespace {

// Rounded a * b / 255 for a, b in [0, 255].
constexpr auto mul_div_255(std::uint32_t a, std::uint32_t b) noexcept -> std::uint32_t {
  std::uint32_t t = a * b + 128;
  return (t + (t >> 8)) >> 8;
}

auto clip(PixelsView buffer, Position origin, std::uint32_t width, std::uint32_t height,
          std::int32_t& x0, std::int32_t& y0, std::int32_t& x1, std::int32_t& y1) -> bool {
  x0 = std::max(origin.x, 0);
  y0 = std::max(origin.y, 0);
  x1 = std::min<std::int64_t>(std::int64_t{origin.x} + width,
                              static_cast<std::int64_t>(buffer.width()));
  y1 = std::min<std::int64_t>(std::int64_t{origin.y} + height,
                              static_cast<std::int64_t>(buffer.height()));
  return x0 < x1 && y0 < y1;
}

} // namespace

void Rasterizer::blend_pixel(Color& dest, Color color, std::uint8_t coverage) noexcept {
  const std::uint32_t sa = mul_div_255(coverage, color.a);
  if (sa == 0) {
    return;
  }
  if (sa == 255) {
    dest = Color{color.r, color.g, color.b, 255};
    return;
  }
  const std::uint32_t da = mul_div_255(dest.a, 255 - sa);
  const std::uint32_t outA = sa + da;
  // Channel weights are scaled by 255, the divisor is outA * 255.
  const std::uint32_t sw = sa * 255;
  const std::uint32_t dw = dest.a * (255 - sa);
  const std::uint32_t divisor = sw + dw;
  auto mix = [&](std::uint8_t s, std::uint8_t d) {
    return static_cast<std::uint8_t>((s * sw + d * dw + divisor / 2) / divisor);
  };
  dest = Color{mix(color.r, dest.r), mix(color.g, dest.g), mix(color.b, dest.b),
               static_cast<std::uint8_t>(outA)};
}

void Rasterizer::fill_rectangle(PixelsView buffer, Region region, Color color) {
  std::int32_t x0, y0, x1, y1;
  if (!clip(buffer, region.position, static_cast<std::uint32_t>(region.size.width),
            static_cast<std::uint32_t>(region.size.height), x0, y0, x1, y1)) {
    return;
  }
  for (std::int32_t y = y0; y < y1; ++y) {
    for (std::int32_t x = x0; x < x1; ++x) {
      blend_pixel(buffer[x, y], color);
    }
  }
}

void Rasterizer::draw_mask(PixelsView buffer, Position origin, CoverageMask mask, Color color) {
  std::int32_t x0, y0, x1, y1;
  if (!clip(buffer, origin, mask.width, mask.height, x0, y0, x1, y1)) {
    return;
  }
  for (std::int32_t y = y0; y < y1; ++y) {
    const std::size_t row = static_cast<std::size_t>(y - origin.y) * mask.width;
    for (std::int32_t x = x0; x < x1; ++x) {
      const std::uint8_t coverage = mask.coverage[row + static_cast<std::size_t>(x - origin.x)];
      if (coverage != 0) {
        blend_pixel(buffer[x, y], color, coverage);
      }
    }
  }
}

void Rasterizer::draw_image(PixelsView buffer, Position origin, Canvas const& image) {
  std::int32_t x0, y0, x1, y1;
  if (!clip(buffer, origin, static_cast<std::uint32_t>(image.width()),
            static_cast<std::uint32_t>(image.height()), x0, y0, x1, y1)) {
    return;
  }
  for (std::int32_t y = y0; y < y1; ++y) {
    for (std::int32_t x = x0; x < x1; ++x) {
      blend_pixel(buffer[x, y], image.at(x - origin.x, y - origin.y));
    }
  }
}

} // namespace sig
