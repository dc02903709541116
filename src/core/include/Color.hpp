// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>

namespace sig {

// Straight (non-premultiplied) RGBA, 8 bits per channel.
struct Color {
  std::uint8_t r, g, b, a;

  constexpr Color() : r(0), g(0), b(0), a(255) {}
  constexpr Color(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a = 255)
      : r(r), g(g), b(b), a(a) {}

  // Packs as 0xRRGGBBAA.
  constexpr std::uint32_t to_rgba() const {
    return (static_cast<std::uint32_t>(r) << 24) | (static_cast<std::uint32_t>(g) << 16) |
           (static_cast<std::uint32_t>(b) << 8) | static_cast<std::uint32_t>(a);
  }

  static constexpr Color from_rgba(std::uint32_t rgba) {
    return Color{static_cast<std::uint8_t>((rgba >> 24) & 0xFF),
                 static_cast<std::uint8_t>((rgba >> 16) & 0xFF),
                 static_cast<std::uint8_t>((rgba >> 8) & 0xFF),
                 static_cast<std::uint8_t>(rgba & 0xFF)};
  }

  bool operator==(const Color& other) const = default;
};

namespace colors {
inline constexpr Color TRANSPARENT{0, 0, 0, 0};
inline constexpr Color BLACK{0, 0, 0};
inline constexpr Color WHITE{255, 255, 255};
} // namespace colors

} // namespace sig
