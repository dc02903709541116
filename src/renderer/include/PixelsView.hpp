// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Color.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sig {

// Largest width or height of any image signet decodes or produces.
inline constexpr std::size_t MaxImageDimension = 16384;

struct Position {
  std::int32_t x;
  std::int32_t y;

  auto operator==(Position const&) const -> bool = default;
};

struct Extents {
  std::size_t width;
  std::size_t height;

  auto operator==(Extents const&) const -> bool = default;
};

struct Region {
  Position position;
  Extents size;

  auto operator==(Region const&) const -> bool = default;
};

// Non-owning 2D view of RGBA pixels, row-major with a row stride in pixels.
class PixelsView {
public:
  PixelsView() = default;

  PixelsView(std::span<Color> data, Extents extents) noexcept;

  PixelsView(Color* data, Extents extents, std::size_t rowStride) noexcept;

  auto width() const noexcept -> std::size_t { return mExtents.width; }
  auto height() const noexcept -> std::size_t { return mExtents.height; }
  auto extents() const noexcept -> Extents { return mExtents; }
  auto row_stride() const noexcept -> std::size_t { return mRowStride; }
  auto data() const noexcept -> Color* { return mData; }

  auto contains(std::int32_t x, std::int32_t y) const noexcept -> bool;

  auto subview(Position pos, Extents extents) const -> PixelsView;

  auto operator[](std::size_t x, std::size_t y) const -> Color& {
    return mData[y * mRowStride + x];
  }

private:
  Color* mData = nullptr;
  Extents mExtents{0, 0};
  std::size_t mRowStride = 0;
};

// Owned RGBA raster. Pixels are tightly packed, so bytes() is the RGBA8 byte sequence of the
// image in row order.
class Canvas {
public:
  Canvas() = default;
  Canvas(std::size_t width, std::size_t height, Color fill = colors::TRANSPARENT);

  auto width() const noexcept -> std::size_t { return mExtents.width; }
  auto height() const noexcept -> std::size_t { return mExtents.height; }
  auto extents() const noexcept -> Extents { return mExtents; }

  auto view() noexcept -> PixelsView;

  auto pixels() const noexcept -> std::span<Color const> { return mPixels; }
  auto bytes() const noexcept -> std::span<std::uint8_t const>;
  auto bytes() noexcept -> std::span<std::uint8_t>;

  auto at(std::size_t x, std::size_t y) const -> Color const&;

  auto clear(Color color = colors::TRANSPARENT) -> void;

  auto operator==(Canvas const&) const -> bool = default;

private:
  std::vector<Color> mPixels;
  Extents mExtents{0, 0};
};

static_assert(sizeof(Color) == 4, "Color must be tightly packed RGBA8");

} // namespace sig
