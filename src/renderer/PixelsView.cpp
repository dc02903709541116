// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "PixelsView.hpp"

#include <algorithm>
#include <stdexcept>

namespace sig {

PixelsView::PixelsView(std::span<Color> data, Extents extents) noexcept
    : mData(data.data()), mExtents(extents), mRowStride(extents.width) {}

PixelsView::PixelsView(Color* data, Extents extents, std::size_t rowStride) noexcept
    : mData(data), mExtents(extents), mRowStride(rowStride) {}

auto PixelsView::contains(std::int32_t x, std::int32_t y) const noexcept -> bool {
  return x >= 0 && y >= 0 && static_cast<std::size_t>(x) < mExtents.width &&
         static_cast<std::size_t>(y) < mExtents.height;
}

auto PixelsView::subview(Position pos, Extents extents) const -> PixelsView {
  if (pos.x < 0 || pos.y < 0 || static_cast<std::size_t>(pos.x) + extents.width > width() ||
      static_cast<std::size_t>(pos.y) + extents.height > height()) {
    throw std::out_of_range("Subview extents exceed parent view bounds");
  }
  Color* data = mData + static_cast<std::size_t>(pos.y) * mRowStride + static_cast<std::size_t>(pos.x);
  return PixelsView{data, extents, mRowStride};
}

Canvas::Canvas(std::size_t width, std::size_t height, Color fill)
    : mPixels(width * height, fill), mExtents{width, height} {}

auto Canvas::view() noexcept -> PixelsView { return PixelsView{mPixels, mExtents}; }

auto Canvas::bytes() const noexcept -> std::span<std::uint8_t const> {
  return {reinterpret_cast<std::uint8_t const*>(mPixels.data()), mPixels.size() * sizeof(Color)};
}

auto Canvas::bytes() noexcept -> std::span<std::uint8_t> {
  return {reinterpret_cast<std::uint8_t*>(mPixels.data()), mPixels.size() * sizeof(Color)};
}

auto Canvas::at(std::size_t x, std::size_t y) const -> Color const& {
  if (x >= width() || y >= height()) {
    throw std::out_of_range("Pixel coordinate outside canvas");
  }
  return mPixels[y * width() + x];
}

auto Canvas::clear(Color color) -> void { std::fill(mPixels.begin(), mPixels.end(), color); }

} // namespace sig
