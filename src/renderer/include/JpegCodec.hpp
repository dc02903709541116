// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "PixelsView.hpp"

#include <cstdint>
#include <span>

namespace sig {

// Decodes a baseline or progressive JPEG (gray, RGB or YCbCr) to opaque RGBA8.
// Throws RenderError on failure.
auto decode_jpeg(std::span<std::uint8_t const> bytes) -> Canvas;

// Width and height from the JPEG frame header, without decoding the pixels.
auto read_jpeg_size(std::span<std::uint8_t const> bytes) -> Extents;

} // namespace sig
