// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "PixelsView.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace sig {

// Decodes any PNG color type to straight-alpha RGBA8. Throws RenderError on failure.
auto decode_png(std::span<std::uint8_t const> bytes) -> Canvas;

// RGBA8 PNG without time stamps or other varying chunks. Throws RenderError on failure.
auto encode_png(Canvas const& canvas) -> std::vector<std::uint8_t>;

// Width and height from the PNG header, without decoding the pixels.
auto read_png_size(std::span<std::uint8_t const> bytes) -> Extents;

} // namespace sig
