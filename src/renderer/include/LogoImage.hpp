// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "PixelsView.hpp"

#include <cstdint>
#include <filesystem>
#include <span>

namespace sig {

enum class ImageFormat { Png, Jpeg };

// Recognizes the format from the leading signature bytes; the file extension plays no part.
// Throws RenderError for anything else.
auto detect_image_format(std::span<std::uint8_t const> bytes) -> ImageFormat;

auto decode_image(std::span<std::uint8_t const> bytes) -> Canvas;

// Read and decode a logo file. Failures are RenderError("decode logo", "<path>: <reason>").
auto read_image_file(std::filesystem::path const& path) -> Canvas;

auto read_image_size(std::filesystem::path const& path) -> Extents;

} // namespace sig
