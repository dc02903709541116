// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "PixelsView.hpp"

namespace sig {

// Resizes with a separable Lanczos-3 filter. Filtering happens on premultiplied alpha, so
// transparent pixels do not bleed their color into visible ones. Throws RenderError for an
// empty source or target.
auto resize_lanczos(Canvas const& source, Extents target) -> Canvas;

// Width that keeps the aspect ratio of `source` at `height`, rounded and at least 1.
auto scaled_width(Extents source, std::size_t height) -> std::size_t;

} // namespace sig
