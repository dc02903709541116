// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Compositor.hpp"
#include "Errors.hpp"
#include "ImageResampler.hpp"
#include "PngCodec.hpp"
#include "Rasterizer.hpp"

namespace sig {

Compositor::Compositor(SignatureConfig const& config, FontSet const& fonts,
                       TextRenderer& textRenderer)
    : mConfig(&config), mFonts(&fonts), mTextRenderer(&textRenderer) {}

auto Compositor::draw_line(PixelsView buffer, TextLine const& line) const -> void {
  mTextRenderer->draw_halo_text(buffer, mFonts->for_role(line.role), line.text, line.position,
                                mConfig->colors.for_role(line.role), mConfig->colors.outline,
                                mConfig->outline_width(line.role));
}

auto Compositor::paint(LayoutResult const& layout, Canvas const* logo) const -> Canvas {
  if (layout.logo.has_value() != (logo != nullptr)) {
    throw RenderError("compose", "logo image does not match the layout");
  }

  Canvas canvas(layout.canvas.width, layout.canvas.height, colors::TRANSPARENT);
  PixelsView buffer = canvas.view();

  if (logo) {
    Canvas resized = resize_lanczos(*logo, layout.logo->size);
    Rasterizer::draw_image(buffer, layout.logo->position, resized);
  }

  for (TextLine const& line : layout.lines) {
    draw_line(buffer, line);
  }

  Rasterizer::fill_rectangle(buffer, layout.separator, mConfig->colors.separator);
  draw_line(buffer, layout.confidentiality);
  return canvas;
}

auto Compositor::render(LayoutResult const& layout, Canvas const* logo) const
    -> std::vector<std::uint8_t> {
  return encode_png(paint(layout, logo));
}

} // namespace sig
