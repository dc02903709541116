// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "FontResolver.hpp"
#include "LayoutEngine.hpp"
#include "PixelsView.hpp"
#include "SignatureConfig.hpp"
#include "TextRenderer.hpp"

#include <cstdint>
#include <vector>

namespace sig {

// Paints a computed layout onto a fresh transparent canvas.
class Compositor {
public:
  Compositor(SignatureConfig const& config, FontSet const& fonts, TextRenderer& textRenderer);

  // `logo` is the decoded source image and must be given exactly when layout.logo is set.
  // It is resized to the logo box.
  auto paint(LayoutResult const& layout, Canvas const* logo) const -> Canvas;

  // paint() followed by PNG encoding.
  auto render(LayoutResult const& layout, Canvas const* logo) const -> std::vector<std::uint8_t>;

private:
  auto draw_line(PixelsView buffer, TextLine const& line) const -> void;

  SignatureConfig const* mConfig;
  FontSet const* mFonts;
  TextRenderer* mTextRenderer;
};

} // namespace sig
