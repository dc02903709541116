// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "FontResolver.hpp"
#include "PixelsView.hpp"
#include "SignatureConfig.hpp"
#include "SignatureData.hpp"
#include "TextRenderer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sig {

struct TextLine {
  std::string field; // "name", "position", ..., "confidentiality"
  TextRole role;
  std::string text;
  Position position; // Top-left of the line box
  Extents size;      // Measured advance width and font line height

  auto operator==(TextLine const&) const -> bool = default;
};

// Pixel geometry of one signature.
struct LayoutResult {
  Extents canvas;
  std::optional<Region> logo;
  std::vector<TextLine> lines; // Contact block, top to bottom
  Region separator;
  TextLine confidentiality;

  auto find_line(std::string_view field) const -> TextLine const*;

  auto operator==(LayoutResult const&) const -> bool = default;
};

// The contact lines in drawing order as (field, role, text). Lines whose text is empty after
// trimming are left out; phone and mobile carry their configured prefixes and an empty
// website is replaced by the configured default.
auto collect_lines(SignatureData const& data, SignatureConfig const& config)
    -> std::vector<TextLine>;

/**
 * Computes the canvas size and the placement of every element.
 *
 * With a logo of `logoSize` the logo is scaled to config.logo_height keeping its aspect
 * ratio and placed at (margin, margin); text starts logo_margin_right to its right.
 * Without a logo text starts at the left margin.
 *
 * Line i has its top at margin + i * line_height. The separator is drawn
 * line_height * 3 / 10 below the last line, as wide as the widest contact line. The
 * confidentiality notice starts one line_height below the last line and reserves two lines.
 *
 * Throws RenderError if the logo has an empty size or the canvas would exceed
 * MaxImageDimension in either direction.
 */
auto compute_layout(SignatureData const& data, SignatureConfig const& config,
                    std::optional<Extents> logoSize, FontSet const& fonts,
                    TextMeasure const& measure) -> LayoutResult;

} // namespace sig
