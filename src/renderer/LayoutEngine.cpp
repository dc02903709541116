// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "LayoutEngine.hpp"
#include "Errors.hpp"
#include "ImageResampler.hpp"
#include "Logging.hpp"
#include "Validators.hpp"
#include "narrow.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace sig {

namespace {

// Lines of the confidentiality block.
constexpr std::int64_t ConfidentialityLines = 2;

constexpr auto MaxCanvasDimension = static_cast<std::int64_t>(MaxImageDimension);

auto make_line(std::string field, TextRole role, std::string text) -> TextLine {
  return TextLine{.field = std::move(field),
                  .role = role,
                  .text = std::move(text),
                  .position = {0, 0},
                  .size = {0, 0}};
}

} // namespace

auto LayoutResult::find_line(std::string_view field) const -> TextLine const* {
  auto it = std::find_if(lines.begin(), lines.end(),
                         [&](TextLine const& line) { return line.field == field; });
  return it == lines.end() ? nullptr : &*it;
}

auto collect_lines(SignatureData const& data, SignatureConfig const& config)
    -> std::vector<TextLine> {
  std::vector<TextLine> lines;
  auto add = [&](const char* field, TextRole role, std::string_view value,
                 std::string_view prefix = {}) {
    std::string_view trimmed = trim(value);
    if (trimmed.empty()) {
      return;
    }
    std::string text(prefix);
    text += trimmed;
    lines.push_back(make_line(field, role, std::move(text)));
  };

  add("name", TextRole::Name, data.name());
  add("position", TextRole::Details, data.position());
  add("address", TextRole::Details, data.address());
  add("phone", TextRole::Details, data.phone(), config.phone_prefix);
  add("mobile", TextRole::Details, data.mobile(), config.mobile_prefix);
  add("email", TextRole::Details, data.email());
  add("website", TextRole::Details, data.website_or(config.default_website));
  return lines;
}

auto compute_layout(SignatureData const& data, SignatureConfig const& config,
                    std::optional<Extents> logoSize, FontSet const& fonts,
                    TextMeasure const& measure) -> LayoutResult {
  // Geometry is computed in 64 bits and narrowed once the canvas size has been checked.
  const std::int64_t margin = config.margin;
  const std::int64_t lineHeight = config.line_height;

  LayoutResult layout{};
  std::int64_t textX = margin;
  std::int64_t logoHeight = 0;
  std::int64_t logoWidth = 0;
  if (logoSize) {
    if (logoSize->width == 0 || logoSize->height == 0) {
      throw RenderError("compute layout", "logo has an empty size");
    }
    logoHeight = config.logo_height;
    const std::size_t scaled = scaled_width(*logoSize, static_cast<std::size_t>(logoHeight));
    if (scaled > MaxImageDimension) {
      throw RenderError("compute layout", "logo is too wide for its height");
    }
    logoWidth = static_cast<std::int64_t>(scaled);
    textX = margin + logoWidth + config.logo_margin_right;
  }

  layout.lines = collect_lines(data, config);
  const auto lineCount = static_cast<std::int64_t>(layout.lines.size());
  std::int64_t widest = 0;
  std::vector<std::int64_t> tops;
  tops.reserve(layout.lines.size());
  for (TextLine& line : layout.lines) {
    tops.push_back(margin + static_cast<std::int64_t>(tops.size()) * lineHeight);
    line.size = measure.measure_text(fonts.for_role(line.role), line.text);
    widest = std::max(widest, static_cast<std::int64_t>(line.size.width));
  }

  const std::int64_t blockBottom = margin + lineCount * lineHeight;
  const std::int64_t separatorY = blockBottom + lineHeight * 3 / 10;

  layout.confidentiality =
      make_line("confidentiality", TextRole::Confidentiality, config.confidentiality_text);
  layout.confidentiality.size =
      measure.measure_text(fonts.confidentiality, layout.confidentiality.text);

  const std::int64_t textBlockHeight = (lineCount + 1 + ConfidentialityLines) * lineHeight;
  const std::int64_t contentWidth =
      std::max(widest, static_cast<std::int64_t>(layout.confidentiality.size.width));
  const std::int64_t canvasWidth = textX + contentWidth + margin;
  const std::int64_t canvasHeight = 2 * margin + std::max(logoHeight, textBlockHeight);
  if (canvasWidth > MaxCanvasDimension || canvasHeight > MaxCanvasDimension) {
    throw RenderError("compute layout", "signature of " + std::to_string(canvasWidth) + "x" +
                                            std::to_string(canvasHeight) +
                                            " px exceeds the maximum canvas size");
  }

  try {
    const auto x = narrow<std::int32_t>(textX);
    for (std::size_t i = 0; i < layout.lines.size(); ++i) {
      layout.lines[i].position = Position{x, narrow<std::int32_t>(tops[i])};
    }
    if (logoSize) {
      layout.logo = Region{.position = {narrow<std::int32_t>(margin), narrow<std::int32_t>(margin)},
                           .size = {narrow<std::size_t>(logoWidth),
                                    narrow<std::size_t>(logoHeight)}};
    }
    layout.separator = Region{.position = {x, narrow<std::int32_t>(separatorY)},
                              .size = {narrow<std::size_t>(widest),
                                       narrow<std::size_t>(config.separator_thickness)}};
    layout.confidentiality.position = Position{x, narrow<std::int32_t>(blockBottom + lineHeight)};
    layout.canvas = Extents{narrow<std::size_t>(canvasWidth), narrow<std::size_t>(canvasHeight)};
  } catch (NarrowError const& error) {
    throw RenderError("compute layout", error.what());
  }

  Log::d("Layout: {}x{} px, {} lines, logo {}", layout.canvas.width, layout.canvas.height,
         layout.lines.size(), layout.logo ? "yes" : "no");
  return layout;
}

} // namespace sig
