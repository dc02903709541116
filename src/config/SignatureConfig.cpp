// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "SignatureConfig.hpp"
#include "Errors.hpp"

#include <string>

namespace sig {

auto to_string(TextRole role) -> std::string_view {
  switch (role) {
  case TextRole::Name:
    return "name";
  case TextRole::Details:
    return "details";
  case TextRole::Confidentiality:
    return "confidentiality";
  }
  return "unknown";
}

auto ColorScheme::for_role(TextRole role) const -> Color {
  switch (role) {
  case TextRole::Name:
    return name;
  case TextRole::Details:
    return details;
  case TextRole::Confidentiality:
    return confidentiality;
  }
  return details;
}

auto FontSizes::for_role(TextRole role) const -> int {
  switch (role) {
  case TextRole::Name:
    return name;
  case TextRole::Details:
    return details;
  case TextRole::Confidentiality:
    return confidentiality;
  }
  return details;
}

auto RoleFontPaths::for_role(TextRole role) const -> std::vector<std::string> const& {
  switch (role) {
  case TextRole::Name:
    return name;
  case TextRole::Details:
    return details;
  case TextRole::Confidentiality:
    return confidentiality;
  }
  return details;
}

auto current_platform() -> std::string_view {
#if defined(_WIN32)
  return "windows";
#elif defined(__APPLE__)
  return "darwin";
#else
  return "linux";
#endif
}

auto SignatureConfig::default_fonts() -> std::map<std::string, RoleFontPaths> {
  std::map<std::string, RoleFontPaths> fonts;
  fonts["linux"] = RoleFontPaths{
      .name = {"/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
               "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
               "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf"},
      .details = {"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
                  "/usr/share/fonts/TTF/DejaVuSans.ttf",
                  "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf"},
      .confidentiality = {"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
                          "/usr/share/fonts/TTF/DejaVuSans.ttf",
                          "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf"}};
  fonts["windows"] = RoleFontPaths{.name = {"C:\\Windows\\Fonts\\arialbd.ttf"},
                                   .details = {"C:\\Windows\\Fonts\\arial.ttf"},
                                   .confidentiality = {"C:\\Windows\\Fonts\\arial.ttf"}};
  fonts["darwin"] = RoleFontPaths{.name = {"/System/Library/Fonts/Helvetica.ttc"},
                                  .details = {"/System/Library/Fonts/Helvetica.ttc"},
                                  .confidentiality = {"/System/Library/Fonts/Helvetica.ttc"}};
  return fonts;
}

auto SignatureConfig::outline_width(TextRole role) const -> int {
  return role == TextRole::Name ? outline_width_name : outline_width_text;
}

auto SignatureConfig::font_candidates(TextRole role, std::string_view platform) const
    -> std::vector<std::string> {
  auto it = fonts.find(std::string(platform));
  if (it == fonts.end()) {
    return {};
  }
  return it->second.for_role(role);
}

auto SignatureConfig::validate() const -> void {
  auto require_range = [](std::string_view key, int value, int low, int high) {
    if (value < low || value > high) {
      throw ConfigError(key, "must be between " + std::to_string(low) + " and " +
                                 std::to_string(high) + ", got " + std::to_string(value));
    }
  };

  require_range("signature.dimensions.logo_height", logo_height, 1, MaxDimension);
  require_range("signature.dimensions.margin", margin, 1, MaxDimension);
  require_range("signature.dimensions.logo_margin_right", logo_margin_right, 1, MaxDimension);
  require_range("signature.dimensions.line_height", line_height, 1, MaxDimension);
  require_range("signature.dimensions.separator_thickness", separator_thickness, 1, MaxDimension);
  require_range("signature.outline.name_width", outline_width_name, 0, MaxOutlineWidth);
  require_range("signature.outline.text_width", outline_width_text, 0, MaxOutlineWidth);
  require_range("signature.font_sizes.name", font_sizes.name, 1, MaxFontSize);
  require_range("signature.font_sizes.details", font_sizes.details, 1, MaxFontSize);
  require_range("signature.font_sizes.confidentiality", font_sizes.confidentiality, 1,
                MaxFontSize);

  if (separator_thickness > line_height) {
    throw ConfigError("signature.dimensions.separator_thickness",
                      "must not exceed line_height");
  }
}

} // namespace sig
