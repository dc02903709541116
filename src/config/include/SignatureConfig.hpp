// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Color.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sig {

// Typographic role of a piece of text. Selects font, size, color and outline width.
enum class TextRole { Name, Details, Confidentiality };

auto to_string(TextRole role) -> std::string_view;

struct ColorScheme {
  Color outline{255, 255, 255};
  Color name{51, 51, 51};
  Color details{100, 100, 100};
  Color separator{200, 0, 40, 200};
  Color confidentiality{150, 150, 150};

  auto for_role(TextRole role) const -> Color;

  bool operator==(const ColorScheme&) const = default;
};

struct FontSizes {
  int name = 16;
  int details = 14;
  int confidentiality = 9;

  auto for_role(TextRole role) const -> int;

  bool operator==(const FontSizes&) const = default;
};

// Candidate font files per role, tried in order.
struct RoleFontPaths {
  std::vector<std::string> name;
  std::vector<std::string> details;
  std::vector<std::string> confidentiality;

  auto for_role(TextRole role) const -> std::vector<std::string> const&;

  bool operator==(const RoleFontPaths&) const = default;
};

// "linux", "windows" or "darwin", fixed at compile time.
auto current_platform() -> std::string_view;

// Rendering configuration. Built once from defaults, an optional YAML document and
// environment overrides, then passed by const reference to layout and compositing.
struct SignatureConfig {
  // Upper bounds accepted by validate().
  static constexpr int MaxDimension = 4096;
  static constexpr int MaxFontSize = 512;
  static constexpr int MaxOutlineWidth = 16;

  // Dimensions in pixels.
  int logo_height = 70;
  int margin = 15;
  int logo_margin_right = 20;
  int line_height = 22;
  int separator_thickness = 2;

  // Halo radius in pixels; 0 disables the outline.
  int outline_width_name = 2;
  int outline_width_text = 1;

  ColorScheme colors;
  FontSizes font_sizes;

  // Keyed by platform name.
  std::map<std::string, RoleFontPaths> fonts = default_fonts();
  std::string fallback_font_family = "DejaVu Sans";

  std::vector<std::string> logo_search_paths = {"logo.png", "logo.jpg", "./logo/logo.png",
                                                "./logo/logo.jpg"};

  std::string confidentiality_text =
      "CONFIDENTIALITY: This message is intended solely for the use of the addressee and may "
      "contain confidential information.";
  std::string default_website = "www.example.com";
  std::string phone_prefix = "Tel: ";
  std::string mobile_prefix = "Mob: ";

  auto outline_width(TextRole role) const -> int;

  // Candidates for the role on `platform`; empty if the platform has no entry.
  auto font_candidates(TextRole role, std::string_view platform = current_platform()) const
      -> std::vector<std::string>;

  // Throws ConfigError naming the first value that breaks an invariant.
  auto validate() const -> void;

  static auto default_fonts() -> std::map<std::string, RoleFontPaths>;

  bool operator==(const SignatureConfig&) const = default;
};

} // namespace sig
