// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Font.hpp"
#include "FontManager.hpp"
#include "SignatureConfig.hpp"

#include <string_view>

namespace sig {

// Loads the font for `role` at the configured size.
//
// Tries every candidate configured for `platform` in order. A candidate path that does not
// exist is looked up by file name in the font directories. When no candidate loads, the
// configured fallback family is searched. Missing or broken candidates are logged, never
// raised; RenderError is thrown only when the fallback cannot be loaded either.
auto resolve_font(FontManager& manager, TextRole role, SignatureConfig const& config,
                  std::string_view platform = current_platform()) -> Font;

// The three fonts one signature needs.
struct FontSet {
  Font name;
  Font details;
  Font confidentiality;

  auto for_role(TextRole role) const -> Font const&;
};

auto resolve_fonts(FontManager& manager, SignatureConfig const& config,
                   std::string_view platform = current_platform()) -> FontSet;

} // namespace sig
