// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Font.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace sig {

// Loads font faces through FreeType and searches the font directories.
class FontManager {
public:
  // Searches /usr/share/fonts, /usr/local/share/fonts, ~/.fonts and ~/.local/share/fonts.
  FontManager();
  // Searches only `directories`.
  explicit FontManager(std::vector<std::filesystem::path> directories);
  FontManager(FontManager&&) noexcept;
  auto operator=(FontManager&&) noexcept -> FontManager&;
  ~FontManager();

  // Loads the best match for `family`, see find_font_file.
  // Throws RenderError if no file matches or the file cannot be loaded.
  auto load_font(std::string_view family, std::uint32_t sizePx) -> Font;

  // Throws RenderError if the file cannot be loaded.
  auto load_font_file(std::filesystem::path const& path, std::uint32_t sizePx) -> Font;

  // Prefers a file whose normalized stem equals the normalized family name
  // ("DejaVu Sans" matches DejaVuSans.ttf), then the lexicographically first file whose stem
  // contains it. Case, spaces, '-' and '_' are ignored.
  auto find_font_file(std::string_view family) const -> std::optional<std::filesystem::path>;

  // First file in the font directories, in sorted order, with exactly this file name.
  auto find_in_font_directories(std::string_view fileName) const
      -> std::optional<std::filesystem::path>;

  auto add_font_directory(std::filesystem::path path) -> void;

  auto font_directories() const -> std::vector<std::filesystem::path> const&;

private:
  std::unique_ptr<struct FontManagerImpl> mImpl;
};

} // namespace sig
