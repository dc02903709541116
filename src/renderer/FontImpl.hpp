// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <ft2build.h>
#include FT_FREETYPE_H

#include <cstdint>
#include <filesystem>
#include <memory>

namespace sig {

// Keeps the FreeType library alive for as long as any face created from it.
struct FreeTypeLibrary {
  FT_Library library = nullptr;

  FreeTypeLibrary();
  FreeTypeLibrary(FreeTypeLibrary const&) = delete;
  auto operator=(FreeTypeLibrary const&) -> FreeTypeLibrary& = delete;
  ~FreeTypeLibrary();
};

// Process-wide, never reused: a face loaded after another was freed gets a new serial even if
// it lands at the same address.
auto next_font_serial() noexcept -> std::uint64_t;

struct FontImpl {
  std::shared_ptr<FreeTypeLibrary> library;
  FT_Face face = nullptr;
  std::filesystem::path path;
  std::uint64_t serial = next_font_serial();

  FontImpl(std::shared_ptr<FreeTypeLibrary> library, FT_Face face, std::filesystem::path path)
      : library(std::move(library)), face(face), path(std::move(path)) {}
  FontImpl(FontImpl const&) = delete;
  auto operator=(FontImpl const&) -> FontImpl& = delete;
  ~FontImpl();
};

} // namespace sig
