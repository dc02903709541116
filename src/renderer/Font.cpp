// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Font.hpp"
#include "FontImpl.hpp"
#include "Errors.hpp"

#include <atomic>
#include <cstring>
#include <string>

namespace sig {

auto next_font_serial() noexcept -> std::uint64_t {
  static std::atomic<std::uint64_t> counter{1};
  return counter.fetch_add(1, std::memory_order_relaxed);
}

FontImpl::~FontImpl() {
  if (face) {
    FT_Done_Face(face);
  }
}

Font::Font(std::shared_ptr<FontImpl> impl) : mImpl(std::move(impl)) {}

auto Font::metrics() const -> FontMetrics {
  if (!is_valid()) {
    return {};
  }

  FT_Face face = mImpl->face;
  return FontMetrics{.ascent = static_cast<std::int32_t>(face->size->metrics.ascender >> 6),
                     .descent = static_cast<std::int32_t>(face->size->metrics.descender >> 6),
                     .line_height = static_cast<std::int32_t>(face->size->metrics.height >> 6),
                     .size_px = static_cast<std::uint32_t>(face->size->metrics.y_ppem)};
}

auto Font::get_glyph_index(char32_t codepoint) const -> std::uint32_t {
  if (!is_valid()) {
    return 0;
  }
  return FT_Get_Char_Index(mImpl->face, codepoint);
}

auto Font::render_glyph(std::uint32_t glyphIndex) const -> RenderedGlyph {
  if (!is_valid()) {
    throw RenderError("render glyph", "font is not loaded");
  }

  FT_Face face = mImpl->face;
  if (FT_Error error = FT_Load_Glyph(face, glyphIndex, FT_LOAD_DEFAULT)) {
    throw RenderError("render glyph", "FT_Load_Glyph failed with error " + std::to_string(error));
  }
  if (FT_Error error = FT_Render_Glyph(face->glyph, FT_RENDER_MODE_NORMAL)) {
    throw RenderError("render glyph",
                      "FT_Render_Glyph failed with error " + std::to_string(error));
  }

  FT_GlyphSlot slot = face->glyph;
  FT_Bitmap const& bitmap = slot->bitmap;
  RenderedGlyph glyph{
      .coverage = {},
      .metrics = GlyphMetrics{.width = bitmap.width,
                              .height = bitmap.rows,
                              .bearing_x = slot->bitmap_left,
                              .bearing_y = slot->bitmap_top,
                              .advance_x = static_cast<std::int32_t>(slot->advance.x >> 6)}};

  if (bitmap.width == 0 || bitmap.rows == 0 || !bitmap.buffer) {
    glyph.metrics.width = 0;
    glyph.metrics.height = 0;
    return glyph;
  }

  // Rows may be padded and, with a negative pitch, stored bottom-up.
  glyph.coverage.resize(static_cast<std::size_t>(bitmap.width) * bitmap.rows);
  for (unsigned row = 0; row < bitmap.rows; ++row) {
    std::uint8_t const* source =
        bitmap.pitch >= 0 ? bitmap.buffer + static_cast<std::ptrdiff_t>(row) * bitmap.pitch
                          : bitmap.buffer + static_cast<std::ptrdiff_t>(bitmap.rows - 1 - row) *
                                                (-bitmap.pitch);
    std::memcpy(glyph.coverage.data() + static_cast<std::size_t>(row) * bitmap.width, source,
                bitmap.width);
  }
  return glyph;
}

auto Font::get_kerning(std::uint32_t leftGlyph, std::uint32_t rightGlyph) const -> std::int32_t {
  if (!is_valid()) {
    return 0;
  }

  FT_Face face = mImpl->face;
  if (!FT_HAS_KERNING(face)) {
    return 0;
  }

  FT_Vector delta;
  if (FT_Get_Kerning(face, leftGlyph, rightGlyph, FT_KERNING_DEFAULT, &delta)) {
    return 0;
  }

  return static_cast<std::int32_t>(delta.x >> 6);
}

auto Font::is_valid() const -> bool { return mImpl && mImpl->face; }

auto Font::path() const -> std::filesystem::path const& {
  static const std::filesystem::path empty;
  return mImpl ? mImpl->path : empty;
}

auto Font::id() const noexcept -> std::uint64_t { return mImpl ? mImpl->serial : 0; }

} // namespace sig
