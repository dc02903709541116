// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "SignatureGenerator.hpp"
#include "Compositor.hpp"
#include "Errors.hpp"
#include "FontResolver.hpp"
#include "GlyphCache.hpp"
#include "Logging.hpp"
#include "LogoImage.hpp"
#include "PngCodec.hpp"
#include "TextRenderer.hpp"
#include "Validators.hpp"

namespace sig {

auto find_logo(SignatureConfig const& config, std::filesystem::path const& baseDirectory)
    -> std::optional<std::filesystem::path> {
  for (std::string const& entry : config.logo_search_paths) {
    std::filesystem::path candidate(entry);
    if (candidate.is_relative()) {
      candidate = baseDirectory / candidate;
    }
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) && is_supported_image_extension(candidate)) {
      Log::d("Using logo {}", candidate.string());
      return candidate;
    }
  }
  return std::nullopt;
}

struct SignatureGeneratorImpl {
  SignatureConfig config;
  FontManager fontManager;
  GlyphCache glyphCache;
  TextRenderer textRenderer{glyphCache};
  std::optional<FontSet> fonts;

  SignatureGeneratorImpl(SignatureConfig config, FontManager fontManager)
      : config(std::move(config)), fontManager(std::move(fontManager)) {}

  auto font_set() -> FontSet const& {
    if (!fonts) {
      fonts = resolve_fonts(fontManager, config);
    }
    return *fonts;
  }

  auto load_logo(SignatureData const& data) -> std::optional<Canvas> {
    if (!data.logo_path()) {
      return std::nullopt;
    }
    return read_image_file(*data.logo_path());
  }
};

SignatureGenerator::SignatureGenerator(SignatureConfig config)
    : SignatureGenerator(std::move(config), FontManager()) {}

SignatureGenerator::SignatureGenerator(SignatureConfig config, FontManager fontManager)
    : mImpl(std::make_unique<SignatureGeneratorImpl>(std::move(config), std::move(fontManager))) {
  mImpl->config.validate();
}

SignatureGenerator::SignatureGenerator(SignatureGenerator&&) noexcept = default;
auto SignatureGenerator::operator=(SignatureGenerator&&) noexcept -> SignatureGenerator& = default;
SignatureGenerator::~SignatureGenerator() = default;

auto SignatureGenerator::config() const noexcept -> SignatureConfig const& {
  return mImpl->config;
}

auto SignatureGenerator::layout(SignatureData const& data) -> LayoutResult {
  std::optional<Extents> logoSize;
  if (data.logo_path()) {
    logoSize = read_image_size(*data.logo_path());
  }
  return compute_layout(data, mImpl->config, logoSize, mImpl->font_set(), mImpl->textRenderer);
}

auto SignatureGenerator::render_canvas(SignatureData const& data) -> Canvas {
  std::optional<Canvas> logo = mImpl->load_logo(data);
  std::optional<Extents> logoSize;
  if (logo) {
    logoSize = logo->extents();
  }
  FontSet const& fonts = mImpl->font_set();
  LayoutResult layout = compute_layout(data, mImpl->config, logoSize, fonts, mImpl->textRenderer);
  Compositor compositor(mImpl->config, fonts, mImpl->textRenderer);
  return compositor.paint(layout, logo ? &*logo : nullptr);
}

auto SignatureGenerator::generate(SignatureData const& data) -> std::vector<std::uint8_t> {
  Canvas canvas = render_canvas(data);
  std::vector<std::uint8_t> png = encode_png(canvas);
  Log::i("Rendered signature for {}: {}x{} px, {} bytes", data.name(), canvas.width(),
         canvas.height(), png.size());
  const GlyphCacheStats stats = mImpl->glyphCache.stats();
  Log::d("Glyph cache: {} glyphs, {} bytes, {} hits, {} misses", stats.glyphs,
         stats.bitmap_bytes, stats.hits, stats.misses);
  return png;
}

auto generate(SignatureData const& data, SignatureConfig const& config)
    -> std::vector<std::uint8_t> {
  SignatureGenerator generator(config);
  return generator.generate(data);
}

} // namespace sig
