// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "FontManager.hpp"
#include "LayoutEngine.hpp"
#include "PixelsView.hpp"
#include "SignatureConfig.hpp"
#include "SignatureData.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace sig {

// First entry of config.logo_search_paths naming an existing PNG file. Relative entries are
// resolved against `baseDirectory`.
auto find_logo(SignatureConfig const& config,
               std::filesystem::path const& baseDirectory = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Renders signatures for one configuration. Fonts are resolved on first use and reused, as
// are rasterized glyphs.
class SignatureGenerator {
public:
  explicit SignatureGenerator(SignatureConfig config);
  SignatureGenerator(SignatureConfig config, FontManager fontManager);
  SignatureGenerator(SignatureGenerator&&) noexcept;
  auto operator=(SignatureGenerator&&) noexcept -> SignatureGenerator&;
  ~SignatureGenerator();

  auto config() const noexcept -> SignatureConfig const&;

  // Throws RenderError if the logo cannot be read or no font can be resolved.
  auto layout(SignatureData const& data) -> LayoutResult;

  // The painted canvas before encoding.
  auto render_canvas(SignatureData const& data) -> Canvas;

  // PNG bytes. Throws RenderError on any failure; nothing is produced in that case.
  auto generate(SignatureData const& data) -> std::vector<std::uint8_t>;

private:
  std::unique_ptr<struct SignatureGeneratorImpl> mImpl;
};

// One-shot convenience around SignatureGenerator.
auto generate(SignatureData const& data, SignatureConfig const& config)
    -> std::vector<std::uint8_t>;

} // namespace sig
