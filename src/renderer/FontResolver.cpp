// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "FontResolver.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "narrow.hpp"

#include <filesystem>
#include <optional>

namespace sig {

namespace {

auto locate_candidate(FontManager const& manager, std::string const& candidate)
    -> std::optional<std::filesystem::path> {
  std::filesystem::path path(candidate);
  std::error_code ec;
  if (std::filesystem::is_regular_file(path, ec)) {
    return path;
  }
  if (path.has_filename()) {
    return manager.find_in_font_directories(path.filename().string());
  }
  return std::nullopt;
}

} // namespace

auto resolve_font(FontManager& manager, TextRole role, SignatureConfig const& config,
                  std::string_view platform) -> Font {
  const auto size = narrow<std::uint32_t>(config.font_sizes.for_role(role));

  for (std::string const& candidate : config.font_candidates(role, platform)) {
    std::optional<std::filesystem::path> path = locate_candidate(manager, candidate);
    if (!path) {
      Log::d("Font candidate {} for {} not found", candidate, to_string(role));
      continue;
    }
    try {
      Font font = manager.load_font_file(*path, size);
      Log::d("Using {} for {} text", font.path().string(), to_string(role));
      return font;
    } catch (RenderError const& error) {
      Log::w("Skipping font {} for {}: {}", path->string(), to_string(role), error.reason());
    }
  }

  Log::w("No configured font for {} on {} is usable, falling back to '{}'", to_string(role),
         std::string(platform), config.fallback_font_family);
  try {
    Font font = manager.load_font(config.fallback_font_family, size);
    Log::i("Using fallback font {} for {} text", font.path().string(), to_string(role));
    return font;
  } catch (RenderError const& error) {
    throw RenderError("resolve font", "no usable font for " + std::string(to_string(role)) +
                                          ": " + error.reason());
  }
}

auto FontSet::for_role(TextRole role) const -> Font const& {
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

auto resolve_fonts(FontManager& manager, SignatureConfig const& config, std::string_view platform)
    -> FontSet {
  return FontSet{.name = resolve_font(manager, TextRole::Name, config, platform),
                 .details = resolve_font(manager, TextRole::Details, config, platform),
                 .confidentiality =
                     resolve_font(manager, TextRole::Confidentiality, config, platform)};
}

} // namespace sig
