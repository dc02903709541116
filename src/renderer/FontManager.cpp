// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "FontManager.hpp"
#include "Errors.hpp"
#include "FontImpl.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace sig {

FreeTypeLibrary::FreeTypeLibrary() {
  if (FT_Error error = FT_Init_FreeType(&library)) {
    throw RenderError("initialize FreeType", "FT_Init_FreeType failed with error " +
                                                 std::to_string(error));
  }
}

FreeTypeLibrary::~FreeTypeLibrary() {
  if (library) {
    FT_Done_FreeType(library);
  }
}

namespace {

auto default_font_directories() -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> directories{"/usr/share/fonts", "/usr/local/share/fonts"};
  if (const char* home = std::getenv("HOME")) {
    directories.push_back(std::filesystem::path(home) / ".fonts");
    directories.push_back(std::filesystem::path(home) / ".local/share/fonts");
  }
  return directories;
}

auto is_font_file(std::filesystem::path const& path) -> bool {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".ttf" || ext == ".otf" || ext == ".ttc";
}

} // namespace

struct FontManagerImpl {
  std::shared_ptr<FreeTypeLibrary> library = std::make_shared<FreeTypeLibrary>();
  std::vector<std::filesystem::path> font_directories;
  mutable std::optional<std::vector<std::filesystem::path>> scanned;

  static auto normalize_font_name(std::string_view name) -> std::string {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
      if (c != ' ' && c != '-' && c != '_') {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
    }
    return result;
  }

  // Every font file below the font directories, sorted so that searches are reproducible.
  auto font_files() const -> std::vector<std::filesystem::path> const& {
    if (scanned) {
      return *scanned;
    }
    std::vector<std::filesystem::path> files;
    for (auto const& dir : font_directories) {
      std::error_code ec;
      if (!std::filesystem::is_directory(dir, ec)) {
        continue;
      }
      auto options = std::filesystem::directory_options::skip_permission_denied;
      for (std::filesystem::recursive_directory_iterator it(dir, options, ec), end;
           !ec && it != end; it.increment(ec)) {
        std::error_code typeError;
        if (it->is_regular_file(typeError) && is_font_file(it->path())) {
          files.push_back(it->path());
        }
      }
      if (ec) {
        Log::w("Stopped scanning font directory {}: {}", dir.string(), ec.message());
      }
    }
    std::sort(files.begin(), files.end());
    Log::d("Found {} font files", files.size());
    scanned = std::move(files);
    return *scanned;
  }
};

FontManager::FontManager() : FontManager(default_font_directories()) {}

FontManager::FontManager(std::vector<std::filesystem::path> directories)
    : mImpl(std::make_unique<FontManagerImpl>()) {
  mImpl->font_directories = std::move(directories);
}

FontManager::FontManager(FontManager&&) noexcept = default;
auto FontManager::operator=(FontManager&&) noexcept -> FontManager& = default;
FontManager::~FontManager() = default;

auto FontManager::load_font(std::string_view family, std::uint32_t sizePx) -> Font {
  std::optional<std::filesystem::path> path = find_font_file(family);
  if (!path) {
    throw RenderError("load font", "font family not found: " + std::string(family));
  }
  return load_font_file(*path, sizePx);
}

auto FontManager::load_font_file(std::filesystem::path const& path, std::uint32_t sizePx)
    -> Font {
  FT_Face face = nullptr;
  if (FT_Error error = FT_New_Face(mImpl->library->library, path.c_str(), 0, &face)) {
    throw RenderError("load font", "cannot load font file " + path.string() + " (error " +
                                       std::to_string(error) + ")");
  }

  auto impl = std::make_shared<FontImpl>(mImpl->library, face, path);
  if (FT_Error error = FT_Set_Pixel_Sizes(face, 0, sizePx)) {
    throw RenderError("load font", "cannot set size " + std::to_string(sizePx) + " on " +
                                       path.string() + " (error " + std::to_string(error) + ")");
  }

  Log::d("Loaded font {} at {}px", path.string(), sizePx);
  return Font(std::move(impl));
}

auto FontManager::find_font_file(std::string_view family) const
    -> std::optional<std::filesystem::path> {
  const std::string wanted = FontManagerImpl::normalize_font_name(family);
  if (wanted.empty()) {
    return std::nullopt;
  }

  std::optional<std::filesystem::path> partial;
  for (auto const& file : mImpl->font_files()) {
    const std::string stem = FontManagerImpl::normalize_font_name(file.stem().string());
    if (stem == wanted) {
      return file;
    }
    if (!partial && stem.find(wanted) != std::string::npos) {
      partial = file;
    }
  }
  return partial;
}

auto FontManager::find_in_font_directories(std::string_view fileName) const
    -> std::optional<std::filesystem::path> {
  for (auto const& file : mImpl->font_files()) {
    if (file.filename() == fileName) {
      return file;
    }
  }
  return std::nullopt;
}

auto FontManager::add_font_directory(std::filesystem::path path) -> void {
  mImpl->font_directories.push_back(std::move(path));
  mImpl->scanned.reset();
}

auto FontManager::font_directories() const -> std::vector<std::filesystem::path> const& {
  return mImpl->font_directories;
}

} // namespace sig
