// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "AtomicFile.hpp"
#include "Errors.hpp"
#include "FontResolver.hpp"
#include "JpegTestImage.hpp"
#include "PngCodec.hpp"
#include "SignatureGenerator.hpp"

#include <cassert>
#include <cstdio>
#include <algorithm>
#include <filesystem>

namespace {

constexpr int Skipped = 77;

auto fields() -> sig::SignatureFields {
  return sig::SignatureFields{.name = "John Doe",
                              .position = "Software Engineer",
                              .address = "Anytown, USA",
                              .phone = "+1 555 0100",
                              .mobile = "+1 555 0101",
                              .email = "john.doe@example.com",
                              .website = "",
                              .logo_path = ""};
}

auto scratch_directory() -> std::filesystem::path {
  auto dir = std::filesystem::temp_directory_path() / "signet_test_signature_generator";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir);
  return dir;
}

auto write_logo(std::filesystem::path const& path, std::size_t width, std::size_t height)
    -> void {
  sig::Canvas logo(width, height, sig::Color{0, 90, 160, 255});
  for (std::size_t x = 0; x < width; ++x) {
    logo.view()[x, 0] = sig::colors::TRANSPARENT;
  }
  sig::write_file_atomically(path, sig::encode_png(logo));
}

// Every pixel outside all element boxes, grown by `pad`, is fully transparent.
void assert_transparent_outside_elements(sig::Canvas const& canvas,
                                         sig::LayoutResult const& layout, int pad) {
  std::vector<sig::Region> boxes;
  for (auto const& line : layout.lines) {
    boxes.push_back({line.position, line.size});
  }
  boxes.push_back({layout.confidentiality.position, layout.confidentiality.size});
  boxes.push_back(layout.separator);
  if (layout.logo) {
    boxes.push_back(*layout.logo);
  }

  for (std::size_t y = 0; y < canvas.height(); ++y) {
    for (std::size_t x = 0; x < canvas.width(); ++x) {
      bool covered = false;
      for (sig::Region const& box : boxes) {
        const auto px = static_cast<int>(x);
        const auto py = static_cast<int>(y);
        if (px >= box.position.x - pad &&
            px < box.position.x + static_cast<int>(box.size.width) + pad &&
            py >= box.position.y - pad &&
            py < box.position.y + static_cast<int>(box.size.height) + pad) {
          covered = true;
          break;
        }
      }
      if (!covered) {
        assert(canvas.at(x, y).a == 0);
      }
    }
  }
}

} // namespace

void test_john_doe_end_to_end(sig::SignatureGenerator& generator) {
  sig::SignatureData data = sig::SignatureData::create(fields());
  sig::LayoutResult layout = generator.layout(data);
  std::vector<std::uint8_t> png = generator.generate(data);

  sig::Canvas decoded = sig::decode_png(png);
  assert(decoded.extents() == layout.canvas);
  assert(layout.lines.size() == 7);
  assert(layout.find_line("website")->text == "www.example.com");

  sig::SignatureConfig const& config = generator.config();
  std::size_t widest = 0;
  for (auto const& line : layout.lines) {
    widest = std::max(widest, line.size.width);
  }
  const std::size_t content = std::max(widest, layout.confidentiality.size.width);
  assert(layout.canvas.width == static_cast<std::size_t>(2 * config.margin) + content);
  assert(layout.canvas.height ==
         static_cast<std::size_t>(2 * config.margin + (7 + 3) * config.line_height));

  // Visible ink on every contact line.
  for (auto const& line : layout.lines) {
    bool inked = false;
    for (std::size_t y = 0; y < line.size.height && !inked; ++y) {
      for (std::size_t x = 0; x < line.size.width && !inked; ++x) {
        inked = decoded.at(line.position.x + x, line.position.y + y).a != 0;
      }
    }
    assert(inked);
  }

  // Separator pixels carry the configured color and alpha exactly.
  sig::Position sep = layout.separator.position;
  assert(decoded.at(sep.x + layout.separator.size.width / 2, sep.y + 1) ==
         config.colors.separator);

  assert_transparent_outside_elements(decoded, layout, config.outline_width_name + 3);
  assert(decoded.at(0, 0).a == 0);
}

void test_rendering_is_deterministic(sig::SignatureGenerator& generator) {
  sig::SignatureData data = sig::SignatureData::create(fields());
  std::vector<std::uint8_t> first = generator.generate(data);
  std::vector<std::uint8_t> second = generator.generate(data);
  assert(first == second);

  sig::SignatureGenerator fresh(generator.config());
  assert(fresh.generate(data) == first);
  assert(sig::generate(data, generator.config()) == first);
}

void test_missing_phone_gives_shorter_image(sig::SignatureGenerator& generator) {
  sig::SignatureFields without = fields();
  without.phone = "";
  sig::Canvas full = generator.render_canvas(sig::SignatureData::create(fields()));
  sig::Canvas shorter = generator.render_canvas(sig::SignatureData::create(without));
  assert(shorter.height() < full.height());
  assert(shorter.height() + static_cast<std::size_t>(generator.config().line_height) ==
         full.height());
}

void test_logo_is_scaled_and_composited(sig::SignatureGenerator& generator) {
  const auto dir = scratch_directory();
  const auto logoPath = dir / "logo.png";
  write_logo(logoPath, 300, 200);

  sig::SignatureFields withLogo = fields();
  withLogo.logo_path = logoPath.string();
  sig::SignatureData data = sig::SignatureData::create(withLogo);

  sig::LayoutResult layout = generator.layout(data);
  assert(layout.logo);
  assert(layout.logo->size == (sig::Extents{105, 70}));
  const double ratio = static_cast<double>(layout.logo->size.width) /
                       static_cast<double>(layout.logo->size.height);
  assert(ratio > 300.0 / 200.0 - 1.0 / 70.0 && ratio < 300.0 / 200.0 + 1.0 / 70.0);

  sig::Canvas canvas = generator.render_canvas(data);
  sig::Region logo = *layout.logo;
  sig::Color center = canvas.at(logo.position.x + 52, logo.position.y + 35);
  assert(center == (sig::Color{0, 90, 160, 255}));
  assert(canvas.at(logo.position.x + 52, logo.position.y + 69).a == 255);
  assert_transparent_outside_elements(canvas, layout, generator.config().outline_width_name + 3);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

void test_jpeg_logo_is_composited(sig::SignatureGenerator& generator) {
  const auto dir = scratch_directory();
  const auto logoPath = dir / "logo.jpeg";
  const sig::Color brand{0, 90, 160, 255};
  sig::write_file_atomically(logoPath, sig::testing::encode_jpeg(300, 200, brand));

  sig::SignatureFields withLogo = fields();
  withLogo.logo_path = logoPath.string();
  sig::SignatureData data = sig::SignatureData::create(withLogo);

  sig::LayoutResult layout = generator.layout(data);
  assert(layout.logo);
  assert(layout.logo->size == (sig::Extents{105, 70}));

  sig::Canvas canvas = generator.render_canvas(data);
  sig::Region logo = *layout.logo;
  assert(sig::testing::close_to(canvas.at(logo.position.x + 52, logo.position.y + 35), brand));
  assert(canvas.at(logo.position.x, logo.position.y).a == 255);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

void test_undecodable_logo_is_a_render_error(sig::SignatureGenerator& generator) {
  const auto dir = scratch_directory();
  const auto logoPath = dir / "broken.png";
  sig::write_file_atomically(logoPath, std::string_view("GIF89a"));

  sig::SignatureFields broken = fields();
  broken.logo_path = logoPath.string();
  try {
    generator.generate(sig::SignatureData::create(broken));
    assert(false && "expected RenderError");
  } catch (sig::RenderError const& error) {
    assert(error.operation() == "decode logo");
  }

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

void test_find_logo_uses_first_existing_image() {
  const auto dir = scratch_directory();
  std::filesystem::create_directories(dir / "logo");
  write_logo(dir / "logo" / "logo.png", 10, 10);

  sig::SignatureConfig config;
  assert(config.logo_search_paths.size() == 4);
  assert(sig::find_logo(config, dir) == dir / "./logo/logo.png");

  sig::write_file_atomically(dir / "logo.jpg",
                             sig::testing::encode_jpeg(10, 10, sig::colors::WHITE));
  assert(sig::find_logo(config, dir) == dir / "logo.jpg");

  write_logo(dir / "logo.png", 10, 10);
  assert(sig::find_logo(config, dir) == dir / "logo.png");

  config.logo_search_paths = {"missing.png"};
  assert(!sig::find_logo(config, dir));

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

int main() {
  test_find_logo_uses_first_existing_image();

  sig::SignatureConfig config;
  try {
    sig::FontManager fonts;
    sig::resolve_fonts(fonts, config);
  } catch (sig::RenderError const& error) {
    std::fprintf(stderr, "skipping: %s\n", error.what());
    return Skipped;
  }

  sig::SignatureGenerator generator(config);
  test_john_doe_end_to_end(generator);
  test_rendering_is_deterministic(generator);
  test_missing_phone_gives_shorter_image(generator);
  test_logo_is_scaled_and_composited(generator);
  test_jpeg_logo_is_composited(generator);
  test_undecodable_logo_is_a_render_error(generator);
}
