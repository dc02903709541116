// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "AtomicFile.hpp"
#include "Errors.hpp"
#include "JpegCodec.hpp"
#include "JpegTestImage.hpp"
#include "LogoImage.hpp"
#include "PngCodec.hpp"

#include <cassert>
#include <filesystem>
#include <string>

namespace {

const sig::Color Brand{200, 40, 90, 255};

auto scratch_directory() -> std::filesystem::path {
  auto dir = std::filesystem::temp_directory_path() / "signet_test_logo_image";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir);
  return dir;
}

template <class Fn> auto expect_render_error(Fn&& fn) -> sig::RenderError {
  try {
    fn();
  } catch (sig::RenderError const& error) {
    return error;
  }
  assert(false && "expected RenderError");
  return sig::RenderError("", "");
}

} // namespace

void test_jpeg_decodes_to_opaque_rgba() {
  const std::vector<std::uint8_t> jpeg = sig::testing::encode_jpeg(16, 8, Brand);
  assert(sig::read_jpeg_size(jpeg) == (sig::Extents{16, 8}));

  sig::Canvas canvas = sig::decode_jpeg(jpeg);
  assert(canvas.extents() == (sig::Extents{16, 8}));
  for (sig::Color pixel : canvas.pixels()) {
    assert(sig::testing::close_to(pixel, Brand));
  }
}

void test_grayscale_jpeg_expands_to_rgb() {
  const sig::Color gray{120, 120, 120, 255};
  sig::Canvas canvas = sig::decode_jpeg(sig::testing::encode_jpeg(5, 3, gray, true));
  assert(canvas.extents() == (sig::Extents{5, 3}));
  for (sig::Color pixel : canvas.pixels()) {
    assert(pixel.r == pixel.g && pixel.g == pixel.b);
    assert(sig::testing::close_to(pixel, gray));
  }
}

void test_broken_jpeg_is_a_render_error() {
  std::vector<std::uint8_t> jpeg = sig::testing::encode_jpeg(16, 8, Brand);
  jpeg.resize(20);
  sig::RenderError error = expect_render_error([&] { sig::decode_jpeg(jpeg); });
  assert(error.operation() == "decode jpeg");
  assert(!error.reason().empty());

  const std::vector<std::uint8_t> empty;
  expect_render_error([&] { sig::read_jpeg_size(empty); });
}

void test_format_comes_from_content() {
  const std::vector<std::uint8_t> png = sig::encode_png(sig::Canvas(2, 2, Brand));
  const std::vector<std::uint8_t> jpeg = sig::testing::encode_jpeg(2, 2, Brand);
  assert(sig::detect_image_format(png) == sig::ImageFormat::Png);
  assert(sig::detect_image_format(jpeg) == sig::ImageFormat::Jpeg);
  assert(sig::decode_image(png) == sig::Canvas(2, 2, Brand));
  assert(sig::decode_image(jpeg).extents() == (sig::Extents{2, 2}));

  const std::string gif = "GIF89a";
  expect_render_error([&] {
    sig::detect_image_format({reinterpret_cast<std::uint8_t const*>(gif.data()), gif.size()});
  });
}

void test_files_report_size_and_path() {
  const auto dir = scratch_directory();
  const auto jpegPath = dir / "logo.jpg";
  const auto pngNamedJpeg = dir / "renamed.jpg";
  const auto broken = dir / "broken.jpeg";
  sig::write_file_atomically(jpegPath, sig::testing::encode_jpeg(30, 20, Brand));
  sig::write_file_atomically(pngNamedJpeg, sig::encode_png(sig::Canvas(3, 2, Brand)));
  sig::write_file_atomically(broken, std::string_view("\xFF\xD8\xFF not really"));

  assert(sig::read_image_size(jpegPath) == (sig::Extents{30, 20}));
  assert(sig::read_image_file(jpegPath).extents() == (sig::Extents{30, 20}));
  assert(sig::read_image_size(pngNamedJpeg) == (sig::Extents{3, 2}));
  assert(sig::read_image_file(pngNamedJpeg) == sig::Canvas(3, 2, Brand));

  sig::RenderError error = expect_render_error([&] { sig::read_image_file(broken); });
  assert(error.operation() == "decode logo");
  assert(error.reason().find("broken.jpeg") != std::string::npos);

  error = expect_render_error([&] { sig::read_image_size(dir / "missing.png"); });
  assert(error.operation() == "read logo");

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

int main() {
  test_jpeg_decodes_to_opaque_rgba();
  test_grayscale_jpeg_expands_to_rgb();
  test_broken_jpeg_is_a_render_error();
  test_format_comes_from_content();
  test_files_report_size_and_path();
}
