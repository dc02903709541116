// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "PngCodec.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "narrow.hpp"

#include <png.h>

#include <cstring>
#include <string>

namespace sig {

namespace {

// Frees the libpng control structure on every exit path.
struct PngImage {
  png_image image;

  PngImage() {
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
  }
  PngImage(PngImage const&) = delete;
  auto operator=(PngImage const&) -> PngImage& = delete;
  ~PngImage() { png_image_free(&image); }

  auto message() const -> std::string { return image.message; }
};

auto begin_read(PngImage& png, std::span<std::uint8_t const> bytes) -> void {
  if (bytes.empty()) {
    throw RenderError("decode png", "empty input");
  }
  if (!png_image_begin_read_from_memory(&png.image, bytes.data(), bytes.size())) {
    throw RenderError("decode png", png.message());
  }
  if (png.image.width == 0 || png.image.height == 0 || png.image.width > MaxImageDimension ||
      png.image.height > MaxImageDimension) {
    throw RenderError("decode png", "unsupported image size " + std::to_string(png.image.width) +
                                        "x" + std::to_string(png.image.height));
  }
}

} // namespace

auto decode_png(std::span<std::uint8_t const> bytes) -> Canvas {
  PngImage png;
  begin_read(png, bytes);
  png.image.format = PNG_FORMAT_RGBA;

  Canvas canvas(png.image.width, png.image.height);
  if (canvas.bytes().size() != PNG_IMAGE_SIZE(png.image)) {
    throw RenderError("decode png", "unexpected decoded image size");
  }
  if (!png_image_finish_read(&png.image, nullptr, canvas.bytes().data(), 0, nullptr)) {
    throw RenderError("decode png", png.message());
  }
  if (png.image.warning_or_error & PNG_IMAGE_WARNING) {
    Log::d("libpng warning while decoding: {}", png.message());
  }
  return canvas;
}

auto read_png_size(std::span<std::uint8_t const> bytes) -> Extents {
  PngImage png;
  begin_read(png, bytes);
  return Extents{png.image.width, png.image.height};
}

auto encode_png(Canvas const& canvas) -> std::vector<std::uint8_t> {
  if (canvas.width() == 0 || canvas.height() == 0) {
    throw RenderError("encode png", "canvas is empty");
  }

  PngImage png;
  png.image.width = narrow<png_uint_32>(canvas.width());
  png.image.height = narrow<png_uint_32>(canvas.height());
  png.image.format = PNG_FORMAT_RGBA;

  png_alloc_size_t size = 0;
  const void* pixels = canvas.bytes().data();
  if (!png_image_write_to_memory(&png.image, nullptr, &size, 0, pixels, 0, nullptr)) {
    throw RenderError("encode png", png.message());
  }

  std::vector<std::uint8_t> encoded(size);
  if (!png_image_write_to_memory(&png.image, encoded.data(), &size, 0, pixels, 0, nullptr)) {
    throw RenderError("encode png", png.message());
  }
  encoded.resize(size);
  return encoded;
}

} // namespace sig
