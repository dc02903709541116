// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "LogoImage.hpp"
#include "AtomicFile.hpp"
#include "Errors.hpp"
#include "JpegCodec.hpp"
#include "PngCodec.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace sig {

namespace {

constexpr std::array<std::uint8_t, 8> PngSignature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
constexpr std::array<std::uint8_t, 3> JpegSignature = {0xFF, 0xD8, 0xFF};

template <std::size_t N>
auto starts_with(std::span<std::uint8_t const> bytes, std::array<std::uint8_t, N> const& magic)
    -> bool {
  return bytes.size() >= N && std::equal(magic.begin(), magic.end(), bytes.begin());
}

auto read_bytes(std::filesystem::path const& path) -> std::string {
  try {
    return read_full_file(path);
  } catch (FileSystemError const& error) {
    throw RenderError("read logo", error.what());
  }
}

auto as_bytes(std::string const& data) -> std::span<std::uint8_t const> {
  return {reinterpret_cast<std::uint8_t const*>(data.data()), data.size()};
}

template <class Fn> auto with_path(std::filesystem::path const& path, Fn&& fn) {
  try {
    return fn();
  } catch (RenderError const& error) {
    throw RenderError("decode logo", path.string() + ": " + error.reason());
  }
}

} // namespace

auto detect_image_format(std::span<std::uint8_t const> bytes) -> ImageFormat {
  if (starts_with(bytes, PngSignature)) {
    return ImageFormat::Png;
  }
  if (starts_with(bytes, JpegSignature)) {
    return ImageFormat::Jpeg;
  }
  throw RenderError("decode image", "not a PNG or JPEG file");
}

auto decode_image(std::span<std::uint8_t const> bytes) -> Canvas {
  switch (detect_image_format(bytes)) {
  case ImageFormat::Png:
    return decode_png(bytes);
  case ImageFormat::Jpeg:
    return decode_jpeg(bytes);
  }
  throw RenderError("decode image", "unknown image format");
}

auto read_image_file(std::filesystem::path const& path) -> Canvas {
  const std::string data = read_bytes(path);
  return with_path(path, [&] { return decode_image(as_bytes(data)); });
}

auto read_image_size(std::filesystem::path const& path) -> Extents {
  const std::string data = read_bytes(path);
  return with_path(path, [&] {
    const auto bytes = as_bytes(data);
    return detect_image_format(bytes) == ImageFormat::Png ? read_png_size(bytes)
                                                          : read_jpeg_size(bytes);
  });
}

} // namespace sig
