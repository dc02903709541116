// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Errors.hpp"
#include "PngCodec.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <vector>

namespace {

auto sample_canvas() -> sig::Canvas {
  sig::Canvas canvas(3, 2);
  canvas.view()[0, 0] = sig::Color{255, 0, 0, 255};
  canvas.view()[1, 0] = sig::Color{0, 255, 0, 128};
  canvas.view()[2, 1] = sig::Color{200, 0, 40, 200};
  return canvas;
}

} // namespace

void test_encoded_png_keeps_alpha_exactly() {
  sig::Canvas canvas = sample_canvas();
  std::vector<std::uint8_t> png = sig::encode_png(canvas);

  const std::array<std::uint8_t, 8> signature{0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  assert(png.size() > signature.size());
  assert(std::equal(signature.begin(), signature.end(), png.begin()));

  sig::Canvas decoded = sig::decode_png(png);
  assert(decoded == canvas);
  assert(decoded.at(0, 1) == sig::colors::TRANSPARENT);
}

void test_encoding_is_reproducible() {
  assert(sig::encode_png(sample_canvas()) == sig::encode_png(sample_canvas()));
}

void test_garbage_is_a_render_error() {
  const std::array<std::uint8_t, 5> garbage{1, 2, 3, 4, 5};
  bool threw = false;
  try {
    sig::decode_png(garbage);
  } catch (sig::RenderError const& error) {
    threw = true;
    assert(!error.reason().empty());
  }
  assert(threw);
}

void test_size_comes_from_the_header() {
  std::vector<std::uint8_t> png = sig::encode_png(sample_canvas());
  assert(sig::read_png_size(png) == (sig::Extents{3, 2}));

  const std::vector<std::uint8_t> empty;
  bool threw = false;
  try {
    sig::read_png_size(empty);
  } catch (sig::RenderError const& error) {
    threw = true;
    assert(error.operation() == "decode png");
  }
  assert(threw);
}

int main() {
  test_encoded_png_keeps_alpha_exactly();
  test_encoding_is_reproducible();
  test_garbage_is_a_render_error();
  test_size_comes_from_the_header();
}
