// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "ImageResampler.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <vector>

namespace sig {

namespace {

constexpr double LanczosRadius = 3.0;

using Premultiplied = std::array<double, 4>;

auto sinc(double x) -> double {
  if (x == 0.0) {
    return 1.0;
  }
  x *= std::numbers::pi;
  return std::sin(x) / x;
}

auto lanczos(double x) -> double {
  if (std::abs(x) >= LanczosRadius) {
    return 0.0;
  }
  return sinc(x) * sinc(x / LanczosRadius);
}

// Source samples and normalized weights contributing to one target sample.
struct Contribution {
  std::size_t first;
  std::vector<double> weights;
};

auto compute_contributions(std::size_t sourceSize, std::size_t targetSize)
    -> std::vector<Contribution> {
  const double scale = static_cast<double>(sourceSize) / static_cast<double>(targetSize);
  const double filterScale = std::max(scale, 1.0);
  const double support = LanczosRadius * filterScale;

  std::vector<Contribution> contributions(targetSize);
  for (std::size_t i = 0; i < targetSize; ++i) {
    const double center = (static_cast<double>(i) + 0.5) * scale;
    const auto lo = static_cast<std::size_t>(std::max(0.0, std::floor(center - support)));
    const auto hi = std::min(sourceSize, static_cast<std::size_t>(std::ceil(center + support)));

    Contribution& contribution = contributions[i];
    contribution.first = lo;
    double sum = 0.0;
    for (std::size_t j = lo; j < hi; ++j) {
      double weight = lanczos((static_cast<double>(j) + 0.5 - center) / filterScale);
      contribution.weights.push_back(weight);
      sum += weight;
    }
    if (sum == 0.0) {
      // Degenerate window: take the nearest sample.
      contribution.first = std::min(sourceSize - 1, static_cast<std::size_t>(center));
      contribution.weights.assign(1, 1.0);
      continue;
    }
    for (double& weight : contribution.weights) {
      weight /= sum;
    }
  }
  return contributions;
}

auto premultiply(Color c) -> Premultiplied {
  const double a = c.a / 255.0;
  return {c.r * a, c.g * a, c.b * a, static_cast<double>(c.a)};
}

auto to_channel(double value) -> std::uint8_t {
  return static_cast<std::uint8_t>(std::lround(std::clamp(value, 0.0, 255.0)));
}

auto unpremultiply(Premultiplied const& p) -> Color {
  const std::uint8_t alpha = to_channel(p[3]);
  if (alpha == 0) {
    return colors::TRANSPARENT;
  }
  const double scale = 255.0 / std::clamp(p[3], 1.0, 255.0);
  return Color{to_channel(p[0] * scale), to_channel(p[1] * scale), to_channel(p[2] * scale),
               alpha};
}

} // namespace

auto scaled_width(Extents source, std::size_t height) -> std::size_t {
  if (source.height == 0) {
    return 1;
  }
  const double width = static_cast<double>(source.width) * static_cast<double>(height) /
                       static_cast<double>(source.height);
  return std::max<std::size_t>(1, static_cast<std::size_t>(std::llround(width)));
}

auto resize_lanczos(Canvas const& source, Extents target) -> Canvas {
  if (source.width() == 0 || source.height() == 0 || target.width == 0 || target.height == 0) {
    throw RenderError("resize image", "source and target must not be empty");
  }
  if (source.extents() == target) {
    return source;
  }

  const std::size_t srcW = source.width();
  const std::size_t srcH = source.height();

  std::vector<Premultiplied> input(srcW * srcH);
  std::span<Color const> pixels = source.pixels();
  std::transform(pixels.begin(), pixels.end(), input.begin(), premultiply);

  // Horizontal pass: srcH rows of target.width samples.
  const std::vector<Contribution> columns = compute_contributions(srcW, target.width);
  std::vector<Premultiplied> horizontal(target.width * srcH);
  for (std::size_t y = 0; y < srcH; ++y) {
    for (std::size_t x = 0; x < target.width; ++x) {
      Premultiplied sum{};
      Contribution const& c = columns[x];
      for (std::size_t k = 0; k < c.weights.size(); ++k) {
        Premultiplied const& p = input[y * srcW + c.first + k];
        for (std::size_t ch = 0; ch < 4; ++ch) {
          sum[ch] += p[ch] * c.weights[k];
        }
      }
      horizontal[y * target.width + x] = sum;
    }
  }

  const std::vector<Contribution> rows = compute_contributions(srcH, target.height);
  Canvas result(target.width, target.height);
  PixelsView out = result.view();
  for (std::size_t y = 0; y < target.height; ++y) {
    Contribution const& c = rows[y];
    for (std::size_t x = 0; x < target.width; ++x) {
      Premultiplied sum{};
      for (std::size_t k = 0; k < c.weights.size(); ++k) {
        Premultiplied const& p = horizontal[(c.first + k) * target.width + x];
        for (std::size_t ch = 0; ch < 4; ++ch) {
          sum[ch] += p[ch] * c.weights[k];
        }
      }
      out[x, y] = unpremultiply(sum);
    }
  }
  return result;
}

} // namespace sig
