#pragma once

#include "brotbench/colorize.hpp"
#include "brotbench/error.hpp"
#include "brotbench/escape_time.hpp"
#include "brotbench/iteration_grid.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string_view>
#include <vector>

namespace brotbench {

enum class Palette {
  polynomial, // colorize()
  hot,        // log-scaled "hot" colormap
};

[[nodiscard]] constexpr auto palette_name(Palette palette) noexcept -> std::string_view {
  switch (palette) {
  case Palette::polynomial:
    return "polynomial";
  case Palette::hot:
    return "hot";
  }
  return "unknown";
}

/// RGBA bytes in the same row-major order as IterationGrid. Alpha is 255.
struct PixelBuffer {
  std::size_t width = 0;
  std::size_t height = 0;
  std::vector<std::uint8_t> rgba;

  [[nodiscard]] auto at(std::size_t x, std::size_t y) const noexcept -> PixelColor {
    auto const i = (y * width + x) * 4;
    return {rgba[i], rgba[i + 1], rgba[i + 2]};
  }
};

/// 256-entry "hot" colormap: dark red, red, yellow, white. Knots at
/// 0.365079 (red saturates) and 0.746032 (green saturates).
[[nodiscard]] inline auto hot_colormap(double value) noexcept -> PixelColor {
  static constexpr double RED_KNOT = 0.365079;
  static constexpr double GREEN_KNOT = 0.746032;
  static constexpr double RED_FLOOR = 0.0416;
  static constexpr std::size_t LUT_SIZE = 256;

  auto const index =
      std::min(static_cast<std::size_t>(std::clamp(value, 0.0, 1.0) * LUT_SIZE), LUT_SIZE - 1);
  auto const p = static_cast<double>(index) / static_cast<double>(LUT_SIZE - 1);

  auto const r = p < RED_KNOT ? RED_FLOOR + (1.0 - RED_FLOOR) * p / RED_KNOT : 1.0;
  auto const g = p < RED_KNOT     ? 0.0
                 : p < GREEN_KNOT ? (p - RED_KNOT) / (GREEN_KNOT - RED_KNOT)
                                  : 1.0;
  auto const b = p < GREEN_KNOT ? 0.0 : (p - GREEN_KNOT) / (1.0 - GREEN_KNOT);

  // truncated, not rounded
  auto channel = [](double c) { return static_cast<std::uint8_t>(std::clamp(c, 0.0, 1.0) * 255.0); };
  return {channel(r), channel(g), channel(b)};
}

namespace detail {

inline void put(PixelBuffer &buffer, std::size_t index, PixelColor color) noexcept {
  auto *pixel = buffer.rgba.data() + index * 4;
  pixel[0] = color.r;
  pixel[1] = color.g;
  pixel[2] = color.b;
  pixel[3] = 255;
}

inline void render_polynomial(
    IterationGrid const &grid, std::size_t max_iterations, PixelBuffer &buffer
) {
  auto const counts = grid.values();
  for (std::size_t i = 0; i != counts.size(); ++i) {
    put(buffer, i, colorize(counts[i], max_iterations));
  }
}

// log(i + 1), normalized by the largest value among escaped cells.
inline void render_hot(IterationGrid const &grid, std::size_t max_iterations, PixelBuffer &buffer) {
  auto const counts = grid.values();

  auto peak = 0.0;
  for (auto const count : counts) {
    if (count > max_iterations) {
      throw InvalidArgument(
          std::format("iteration {} exceeds max_iterations {}", count, max_iterations)
      );
    }
    if (count < max_iterations) {
      peak = std::max(peak, std::log(static_cast<double>(count) + 1.0));
    }
  }

  for (std::size_t i = 0; i != counts.size(); ++i) {
    auto value = 0.0;
    if (counts[i] < max_iterations and peak > 0.0) {
      value = std::log(static_cast<double>(counts[i]) + 1.0) / peak;
    }
    put(buffer, i, hot_colormap(value));
  }
}

} // namespace detail

/// Colors every cell of `grid`. Throws InvalidArgument if max_iterations is
/// zero or a cell exceeds it.
[[nodiscard]] inline auto render(
    IterationGrid const &grid, std::size_t max_iterations, Palette palette = Palette::polynomial
) -> PixelBuffer {
  validate_max_iterations(max_iterations);

  auto buffer = PixelBuffer{grid.width(), grid.height(), {}};
  buffer.rgba.resize(grid.size() * 4);

  switch (palette) {
  case Palette::polynomial:
    detail::render_polynomial(grid, max_iterations, buffer);
    break;
  case Palette::hot:
    detail::render_hot(grid, max_iterations, buffer);
    break;
  }
  return buffer;
}

} // namespace brotbench
