#pragma once

#include "brotbench/error.hpp"
#include "brotbench/escape_time.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>

namespace brotbench {

struct PixelColor {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  friend auto operator==(PixelColor const &, PixelColor const &) -> bool = default;
};

namespace detail {
[[nodiscard]] inline auto to_channel(double value) noexcept -> std::uint8_t {
  return static_cast<std::uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}
} // namespace detail

/// Smooth polynomial palette over t = iteration / max_iterations. Points
/// that never escaped are black.
[[nodiscard]] inline auto colorize(std::size_t iteration, std::size_t max_iterations)
    -> PixelColor {
  validate_max_iterations(max_iterations);
  if (iteration > max_iterations) {
    throw InvalidArgument(
        std::format("iteration {} exceeds max_iterations {}", iteration, max_iterations)
    );
  }
  if (iteration == max_iterations) {
    return {};
  }

  auto const t = static_cast<double>(iteration) / static_cast<double>(max_iterations);
  auto const u = 1.0 - t;
  return {
      detail::to_channel(255.0 * 9.0 * u * t * t * t),
      detail::to_channel(255.0 * 15.0 * u * u * t * t),
      detail::to_channel(255.0 * 8.5 * u * u * u * t),
  };
}

} // namespace brotbench
