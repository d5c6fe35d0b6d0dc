#pragma once

#include "brotbench/error.hpp"
#include "brotbench/viewport.hpp"

#include <complex>
#include <cstddef>
#include <tuple>

namespace brotbench {

inline constexpr double ESCAPE_RADIUS_SQUARED = 4.0;

/// Iterations of z = z^2 + c, starting from z = 0, before |z|^2 exceeds 4.
/// Returns max_iterations for points that never escape.
[[nodiscard]] inline auto escape_time(double a, double b, std::size_t max_iterations) noexcept
    -> std::size_t {
  auto iter = std::size_t{};

  auto x = 0.0;
  auto y = 0.0;
  auto x2 = 0.0;
  auto y2 = 0.0;
  while (x2 + y2 <= ESCAPE_RADIUS_SQUARED && iter < max_iterations) {
    auto x_next = x2 - y2 + a;
    auto y_next = 2.0 * x * y + b;
    std::tie(x, y) = std::tie(x_next, y_next);
    y2 = y * y; // reused by the loop check
    x2 = x * x;
    ++iter;
  }
  return iter;
}

[[nodiscard]] inline auto escape_time(std::complex<double> c, std::size_t max_iterations) noexcept
    -> std::size_t {
  return escape_time(c.real(), c.imag(), max_iterations);
}

inline void validate_max_iterations(std::size_t max_iterations) {
  if (max_iterations == 0) {
    throw InvalidArgument("max_iterations must be positive");
  }
}

// Checked before any backend touches its output.
inline void validate_request(Viewport const &viewport, std::size_t max_iterations) {
  validate(viewport);
  validate_max_iterations(max_iterations);
}

} // namespace brotbench
