#pragma once

#include "brotbench/escape_time.hpp"
#include "brotbench/iteration_grid.hpp"
#include "brotbench/viewport.hpp"

#include <span>

namespace brotbench::scalar {

inline void evaluate_row(
    Viewport const &viewport, std::size_t y, std::size_t max_iterations, std::span<std::size_t> out
) noexcept {
  auto const b = viewport.imag_at(y);
  for (std::size_t x = 0; x != viewport.width; ++x) {
    out[x] = brotbench::escape_time(viewport.real_at(x), b, max_iterations);
  }
}

[[nodiscard]] inline auto evaluate(Viewport const &viewport, std::size_t max_iterations)
    -> IterationGrid {
  validate_request(viewport, max_iterations);

  auto grid = IterationGrid{viewport.width, viewport.height};
  for (std::size_t y = 0; y != viewport.height; ++y) {
    evaluate_row(viewport, y, max_iterations, grid.row(y));
  }
  return grid;
}

} // namespace brotbench::scalar
