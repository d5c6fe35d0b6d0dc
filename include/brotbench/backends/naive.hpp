#pragma once

#include "brotbench/escape_time.hpp"
#include "brotbench/iteration_grid.hpp"
#include "brotbench/viewport.hpp"

#include <complex>

namespace brotbench::naive {

template <typename T>
[[nodiscard]] auto escape_time(std::complex<T> c, std::size_t max_iterations) -> std::size_t {
  auto iter = std::size_t{};

  auto z = std::complex<T>{};
  while (std::norm(z) <= T{4} && iter < max_iterations) {
    z = z * z + c;
    ++iter;
  }
  return iter;
}

[[nodiscard]] inline auto evaluate(Viewport const &viewport, std::size_t max_iterations)
    -> IterationGrid {
  validate_request(viewport, max_iterations);

  auto grid = IterationGrid{viewport.width, viewport.height};
  for (std::size_t y = 0; y != viewport.height; ++y) {
    auto out = grid.row(y);
    for (std::size_t x = 0; x != viewport.width; ++x) {
      out[x] = escape_time(viewport.sample(x, y), max_iterations);
    }
  }
  return grid;
}

} // namespace brotbench::naive
