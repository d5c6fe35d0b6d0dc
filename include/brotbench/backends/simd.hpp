#pragma once

#include "brotbench/escape_time.hpp"
#include "brotbench/iteration_grid.hpp"
#include "brotbench/viewport.hpp"

#include <xsimd/xsimd.hpp>

#include <algorithm>
#include <span>

namespace brotbench::simd {

using batch = xsimd::batch<double>;
using bsize = xsimd::batch<std::size_t>;

/// Lane-wise escape time. Escaped lanes freeze, so every lane matches
/// brotbench::escape_time for its own point.
[[nodiscard]] inline auto escape_time(batch a, batch b, std::size_t max_iterations) -> bsize {
  auto const four = batch(ESCAPE_RADIUS_SQUARED);
  auto const two = batch(2.0);
  auto const one = bsize(1);

  auto x = batch(0.0);
  auto y = batch(0.0);
  auto iter = bsize(0);

  for (std::size_t i = 0; i < max_iterations; ++i) {
    auto const x2 = x * x;
    auto const y2 = y * y;

    auto const mask = (x2 + y2) <= four;
    if (none(mask)) {
      break;
    }

    // no fma: must round exactly like the scalar kernel
    auto const x_next = x2 - y2 + a;
    auto const y_next = two * x * y + b;
    auto const mask_i = batch_bool_cast<std::size_t>(mask);

    // Only update where still running
    x = select(mask, x_next, x);
    y = select(mask, y_next, y);
    iter = select(mask_i, iter + one, iter);
  }

  return iter;
}

inline void evaluate_row(
    Viewport const &viewport, std::size_t y, std::size_t max_iterations, std::span<std::size_t> out
) {
  constexpr auto lanes = batch::size;

  alignas(alignof(batch)) double re[lanes];
  alignas(alignof(bsize)) std::size_t counts[lanes];

  auto const b = batch(viewport.imag_at(y));
  for (std::size_t x0 = 0; x0 < viewport.width; x0 += lanes) {
    auto const valid = std::min(lanes, viewport.width - x0);
    // the tail repeats the last pixel rather than sampling past the edge
    for (std::size_t i = 0; i != lanes; ++i) {
      re[i] = viewport.real_at(x0 + std::min(i, valid - 1));
    }
    escape_time(batch::load_aligned(re), b, max_iterations).store_aligned(counts);
    std::copy_n(counts, valid, out.subspan(x0).begin());
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

} // namespace brotbench::simd
