#pragma once

#include "brotbench/backends/scalar.hpp"
#include "brotbench/backends/simd.hpp"
#include "brotbench/escape_time.hpp"
#include "brotbench/iteration_grid.hpp"
#include "brotbench/viewport.hpp"

#include <exec/static_thread_pool.hpp>
#include <stdexec/execution.hpp>

#include <utility>

namespace brotbench {

/// Fills `grid` one row at a time across `scheduler`. Each chunk writes only
/// its own rows, so no synchronization is needed beyond the final wait.
auto evaluate_rows(IterationGrid &grid, auto &&row_fn, auto scheduler) -> void {
  auto sender = stdexec::bulk_chunked(
      stdexec::schedule(scheduler),
      stdexec::par,
      grid.height(),
      [&](std::size_t begin, std::size_t end) {
        for (auto y = begin; y != end; ++y) {
          row_fn(y, grid.row(y));
        }
      }
  );

  stdexec::sync_wait(std::move(sender));
}

} // namespace brotbench

namespace brotbench::threaded {

[[nodiscard]] auto evaluate(Viewport const &viewport, std::size_t max_iterations, auto scheduler)
    -> IterationGrid {
  validate_request(viewport, max_iterations);

  auto grid = IterationGrid{viewport.width, viewport.height};
  evaluate_rows(
      grid,
      [&](std::size_t y, std::span<std::size_t> out) {
        scalar::evaluate_row(viewport, y, max_iterations, out);
      },
      scheduler
  );
  return grid;
}

} // namespace brotbench::threaded

namespace brotbench::threaded_simd {

[[nodiscard]] auto evaluate(Viewport const &viewport, std::size_t max_iterations, auto scheduler)
    -> IterationGrid {
  validate_request(viewport, max_iterations);

  auto grid = IterationGrid{viewport.width, viewport.height};
  evaluate_rows(
      grid,
      [&](std::size_t y, std::span<std::size_t> out) {
        simd::evaluate_row(viewport, y, max_iterations, out);
      },
      scheduler
  );
  return grid;
}

} // namespace brotbench::threaded_simd
