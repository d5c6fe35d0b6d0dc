#pragma once

#include "brotbench/backends/scalar.hpp"
#include "brotbench/iteration_grid.hpp"
#include "brotbench/viewport.hpp"

namespace brotbench {

/// Reference evaluation. Throws InvalidArgument for a malformed viewport or
/// a zero iteration bound; every other backend must match its output.
[[nodiscard]] inline auto evaluate(Viewport const &viewport, std::size_t max_iterations)
    -> IterationGrid {
  return scalar::evaluate(viewport, max_iterations);
}

} // namespace brotbench
