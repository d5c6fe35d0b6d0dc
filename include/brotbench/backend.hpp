#pragma once

#include "brotbench/backends/naive.hpp"
#include "brotbench/backends/scalar.hpp"
#include "brotbench/backends/simd.hpp"
#include "brotbench/backends/threaded.hpp"
#include "brotbench/error.hpp"
#include "brotbench/iteration_grid.hpp"
#include "brotbench/viewport.hpp"

#include <exec/static_thread_pool.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <span>
#include <string_view>

namespace brotbench {

struct Backend {
  std::string_view slug;
  std::string_view name;
  // The pool is only used by the threaded backends.
  IterationGrid (*evaluate)(Viewport const &, std::size_t, exec::static_thread_pool &);
};

inline constexpr std::array<Backend, 5> BACKENDS{{
    {"naive",
     "Naive std::complex",
     [](Viewport const &viewport, std::size_t max_iterations, exec::static_thread_pool &) {
       return naive::evaluate(viewport, max_iterations);
     }},
    {"scalar",
     "Scalar with saved squares",
     [](Viewport const &viewport, std::size_t max_iterations, exec::static_thread_pool &) {
       return scalar::evaluate(viewport, max_iterations);
     }},
    {"simd",
     "SIMD",
     [](Viewport const &viewport, std::size_t max_iterations, exec::static_thread_pool &) {
       return simd::evaluate(viewport, max_iterations);
     }},
    {"threaded",
     "Multithreaded",
     [](Viewport const &viewport, std::size_t max_iterations, exec::static_thread_pool &pool) {
       return threaded::evaluate(viewport, max_iterations, pool.get_scheduler());
     }},
    {"threaded-simd",
     "Multithreaded + SIMD",
     [](Viewport const &viewport, std::size_t max_iterations, exec::static_thread_pool &pool) {
       return threaded_simd::evaluate(viewport, max_iterations, pool.get_scheduler());
     }},
}};

[[nodiscard]] inline auto backends() noexcept -> std::span<Backend const> { return BACKENDS; }

[[nodiscard]] inline auto find_backend(std::string_view slug) -> Backend const & {
  auto const it = std::ranges::find(BACKENDS, slug, &Backend::slug);
  if (it == BACKENDS.end()) {
    throw InvalidArgument(std::format("unknown backend '{}'", slug));
  }
  return *it;
}

} // namespace brotbench
