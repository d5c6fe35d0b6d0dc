#include "options.hpp"

#include "brotbench/backend.hpp"
#include "brotbench/evaluate.hpp"
#include "brotbench/image.hpp"
#include "brotbench/render.hpp"

#include <exec/static_thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <new>

namespace {

constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

[[nodiscard]] auto count_mismatches(brotbench::IterationGrid const &lhs,
                                    brotbench::IterationGrid const &rhs) -> std::size_t {
  auto mismatches = std::size_t{};
  auto const a = lhs.values();
  auto const b = rhs.values();
  for (std::size_t i = 0; i != a.size(); ++i) {
    mismatches += a[i] != b[i] ? 1 : 0;
  }
  return mismatches;
}

auto run(brotbench::cli::Options const &options) -> int {
  auto const &viewport = options.viewport;
  auto const &backend = brotbench::find_backend(options.backend);

  spdlog::debug(
      "viewport re [{}, {}] im [{}, {}], {} threads",
      viewport.re_min,
      viewport.re_max,
      viewport.im_min,
      viewport.im_max,
      options.threads
  );
  auto pool = exec::static_thread_pool(options.threads);

  auto const start = std::chrono::high_resolution_clock::now();
  auto const grid = backend.evaluate(viewport, options.max_iterations, pool);
  auto const end = std::chrono::high_resolution_clock::now();
  auto const elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

  spdlog::info(
      "{}: {}x{} pixels, {} max iterations in {:.2f} ms",
      backend.name,
      viewport.width,
      viewport.height,
      options.max_iterations,
      elapsed_ms
  );

  if (options.verify) {
    auto const reference = brotbench::evaluate(viewport, options.max_iterations);
    if (auto const mismatches = count_mismatches(grid, reference); mismatches != 0) {
      spdlog::error("{}: {} of {} pixels differ from the scalar reference",
                    backend.slug,
                    mismatches,
                    grid.size());
      return EXIT_FAILED;
    }
    spdlog::info("{}: matches the scalar reference", backend.slug);
  }

  if (options.write_image) {
    auto const path = options.output_path();
    brotbench::save_image(brotbench::render(grid, options.max_iterations, options.palette), path);
    spdlog::info("saved to {}", path.string());
  }
  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[]) {
  auto options = brotbench::cli::Options{};
  try {
    options = brotbench::cli::parse_options(argc, argv);
  } catch (brotbench::InvalidArgument const &e) {
    spdlog::error("{}", e.what());
    std::cerr << brotbench::cli::USAGE;
    return EXIT_USAGE;
  }

  if (options.help) {
    std::cout << brotbench::cli::USAGE;
    return EXIT_SUCCESS;
  }
  spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);

  try {
    return run(options);
  } catch (brotbench::InvalidArgument const &e) {
    spdlog::error("{}", e.what());
    return EXIT_USAGE;
  } catch (brotbench::ImageWriteError const &e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILED;
  } catch (std::bad_alloc const &) {
    spdlog::error(
        "out of memory for a {}x{} grid", options.viewport.width, options.viewport.height
    );
    return EXIT_FAILED;
  }
}
