#include <doctest/doctest.h>

#include "brotbench/brotbench.hpp"

#include <exec/static_thread_pool.hpp>

#include <string>

namespace {

// Widths around the SIMD lane count exercise the padded tail.
constexpr std::size_t widths[] = {1, 3, 7, 8, 9, 61};

} // namespace

TEST_CASE("backends: every backend reproduces the reference grid") {
  auto pool = exec::static_thread_pool(3);

  for (auto const &backend : brotbench::backends()) {
    for (auto const width : widths) {
      for (auto const anchor :
           {brotbench::Anchor::corner, brotbench::Anchor::center, brotbench::Anchor::inclusive}) {
        auto const viewport = brotbench::standard_viewport(width, 17, anchor);
        auto const slug = std::string{backend.slug};
        CAPTURE(slug);
        CAPTURE(width);
        CHECK(backend.evaluate(viewport, 120, pool) == brotbench::evaluate(viewport, 120));
      }
    }
  }
}

TEST_CASE("backends: zoomed view near the boundary") {
  auto pool = exec::static_thread_pool(4);
  auto const viewport = brotbench::framed_viewport(96, 64, {-0.7436, 0.1318}, 400.0);
  auto const reference = brotbench::evaluate(viewport, 2'000);

  for (auto const &backend : brotbench::backends()) {
    auto const slug = std::string{backend.slug};
    CAPTURE(slug);
    CHECK(backend.evaluate(viewport, 2'000, pool) == reference);
  }
}

TEST_CASE("backends: threaded evaluation with a single worker") {
  auto pool = exec::static_thread_pool(1);
  auto const viewport = brotbench::standard_viewport(33, 9);

  CHECK(brotbench::threaded::evaluate(viewport, 80, pool.get_scheduler()) ==
        brotbench::evaluate(viewport, 80));
  CHECK(brotbench::threaded_simd::evaluate(viewport, 80, pool.get_scheduler()) ==
        brotbench::evaluate(viewport, 80));
}

TEST_CASE("backends: malformed requests are rejected by every backend") {
  auto pool = exec::static_thread_pool(2);
  auto degenerate = brotbench::standard_viewport(8, 8);
  degenerate.im_max = degenerate.im_min;

  for (auto const &backend : brotbench::backends()) {
    auto const slug = std::string{backend.slug};
    CAPTURE(slug);
    CHECK_THROWS_AS(
        (void)backend.evaluate(brotbench::standard_viewport(8, 8), 0, pool),
        brotbench::InvalidArgument
    );
    CHECK_THROWS_AS((void)backend.evaluate(degenerate, 10, pool), brotbench::InvalidArgument);
  }
}

TEST_CASE("backends: registry lookup") {
  CHECK(brotbench::backends().size() == 5);
  CHECK(std::string{brotbench::find_backend("scalar").slug} == "scalar");
  CHECK(std::string{brotbench::find_backend("threaded-simd").name} == "Multithreaded + SIMD");
  CHECK_THROWS_AS((void)brotbench::find_backend("duckdb"), brotbench::InvalidArgument);
}
