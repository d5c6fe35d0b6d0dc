#include <doctest/doctest.h>

#include "brotbench/colorize.hpp"

TEST_CASE("colorize: points in the set are black") {
  for (auto max_iterations : {1uz, 10uz, 256uz, 10'000uz}) {
    CHECK(brotbench::colorize(max_iterations, max_iterations) == brotbench::PixelColor{0, 0, 0});
  }
}

TEST_CASE("colorize: polynomial channels") {
  // t = 0.5
  CHECK(brotbench::colorize(50, 100) == brotbench::PixelColor{143, 239, 135});
  // t = 0.25
  CHECK(brotbench::colorize(1, 4) == brotbench::PixelColor{27, 134, 229});
  // t = 0.75
  CHECK(brotbench::colorize(3, 4) == brotbench::PixelColor{242, 134, 25});
}

TEST_CASE("colorize: zero iterations") {
  // every channel carries a factor of t
  auto const first = brotbench::colorize(0, 256);
  CHECK(first == brotbench::colorize(0, 256));
  CHECK(first == brotbench::PixelColor{0, 0, 0});
  CHECK(brotbench::colorize(1, 256) != brotbench::PixelColor{0, 0, 0});
}

TEST_CASE("colorize: rejects out-of-range input") {
  CHECK_THROWS_AS((void)brotbench::colorize(0, 0), brotbench::InvalidArgument);
  CHECK_THROWS_AS((void)brotbench::colorize(11, 10), brotbench::InvalidArgument);
}
