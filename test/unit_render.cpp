#include <doctest/doctest.h>

#include "brotbench/colorize.hpp"
#include "brotbench/evaluate.hpp"
#include "brotbench/render.hpp"

#include <cmath>

namespace {

// 3x2 grid, max_iterations 10:
//   0  5 10
//  10  3  1
auto sample_grid() -> brotbench::IterationGrid {
  auto grid = brotbench::IterationGrid{3, 2};
  auto top = grid.row(0);
  top[0] = 0;
  top[1] = 5;
  top[2] = 10;
  auto bottom = grid.row(1);
  bottom[0] = 10;
  bottom[1] = 3;
  bottom[2] = 1;
  return grid;
}

} // namespace

TEST_CASE("render: polynomial palette colors every cell in grid order") {
  auto const grid = sample_grid();
  auto const pixels = brotbench::render(grid, 10);

  REQUIRE(pixels.width == 3);
  REQUIRE(pixels.height == 2);
  REQUIRE(pixels.rgba.size() == 3 * 2 * 4);
  for (std::size_t y = 0; y != 2; ++y) {
    for (std::size_t x = 0; x != 3; ++x) {
      CAPTURE(x);
      CAPTURE(y);
      CHECK(pixels.at(x, y) == brotbench::colorize(grid(x, y), 10));
      CHECK(pixels.rgba[(y * 3 + x) * 4 + 3] == 255);
    }
  }
}

TEST_CASE("render: hot palette is log-scaled against the most escaped cell") {
  auto const pixels = brotbench::render(sample_grid(), 10, brotbench::Palette::hot);

  auto const dark_red = brotbench::PixelColor{10, 0, 0};
  auto const white = brotbench::PixelColor{255, 255, 255};

  CHECK(pixels.at(1, 0) == white);    // 5 is the largest escaped count
  CHECK(pixels.at(2, 0) == dark_red); // in the set
  CHECK(pixels.at(0, 1) == dark_red);
  CHECK(pixels.at(0, 0) == dark_red); // log(0 + 1) == 0
  CHECK(pixels.at(1, 1) == brotbench::hot_colormap(std::log(4.0) / std::log(6.0)));
  CHECK(pixels.at(2, 1) == brotbench::hot_colormap(std::log(2.0) / std::log(6.0)));
}

TEST_CASE("render: hot palette with nothing escaped") {
  auto const grid = brotbench::evaluate(brotbench::Viewport{4, 4, -0.1, 0.1, -0.1, 0.1}, 50);
  auto const pixels = brotbench::render(grid, 50, brotbench::Palette::hot);
  for (std::size_t y = 0; y != 4; ++y) {
    for (std::size_t x = 0; x != 4; ++x) {
      CHECK(pixels.at(x, y) == brotbench::PixelColor{10, 0, 0});
    }
  }
}

TEST_CASE("render: hot colormap knots") {
  CHECK(brotbench::hot_colormap(0.0) == brotbench::PixelColor{10, 0, 0});
  CHECK(brotbench::hot_colormap(0.5) == brotbench::PixelColor{255, 91, 0});
  CHECK(brotbench::hot_colormap(1.0) == brotbench::PixelColor{255, 255, 255});
}

TEST_CASE("render: rejects counts above the bound") {
  auto const grid = sample_grid();
  CHECK_THROWS_AS((void)brotbench::render(grid, 9), brotbench::InvalidArgument);
  CHECK_THROWS_AS(
      (void)brotbench::render(grid, 9, brotbench::Palette::hot), brotbench::InvalidArgument
  );
  CHECK_THROWS_AS((void)brotbench::render(grid, 0), brotbench::InvalidArgument);
}
