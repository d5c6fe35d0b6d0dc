#include <doctest/doctest.h>

#include "brotbench/backends/scalar.hpp"
#include "brotbench/viewport.hpp"

#include <cmath>
#include <cstddef>
#include <format>
#include <limits>
#include <string>

TEST_CASE("viewport: corner anchor follows the affine pixel mapping") {
  auto const viewport = brotbench::Viewport{8, 4, -2.0, 2.0, -1.0, 1.0};

  CHECK(viewport.real_at(0) == -2.0);
  CHECK(viewport.real_at(2) == -1.0);
  CHECK(viewport.real_at(7) == 1.5);
  CHECK(viewport.imag_at(0) == -1.0);
  CHECK(viewport.imag_at(3) == 0.5);
  CHECK(viewport.pixel_count() == 32);
}

TEST_CASE("viewport: center anchor samples the middle of each pixel") {
  auto const viewport = brotbench::Viewport{4, 2, 0.0, 4.0, 0.0, 2.0, brotbench::Anchor::center};

  CHECK(viewport.real_at(0) == 0.5);
  CHECK(viewport.real_at(3) == 3.5);
  CHECK(viewport.imag_at(1) == 1.5);
}

TEST_CASE("viewport: inclusive anchor reaches both bounds") {
  auto const viewport =
      brotbench::Viewport{5, 3, -2.5, 1.0, -1.0, 1.0, brotbench::Anchor::inclusive};

  CHECK(viewport.real_at(0) == -2.5);
  CHECK(viewport.real_at(4) == 1.0);
  CHECK(viewport.imag_at(0) == -1.0);
  CHECK(viewport.imag_at(1) == 0.0);
  CHECK(viewport.imag_at(2) == 1.0);

  auto const single = brotbench::Viewport{1, 1, -2.5, 1.0, -1.0, 1.0, brotbench::Anchor::inclusive};
  CHECK(single.sample(0, 0) == std::complex<double>{-2.5, -1.0});
}

TEST_CASE("viewport: mirrored rows sample exact conjugates") {
  auto const viewport = brotbench::standard_viewport(3, 10);
  for (std::size_t y = 1; y != viewport.height; ++y) {
    CHECK(viewport.imag_at(y) == -viewport.imag_at(viewport.height - y));
  }
}

TEST_CASE("viewport: validation") {
  CHECK_NOTHROW(brotbench::validate(brotbench::standard_viewport(1, 1)));

  auto viewport = brotbench::standard_viewport(10, 10);
  viewport.re_min = 2.0;
  CHECK_THROWS_AS(brotbench::validate(viewport), brotbench::InvalidArgument);
  CHECK_THROWS_WITH_AS(
      brotbench::validate(brotbench::standard_viewport(0, 5)),
      "viewport must be at least 1x1 pixels, got 0x5",
      brotbench::InvalidArgument
  );
}

TEST_CASE("viewport: pixel count must not overflow") {
  auto const huge = std::numeric_limits<std::size_t>::max();

  auto viewport = brotbench::standard_viewport(huge, 2);
  auto const message = std::format("viewport of {}x2 pixels is too large", huge);
  CHECK_THROWS_WITH_AS(
      brotbench::validate(viewport), message.c_str(), brotbench::InvalidArgument
  );

  // 2^(digits/2) squared wraps to 0
  viewport.width = std::size_t{1} << (std::numeric_limits<std::size_t>::digits / 2);
  viewport.height = viewport.width;
  CHECK(viewport.pixel_count() == 0);
  CHECK_THROWS_AS(brotbench::validate(viewport), brotbench::InvalidArgument);
  CHECK_THROWS_AS(
      (void)brotbench::scalar::evaluate(viewport, 4), brotbench::InvalidArgument
  );

  CHECK_NOTHROW(brotbench::validate(brotbench::standard_viewport(brotbench::MAX_PIXELS, 1)));
  CHECK_THROWS_AS(
      brotbench::validate(brotbench::standard_viewport(brotbench::MAX_PIXELS / 2 + 1, 2)),
      brotbench::InvalidArgument
  );
}

TEST_CASE("viewport: framed around a center point") {
  auto const viewport = brotbench::framed_viewport(200, 100, {-0.5, 0.25}, 1.0);

  CHECK(viewport.re_min == doctest::Approx(-3.5));
  CHECK(viewport.re_max == doctest::Approx(2.5));
  CHECK(viewport.im_min == doctest::Approx(-1.25));
  CHECK(viewport.im_max == doctest::Approx(1.75));
  CHECK_NOTHROW(brotbench::validate(viewport));

  CHECK_THROWS_AS((void)brotbench::framed_viewport(10, 10, {}, 0.0), brotbench::InvalidArgument);
}

TEST_CASE("viewport: framed views at extreme zoom fail validation") {
  // zoomed out until the bounds overflow to infinity
  auto const overflowed = brotbench::framed_viewport(800, 600, {-0.7, 0.0}, 1e-310);
  CHECK_FALSE(std::isfinite(overflowed.re_max));
  CHECK_THROWS_WITH_AS(
      brotbench::validate(overflowed),
      "viewport bounds must be finite",
      brotbench::InvalidArgument
  );

  // zoomed in until the range is below one ulp of the center
  auto const collapsed = brotbench::framed_viewport(800, 600, {-0.7, 0.1}, 1e30);
  CHECK(collapsed.re_min == collapsed.re_max);
  CHECK_THROWS_AS(brotbench::validate(collapsed), brotbench::InvalidArgument);

  // the zoom one step back is still a valid view
  CHECK_NOTHROW(brotbench::validate(brotbench::framed_viewport(800, 600, {-0.7, 0.0}, 0.8)));
}
