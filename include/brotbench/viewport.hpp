#pragma once

#include "brotbench/error.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <format>
#include <limits>

namespace brotbench {

/// Where inside a pixel the complex sample point sits.
enum class Anchor {
  corner,    // re_min + x * (re_max - re_min) / width
  center,    // x + 0.5
  inclusive, // both bounds sampled, divides by width - 1
};

struct Viewport {
  std::size_t width = 0;
  std::size_t height = 0;
  double re_min = 0.0;
  double re_max = 0.0;
  double im_min = 0.0;
  double im_max = 0.0;
  Anchor anchor = Anchor::corner;

  [[nodiscard]] auto real_at(std::size_t x) const noexcept -> double {
    return axis_coordinate(re_min, re_max, x, width, anchor);
  }

  [[nodiscard]] auto imag_at(std::size_t y) const noexcept -> double {
    return axis_coordinate(im_min, im_max, y, height, anchor);
  }

  [[nodiscard]] auto sample(std::size_t x, std::size_t y) const noexcept
      -> std::complex<double> {
    return {real_at(x), imag_at(y)};
  }

  [[nodiscard]] auto pixel_count() const noexcept -> std::size_t { return width * height; }

  // Evaluated around the axis midpoint: algebraically lo + i * step, but the
  // samples of mirrored pixels come out as exact negatives when lo == -hi.
  [[nodiscard]] static auto axis_coordinate(
      double lo, double hi, std::size_t i, std::size_t n, Anchor anchor
  ) noexcept -> double {
    auto const mid = (lo + hi) / 2.0;
    auto const span = hi - lo;
    auto const index = static_cast<double>(i);
    auto const count = static_cast<double>(n);

    switch (anchor) {
    case Anchor::center:
      return mid + (index + 0.5 - count / 2.0) * (span / count);
    case Anchor::inclusive:
      if (n == 1) {
        return lo;
      }
      return mid + (index - (count - 1.0) / 2.0) * (span / (count - 1.0));
    case Anchor::corner:
      break;
    }
    return mid + (index - count / 2.0) * (span / count);
  }
};

/// Largest pixel count whose iteration grid fits a std::vector's size limit.
/// The RGBA buffer, at 4 bytes per pixel, is smaller still.
inline constexpr std::size_t MAX_PIXELS =
    static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max()) / sizeof(std::size_t);

inline void validate(Viewport const &viewport) {
  if (viewport.width == 0 or viewport.height == 0) {
    throw InvalidArgument(std::format(
        "viewport must be at least 1x1 pixels, got {}x{}", viewport.width, viewport.height
    ));
  }
  if (viewport.width > MAX_PIXELS / viewport.height) {
    throw InvalidArgument(std::format(
        "viewport of {}x{} pixels is too large", viewport.width, viewport.height
    ));
  }
  auto const finite = std::isfinite(viewport.re_min) and std::isfinite(viewport.re_max) and
                      std::isfinite(viewport.im_min) and std::isfinite(viewport.im_max);
  if (not finite) {
    throw InvalidArgument("viewport bounds must be finite");
  }
  if (not(viewport.re_max > viewport.re_min)) {
    throw InvalidArgument(std::format(
        "viewport real range is empty: [{}, {}]", viewport.re_min, viewport.re_max
    ));
  }
  if (not(viewport.im_max > viewport.im_min)) {
    throw InvalidArgument(std::format(
        "viewport imaginary range is empty: [{}, {}]", viewport.im_min, viewport.im_max
    ));
  }
}

/// re in [-2.5, 1.0], im in [-1.0, 1.0]
[[nodiscard]] inline auto standard_viewport(
    std::size_t width, std::size_t height, Anchor anchor = Anchor::corner
) -> Viewport {
  return {width, height, -2.5, 1.0, -1.0, 1.0, anchor};
}

inline constexpr double FRAME_SCALE = 3.0;

/// View of `width` x `height` pixels around `center`. At zoom 1 the shorter
/// side covers FRAME_SCALE units of the plane.
[[nodiscard]] inline auto framed_viewport(
    std::size_t width, std::size_t height, std::complex<double> center, double zoom
) -> Viewport {
  if (not(zoom > 0.0) or not std::isfinite(zoom)) {
    throw InvalidArgument(std::format("zoom must be positive, got {}", zoom));
  }
  auto const shorter = static_cast<double>(std::max<std::size_t>(1, std::min(width, height)));
  auto const scale = FRAME_SCALE / (zoom * shorter);
  auto const half_w = static_cast<double>(width) * scale / 2.0;
  auto const half_h = static_cast<double>(height) * scale / 2.0;
  return {
      width,
      height,
      center.real() - half_w,
      center.real() + half_w,
      center.imag() - half_h,
      center.imag() + half_h,
      Anchor::center,
  };
}

} // namespace brotbench
