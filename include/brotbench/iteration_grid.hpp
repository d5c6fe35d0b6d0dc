#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace brotbench {

/// Per-pixel iteration counts, row-major: (x, y) is stored at y * width + x.
/// Row 0 holds the samples at im_min.
class IterationGrid {
public:
  IterationGrid() = default;
  IterationGrid(std::size_t width, std::size_t height)
      : width_(width), height_(height), counts_(width * height) {}

  [[nodiscard]] auto width() const noexcept -> std::size_t { return width_; }
  [[nodiscard]] auto height() const noexcept -> std::size_t { return height_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return counts_.size(); }

  [[nodiscard]] auto operator()(std::size_t x, std::size_t y) const noexcept -> std::size_t {
    return counts_[y * width_ + x];
  }

  [[nodiscard]] auto row(std::size_t y) const noexcept -> std::span<std::size_t const> {
    return std::span{counts_}.subspan(y * width_, width_);
  }

  // Writable row, for the evaluators filling the grid.
  [[nodiscard]] auto row(std::size_t y) noexcept -> std::span<std::size_t> {
    return std::span{counts_}.subspan(y * width_, width_);
  }

  [[nodiscard]] auto values() const noexcept -> std::span<std::size_t const> { return counts_; }

  friend auto operator==(IterationGrid const &, IterationGrid const &) -> bool = default;

private:
  std::size_t width_ = 0;
  std::size_t height_ = 0;
  std::vector<std::size_t> counts_;
};

} // namespace brotbench
