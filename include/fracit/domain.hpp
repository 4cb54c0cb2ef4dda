#pragma once

#include "fracit/error.hpp"
#include "fracit/result.hpp"

#include <concepts>
#include <expected>
#include <format>

namespace fracit {

template <typename D>
concept sample_domain = requires(D const &d, int col, int row) {
  { d.rows() } -> std::convertible_to<int>;
  { d.cols() } -> std::convertible_to<int>;
  { d.at(col, row) } -> std::same_as<std::expected<point, error>>;
};

// Row 0 is the top edge.
class grid {
public:
  grid(point min, point max, int cols, int rows)
      : min_(min), max_(max), cols_(cols), rows_(rows) {
    dx_ = cols_ > 1 ? (max_.real() - min_.real()) / (cols_ - 1) : 0.0;
    dy_ = rows_ > 1 ? (max_.imag() - min_.imag()) / (rows_ - 1) : 0.0;
  }

  // square pixels
  [[nodiscard]] static auto centered(point center, double width, int cols, int rows) -> grid {
    auto const height = cols > 1 ? width * (rows - 1) / (cols - 1) : width;
    auto const half = point{width / 2.0, height / 2.0};
    return grid{center - half, center + half, cols, rows};
  }

  [[nodiscard]] auto rows() const noexcept -> int { return rows_; }
  [[nodiscard]] auto cols() const noexcept -> int { return cols_; }

  [[nodiscard]] auto at(int col, int row) const -> std::expected<point, error> {
    if (col < 0 or col >= cols_ or row < 0 or row >= rows_) {
      return std::unexpected(make_error(
          errc::domain_access,
          std::format("sample ({}, {}) lies outside the {}x{} grid", col, row, cols_, rows_)
      ));
    }
    auto const re = cols_ > 1 ? min_.real() + col * dx_ : min_.real();
    auto const im = rows_ > 1 ? max_.imag() - row * dy_ : min_.imag();
    return point{re, im};
  }

  [[nodiscard]] auto min() const noexcept -> point { return min_; }
  [[nodiscard]] auto max() const noexcept -> point { return max_; }

private:
  point min_;
  point max_;
  int cols_;
  int rows_;
  double dx_;
  double dy_;
};

static_assert(sample_domain<grid>);

} // namespace fracit
