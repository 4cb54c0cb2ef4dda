#pragma once

#include "fracit/config.hpp"
#include "fracit/fractal.hpp"
#include "fracit/quadratic.hpp"
#include "fracit/simd.hpp"

#include <cstddef>
#include <expected>
#include <span>

namespace fracit {

class julia final : public fractal {
public:
  julia(double radius, point c) : config_(radius, 2.0), c_(c) {}

  [[nodiscard]] auto evaluate(point p) const -> result override {
    return quadratic_orbit(config_, p, c_);
  }

  void evaluate_row(std::span<point const> points, std::span<result> out) const override {
    quadratic_orbit_row(
        config_,
        [&](std::size_t i) { return lane_seed{points[i], c_, true}; },
        out.first(points.size())
    );
  }

  [[nodiscard]] auto set_max_iterations(int n) -> std::expected<void, error> override {
    return config_.set_max_iterations(n);
  }

  [[nodiscard]] auto config() const noexcept -> iteration_config const & override {
    return config_;
  }

  [[nodiscard]] auto parameter() const noexcept -> point { return c_; }

private:
  iteration_config config_;
  point c_;
};

} // namespace fracit
