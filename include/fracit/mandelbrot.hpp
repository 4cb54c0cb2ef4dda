#pragma once

#include "fracit/config.hpp"
#include "fracit/fractal.hpp"
#include "fracit/quadratic.hpp"
#include "fracit/simd.hpp"

#include <cstddef>
#include <expected>
#include <span>

namespace fracit {

// main cardioid or period-2 bulb
[[nodiscard]] inline auto in_cardioid_or_bulb(point c) noexcept -> bool {
  auto const re = c.real();
  auto const im = c.imag();
  auto const im2 = im * im;

  // q (q + (Re(c) - 1/4)) <= Im(c)^2 / 4
  auto const p = re - 0.25;
  auto const q = p * p + im2;
  if (q * (q + p) <= 0.25 * im2) {
    return true;
  }

  // (Re(c) + 1)^2 + Im(c)^2 <= (1/4)^2
  return (re + 1.0) * (re + 1.0) + im2 <= 0.0625;
}

class mandelbrot final : public fractal {
public:
  explicit mandelbrot(double radius = default_radius) : config_(radius, 2.0) {}

  [[nodiscard]] auto evaluate(point p) const -> result override {
    if (in_cardioid_or_bulb(p)) {
      return interior(p);
    }
    return quadratic_orbit(config_, point{}, p);
  }

  void evaluate_row(std::span<point const> points, std::span<result> out) const override {
    quadratic_orbit_row(
        config_,
        [&](std::size_t i) {
          if (in_cardioid_or_bulb(points[i])) {
            out[i] = interior(points[i]);
            return lane_seed{{}, {}, false};
          }
          return lane_seed{point{}, points[i], true};
        },
        out.first(points.size())
    );
  }

  [[nodiscard]] auto set_max_iterations(int n) -> std::expected<void, error> override {
    return config_.set_max_iterations(n);
  }

  [[nodiscard]] auto config() const noexcept -> iteration_config const & override {
    return config_;
  }

private:
  [[nodiscard]] auto interior(point p) const -> result {
    return result{p, point{}, config_.max_iterations() - 1};
  }

  iteration_config config_;
};

} // namespace fracit
