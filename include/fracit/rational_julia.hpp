#pragma once

#include "fracit/config.hpp"
#include "fracit/fractal.hpp"

#include <complex>
#include <expected>
#include <utility>

namespace fracit {

// A pole gives inf or NaN, which counts as escaped.
class rational_julia final : public fractal {
public:
  rational_julia(double radius, complex_map p, complex_map q, point c,
                 double degree = default_degree)
      : config_(radius, degree), p_(std::move(p)), q_(std::move(q)), c_(c) {}

  [[nodiscard]] auto evaluate(point p) const -> result override {
    auto const radius = config_.radius();
    auto const max_steps = config_.max_iterations() - 1;

    auto z = p;
    auto iter = 0;
    while (iter < max_steps and std::abs(z) <= radius) {
      z = p_(z) / q_(z) + c_;
      ++iter;
    }
    return result{z, c_, iter};
  }

  [[nodiscard]] auto set_max_iterations(int n) -> std::expected<void, error> override {
    return config_.set_max_iterations(n);
  }

  [[nodiscard]] auto config() const noexcept -> iteration_config const & override {
    return config_;
  }

  void set_degree(double d) { config_.set_degree(d); }

private:
  iteration_config config_;
  complex_map p_;
  complex_map q_;
  point c_;
};

} // namespace fracit
