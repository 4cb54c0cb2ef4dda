#pragma once

#include "fracit/config.hpp"
#include "fracit/fractal.hpp"

#include <complex>
#include <expected>
#include <utility>

namespace fracit {

// z_{n+1} = B(z_n) - c_n, c_{n+1} = G(c_n), until |z_{n+1} - z_n| < epsilon
class polynomiograph final : public fractal {
public:
  polynomiograph(double epsilon, complex_map b, complex_map f, complex_map g)
      : epsilon_(epsilon), b_(std::move(b)), f_(std::move(f)), g_(std::move(g)) {}

  [[nodiscard]] auto evaluate(point p) const -> result override {
    auto const max_steps = config_.max_iterations() - 1;

    auto z = p;
    auto c = f_(p);
    auto iter = 0;
    while (iter < max_steps) {
      auto const z_next = b_(z) - c;
      if (std::abs(z_next - z) < epsilon_) {
        break;
      }
      c = g_(c);
      z = z_next;
      ++iter;
    }
    return result{z, c, iter, 0.0};
  }

  [[nodiscard]] auto set_max_iterations(int n) -> std::expected<void, error> override {
    return config_.set_max_iterations(n);
  }

  [[nodiscard]] auto config() const noexcept -> iteration_config const & override {
    return config_;
  }

  [[nodiscard]] auto epsilon() const noexcept -> double { return epsilon_; }

private:
  iteration_config config_;
  double epsilon_;
  complex_map b_;
  complex_map f_;
  complex_map g_;
};

[[nodiscard]] inline auto newton_unity_roots(int n) -> complex_map {
  return [n](point z) {
    auto zn1 = point{1.0};
    for (int k = 1; k < n; ++k) {
      zn1 *= z;
    }
    return z - (zn1 * z - 1.0) / (static_cast<double>(n) * zn1);
  };
}

} // namespace fracit
