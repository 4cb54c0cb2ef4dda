#pragma once

#include "fracit/error.hpp"

#include <cmath>
#include <expected>
#include <format>

namespace fracit {

inline constexpr double default_radius = 2.0;
inline constexpr int default_max_iterations = 1'000;
inline constexpr double default_degree = 2.0;
inline constexpr double default_epsilon = 1e-6;

class iteration_config {
public:
  iteration_config() { set_degree(default_degree); }

  explicit iteration_config(double radius, double degree = default_degree)
      : radius_(radius) {
    set_degree(degree);
  }

  [[nodiscard]] auto set_max_iterations(int n) -> std::expected<void, error> {
    if (n < 1) {
      return std::unexpected(make_error(
          errc::configuration,
          std::format("the maximum iteration count must be greater than zero, got {}", n)
      ));
    }
    max_iterations_ = n;
    return {};
  }

  // d > 0 and d != 1
  void set_degree(double d) {
    degree_ = d;
    inv_log_degree_ = 1.0 / std::log(d);
  }

  // r > 0
  void set_radius(double r) { radius_ = r; }

  [[nodiscard]] auto radius() const noexcept -> double { return radius_; }
  [[nodiscard]] auto max_iterations() const noexcept -> int { return max_iterations_; }
  [[nodiscard]] auto degree() const noexcept -> double { return degree_; }
  [[nodiscard]] auto inv_log_degree() const noexcept -> double { return inv_log_degree_; }

private:
  double radius_ = default_radius;
  int max_iterations_ = 1;
  double degree_ = default_degree;
  double inv_log_degree_ = 0.0;
};

} // namespace fracit
