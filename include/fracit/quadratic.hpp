#pragma once

#include "fracit/config.hpp"
#include "fracit/result.hpp"

#include <tuple>

namespace fracit {

// Mirrored op for op by quadratic_orbit_row; keep the two in step.
[[nodiscard]] inline auto quadratic_orbit(iteration_config const &cfg, point z0, point c)
    -> result {
  auto const a = c.real();
  auto const b = c.imag();
  auto const r2 = cfg.radius() * cfg.radius();
  auto const max_steps = cfg.max_iterations() - 1;

  auto iter = 0;

  auto x = z0.real();
  auto y = z0.imag();
  auto x2 = x * x;
  auto y2 = y * y;
  while (iter < max_steps and x2 + y2 <= r2) {
    auto const x_next = x2 - y2 + a;
    auto const xy2 = 2.0 * x * y;
    auto const y_next = xy2 + b;
    std::tie(x, y) = std::tie(x_next, y_next);
    x2 = x * x; // reused by the loop check
    y2 = y * y;
    ++iter;
  }
  return result{point{x, y}, c, iter};
}

} // namespace fracit
