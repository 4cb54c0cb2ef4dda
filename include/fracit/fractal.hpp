#pragma once

#include "fracit/config.hpp"
#include "fracit/error.hpp"
#include "fracit/result.hpp"

#include <cstddef>
#include <expected>
#include <span>

namespace fracit {

// evaluate and evaluate_row may run concurrently once configured.
class fractal {
public:
  virtual ~fractal() = default;

  [[nodiscard]] virtual auto evaluate(point p) const -> result = 0;

  // out.size() == points.size()
  virtual void evaluate_row(std::span<point const> points, std::span<result> out) const {
    for (std::size_t i = 0; i != points.size(); ++i) {
      out[i] = evaluate(points[i]);
    }
  }

  [[nodiscard]] virtual auto set_max_iterations(int n) -> std::expected<void, error> = 0;

  [[nodiscard]] virtual auto config() const noexcept -> iteration_config const & = 0;
};

} // namespace fracit
