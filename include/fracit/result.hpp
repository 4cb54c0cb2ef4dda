#pragma once

#include <complex>
#include <functional>

namespace fracit {

using point = std::complex<double>;

// f: C -> C
using complex_map = std::function<point(point)>;

struct result {
  point z{};                  // final iterate
  point c{};                  // parameter actually used
  int iterations = 0;         // in [0, max_iterations - 1]
  double smooth_factor = 0.0; // reserved
};

} // namespace fracit
