#pragma once

#include "fracit/result.hpp"

#include <bit>
#include <cstdint>

namespace fracit::test {

[[nodiscard]] inline auto same_bits(double a, double b) -> bool {
  return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

[[nodiscard]] inline auto same_bits(point a, point b) -> bool {
  return same_bits(a.real(), b.real()) and same_bits(a.imag(), b.imag());
}

// NaN-safe record equality
[[nodiscard]] inline auto same_bits(result const &a, result const &b) -> bool {
  return same_bits(a.z, b.z) and same_bits(a.c, b.c) and a.iterations == b.iterations and
         same_bits(a.smooth_factor, b.smooth_factor);
}

} // namespace fracit::test
