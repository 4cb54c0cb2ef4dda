#include <doctest/doctest.h>

#include "fracit/julia.hpp"
#include "fracit/mandelbrot.hpp"
#include "fracit/rational_julia.hpp"
#include "helpers.hpp"

#include <cmath>
#include <limits>

TEST_CASE("julia: origin is a fixed point of z^2") {
  for (auto const max_iterations : {1, 3, 1'000}) {
    auto sut = fracit::julia{2.0, {0.0, 0.0}};
    REQUIRE(sut.set_max_iterations(max_iterations).has_value());
    CHECK(sut.evaluate({0.0, 0.0}).iterations == max_iterations - 1);
  }
}

TEST_CASE("julia: sample point is the starting value") {
  auto sut = fracit::julia{2.0, {0.0, 0.0}};
  REQUIRE(sut.set_max_iterations(100).has_value());

  CHECK(sut.evaluate({3.0, 0.0}).iterations == 0);

  auto const result = sut.evaluate({1.5, 0.0});
  CHECK(result.iterations == 1);
  CHECK(result.z == fracit::point{2.25, 0.0});
  CHECK(result.c == fracit::point{0.0, 0.0});
}

TEST_CASE("julia: parameter is fixed") {
  auto const c = fracit::point{-0.8, 0.156};
  auto sut = fracit::julia{2.0, c};
  REQUIRE(sut.set_max_iterations(64).has_value());
  CHECK(sut.parameter() == c);
  CHECK(sut.evaluate({0.1, 0.2}).c == c);
  CHECK(sut.evaluate({-1.1, 0.7}).c == c);
}

TEST_CASE("julia: mirrors mandelbrot with the roles swapped") {
  auto const c = fracit::point{0.3, 0.5};
  REQUIRE_FALSE(fracit::in_cardioid_or_bulb(c));

  auto m = fracit::mandelbrot{2.0};
  auto j = fracit::julia{2.0, c};
  REQUIRE(m.set_max_iterations(500).has_value());
  REQUIRE(j.set_max_iterations(500).has_value());

  CHECK(fracit::test::same_bits(m.evaluate(c), j.evaluate({0.0, 0.0})));
}

TEST_CASE("rational julia: polynomial map behaves like the quadratic family") {
  auto sut = fracit::rational_julia{
      2.0,
      [](fracit::point z) { return z * z; },
      [](fracit::point) { return fracit::point{1.0, 0.0}; },
      {0.0, 0.0},
  };
  REQUIRE(sut.set_max_iterations(50).has_value());

  CHECK(sut.evaluate({0.0, 0.0}).iterations == 49);

  // modulus, not squared modulus, against the radius
  auto const result = sut.evaluate({1.5, 0.0});
  CHECK(result.iterations == 1);
  CHECK(result.z == fracit::point{2.25, 0.0});
}

TEST_CASE("rational julia: a pole counts as escape") {
  auto sut = fracit::rational_julia{
      2.0,
      [](fracit::point) { return fracit::point{1.0, 0.0}; },
      [](fracit::point) { return fracit::point{0.0, 0.0}; },
      {0.0, 0.0},
  };
  REQUIRE(sut.set_max_iterations(50).has_value());

  auto const result = sut.evaluate({0.5, 0.0});
  CHECK(result.iterations == 1);
  CHECK_FALSE(std::isfinite(std::abs(result.z)));
}

TEST_CASE("rational julia: NaN counts as escape") {
  auto sut = fracit::rational_julia{
      2.0,
      [](fracit::point) {
        return fracit::point{std::numeric_limits<double>::quiet_NaN(), 0.0};
      },
      [](fracit::point) { return fracit::point{1.0, 0.0}; },
      {0.0, 0.0},
  };
  REQUIRE(sut.set_max_iterations(50).has_value());
  CHECK(sut.evaluate({0.5, 0.0}).iterations == 1);
}

TEST_CASE("rational julia: a single iteration allows no steps") {
  auto sut = fracit::rational_julia{
      2.0,
      [](fracit::point z) { return z * z * z; },
      [](fracit::point z) { return z; },
      {0.25, 0.0},
      3.0,
  };
  REQUIRE(sut.set_max_iterations(1).has_value());
  auto const result = sut.evaluate({0.5, 0.5});
  CHECK(result.iterations == 0);
  CHECK(result.z == fracit::point{0.5, 0.5});
  CHECK(sut.config().degree() == 3.0);
}
