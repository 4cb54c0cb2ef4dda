#include <doctest/doctest.h>

#include "fracit/config.hpp"
#include "fracit/mandelbrot.hpp"
#include "fracit/palette.hpp"
#include "fracit/polynomiograph.hpp"

#include <cmath>
#include <complex>

namespace {

auto config_with(int max_iterations) -> fracit::iteration_config {
  auto cfg = fracit::iteration_config{2.0};
  REQUIRE(cfg.set_max_iterations(max_iterations).has_value());
  return cfg;
}

} // namespace

TEST_CASE("palette: hsv primaries") {
  CHECK(fracit::hsv(0.0, 1.0, 1.0) == fracit::rgb{255, 0, 0});
  CHECK(fracit::hsv(120.0, 1.0, 1.0) == fracit::rgb{0, 255, 0});
  CHECK(fracit::hsv(240.0, 1.0, 1.0) == fracit::rgb{0, 0, 255});
  CHECK(fracit::hsv(360.0, 1.0, 1.0) == fracit::rgb{255, 0, 0});
  CHECK(fracit::hsv(42.0, 0.0, 1.0) == fracit::rgb{255, 255, 255});
  CHECK(fracit::hsv(42.0, 0.7, 0.0) == fracit::rgb{0, 0, 0});
}

TEST_CASE("palette: lerp") {
  auto const a = fracit::rgb{0, 100, 200};
  auto const b = fracit::rgb{100, 100, 0};
  CHECK(fracit::lerp(a, b, 0.0) == a);
  CHECK(fracit::lerp(a, b, 1.0) == b);
  CHECK(fracit::lerp(a, b, 0.5) == fracit::rgb{50, 100, 100});
}

TEST_CASE("palette: smooth iterations") {
  auto const cfg = config_with(100);

  SUBCASE("bounded records keep their count") {
    CHECK(fracit::smooth_iterations({{0.1, 0.0}, {}, 99}, cfg) == 99.0);
  }

  SUBCASE("escaped records are renormalized") {
    auto const z = fracit::point{100.0, 0.0};
    auto const expected = 10.0 + 1.0 - std::log(std::log(100.0)) / std::log(2.0);
    CHECK(fracit::smooth_iterations({z, {}, 10}, cfg) == doctest::Approx(expected));
  }

  SUBCASE("non-finite orbits keep their count") {
    auto const z = fracit::point{INFINITY, 0.0};
    CHECK(fracit::smooth_iterations({z, {}, 4}, cfg) == 4.0);
  }
}

TEST_CASE("palette: converged newton records keep their count") {
  auto sut = fracit::polynomiograph{
      fracit::default_epsilon,
      fracit::newton_unity_roots(3),
      [](fracit::point) { return fracit::point{}; },
      [](fracit::point c) { return c; },
  };
  REQUIRE(sut.set_max_iterations(64).has_value());

  // these land just above and just below |z| = 1
  for (auto const p : {fracit::point{2.0, 0.0}, fracit::point{2.0, 0.01}, fracit::point{1.9, 0.0},
                       fracit::point{2.1, 0.0}, fracit::point{0.6, 0.0}}) {
    CAPTURE(p.real());
    CAPTURE(p.imag());
    auto const converged = sut.evaluate(p);
    REQUIRE(converged.iterations < 63);
    CHECK(std::abs(std::abs(converged.z) - 1.0) < 1e-5);
    CHECK(fracit::smooth_iterations(converged, sut.config()) ==
          static_cast<double>(converged.iterations));
  }
}

TEST_CASE("palette: bounded points are black") {
  auto const cfg = config_with(50);
  auto const bounded = fracit::result{{0.0, 0.0}, {}, 49};

  CHECK(fracit::spectrum().color(bounded, cfg) == fracit::rgb{});
  CHECK(fracit::pretty_bands().color(bounded, cfg) == fracit::rgb{});
  CHECK(fracit::pretty_blends2().color(bounded, cfg) == fracit::rgb{});
  CHECK(fracit::bw_stripes().color(bounded, cfg) == fracit::rgb{});
}

TEST_CASE("palette: spectrum starts at red") {
  auto const cfg = config_with(50);
  CHECK(fracit::spectrum().color({{0.5, 0.0}, {}, 0}, cfg) == fracit::rgb{255, 0, 0});
}

TEST_CASE("palette: bands") {
  auto const cfg = config_with(11);
  auto const black = fracit::rgb{0, 0, 0};
  auto const white = fracit::rgb{255, 255, 255};

  // |z| <= 1 keeps the raw count, so positions are exact
  auto const at = [](int iterations) { return fracit::result{{0.5, 0.0}, {}, iterations}; };

  SUBCASE("banded") {
    auto const sut = fracit::bw_bands();
    CHECK(sut.color(at(0), cfg) == black);
    CHECK(sut.color(at(4), cfg) == black);
    CHECK(sut.color(at(6), cfg) == white);
  }

  SUBCASE("blended") {
    auto const sut = fracit::bw_blends();
    CHECK(sut.color(at(0), cfg) == black);
    CHECK(sut.color(at(5), cfg) == fracit::rgb{128, 128, 128});
  }

  SUBCASE("periodic") {
    auto const sut = fracit::bw_stripes();
    CHECK(sut.color(at(0), cfg) == black);
    CHECK(sut.color(at(1), cfg) == white);
    CHECK(sut.color(at(2), cfg) == black);
    CHECK(sut.color(at(7), cfg) == white);
  }

  SUBCASE("longer period") {
    auto const sut = fracit::periodic_palette{2.0, fracit::bw_bands()};
    CHECK(sut.color(at(1), cfg) == black);
    CHECK(sut.color(at(2), cfg) == white);
    CHECK(sut.color(at(4), cfg) == black);
  }
}

TEST_CASE("palette: colours a real escape record") {
  auto sut = fracit::mandelbrot{2.0};
  REQUIRE(sut.set_max_iterations(100).has_value());
  auto const escaped = sut.evaluate({0.5, 0.5});
  REQUIRE(escaped.iterations < 99);
  CHECK_FALSE(fracit::spectrum().color(escaped, sut.config()) == fracit::rgb{});
}
