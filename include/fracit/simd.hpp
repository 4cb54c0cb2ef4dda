#pragma once

#include "fracit/config.hpp"
#include "fracit/result.hpp"

#include <algorithm>
#include <cstddef>
#include <span>

#include <xsimd/xsimd.hpp>

namespace fracit {

// Starting state of one lane. Inactive lanes are not iterated and their
// output slot is left untouched.
struct lane_seed {
  point z0;
  point c;
  bool active = true;
};

// seed(i) yields the starting state of point i
template <typename Seed>
void quadratic_orbit_row(iteration_config const &cfg, Seed &&seed, std::span<result> out) {
  using batch = xsimd::batch<double>;
  constexpr auto width = batch::size;

  auto const r2 = batch(cfg.radius() * cfg.radius());
  auto const max_steps = static_cast<double>(cfg.max_iterations() - 1);
  auto const limit = batch(max_steps);
  auto const two = batch(2.0);
  auto const one = batch(1.0);

  alignas(alignof(batch)) double xs[width];
  alignas(alignof(batch)) double ys[width];
  alignas(alignof(batch)) double as[width];
  alignas(alignof(batch)) double bs[width];
  alignas(alignof(batch)) double its[width];
  bool active[width];

  for (std::size_t base = 0; base < out.size(); base += width) {
    auto const lanes = std::min(width, out.size() - base);
    for (std::size_t i = 0; i != width; ++i) {
      auto const s = i < lanes ? seed(base + i) : lane_seed{{}, {}, false};
      xs[i] = s.z0.real();
      ys[i] = s.z0.imag();
      as[i] = s.c.real();
      bs[i] = s.c.imag();
      its[i] = s.active ? 0.0 : max_steps;
      active[i] = s.active;
    }

    auto const a = batch::load_aligned(as);
    auto const b = batch::load_aligned(bs);
    auto x = batch::load_aligned(xs);
    auto y = batch::load_aligned(ys);
    auto iter = batch::load_aligned(its);

    auto x2 = x * x;
    auto y2 = y * y;
    for (;;) {
      auto const running = (iter < limit) & ((x2 + y2) <= r2);
      if (xsimd::none(running)) {
        break;
      }

      auto const x_next = x2 - y2 + a;
      auto const xy2 = two * x * y;
      auto const y_next = xy2 + b;

      // Only update where still running
      x = xsimd::select(running, x_next, x);
      y = xsimd::select(running, y_next, y);
      x2 = x * x;
      y2 = y * y;
      iter = xsimd::select(running, iter + one, iter);
    }

    x.store_aligned(xs);
    y.store_aligned(ys);
    iter.store_aligned(its);
    for (std::size_t i = 0; i != lanes; ++i) {
      if (active[i]) {
        out[base + i] = result{point{xs[i], ys[i]}, point{as[i], bs[i]}, static_cast<int>(its[i])};
      }
    }
  }
}

} // namespace fracit
