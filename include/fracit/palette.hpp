#pragma once

#include "fracit/config.hpp"
#include "fracit/result.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace fracit {

struct rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  friend auto operator==(rgb, rgb) -> bool = default;
};

// h in degrees, s and v in [0, 1]
[[nodiscard]] inline auto hsv(double h, double s, double v) -> rgb {
  h = std::fmod(h, 360.0);
  if (h < 0.0) {
    h += 360.0;
  }
  auto const chroma = v * s;
  auto const sector = h / 60.0;
  auto const x = chroma * (1.0 - std::abs(std::fmod(sector, 2.0) - 1.0));
  auto const m = v - chroma;

  auto r = 0.0, g = 0.0, b = 0.0;
  switch (static_cast<int>(sector)) {
  case 0: r = chroma, g = x; break;
  case 1: r = x, g = chroma; break;
  case 2: g = chroma, b = x; break;
  case 3: g = x, b = chroma; break;
  case 4: r = x, b = chroma; break;
  default: r = chroma, b = x; break;
  }

  auto const to_byte = [m](double c) {
    return static_cast<std::uint8_t>(std::clamp(std::round(255.0 * (c + m)), 0.0, 255.0));
  };
  return rgb{to_byte(r), to_byte(g), to_byte(b)};
}

[[nodiscard]] inline auto lerp(rgb a, rgb b, double t) -> rgb {
  auto const mix = [t](std::uint8_t x, std::uint8_t y) {
    return static_cast<std::uint8_t>(std::clamp(std::round(x + t * (y - x)), 0.0, 255.0));
  };
  return rgb{mix(a.r, b.r), mix(a.g, b.g), mix(a.b, b.b)};
}

// n + 1 - ln(ln|z|) / ln(degree), for records that left the escape radius
[[nodiscard]] inline auto smooth_iterations(result const &r, iteration_config const &cfg)
    -> double {
  auto const n = static_cast<double>(r.iterations);
  if (r.iterations >= cfg.max_iterations() - 1) {
    return n;
  }
  auto const modulus = std::abs(r.z);
  // converged orbits end inside the radius
  if (not std::isfinite(modulus) or modulus <= std::max(1.0, cfg.radius())) {
    return n;
  }
  return std::max(0.0, n + 1.0 - std::log(std::log(modulus)) * cfg.inv_log_degree());
}

class palette {
public:
  virtual ~palette() = default;

  [[nodiscard]] auto color(result const &r, iteration_config const &cfg) const -> rgb {
    if (r.iterations >= cfg.max_iterations() - 1) {
      return rgb{};
    }
    return shade(smooth_iterations(r, cfg), cfg);
  }

protected:
  [[nodiscard]] static auto normalized(double iterations, iteration_config const &cfg)
      -> double {
    auto const span = static_cast<double>(std::max(1, cfg.max_iterations() - 1));
    return std::clamp(iterations / span, 0.0, 1.0);
  }

private:
  [[nodiscard]] virtual auto shade(double iterations, iteration_config const &cfg) const
      -> rgb = 0;
};

class spectral_palette final : public palette {
public:
  explicit spectral_palette(double sweep) : sweep_(sweep) {}

private:
  [[nodiscard]] auto shade(double iterations, iteration_config const &cfg) const
      -> rgb override {
    return hsv(sweep_ * normalized(iterations, cfg), 1.0, 1.0);
  }

  double sweep_;
};

// bands must not be empty
class banded_palette final : public palette {
public:
  explicit banded_palette(std::vector<rgb> bands, bool blended = false)
      : bands_(std::move(bands)), blended_(blended) {}

  [[nodiscard]] auto bands() const noexcept -> std::vector<rgb> const & { return bands_; }
  [[nodiscard]] auto blended() const noexcept -> bool { return blended_; }

  // position in [0, 1]
  [[nodiscard]] auto at(double position) const -> rgb {
    auto const n = bands_.size();
    if (not blended_) {
      auto const i = std::min(static_cast<std::size_t>(position * n), n - 1);
      return bands_[i];
    }
    auto const scaled = position * static_cast<double>(n - 1);
    auto const i = std::min(static_cast<std::size_t>(scaled), n - 1);
    auto const j = std::min(i + 1, n - 1);
    return lerp(bands_[i], bands_[j], scaled - static_cast<double>(i));
  }

private:
  [[nodiscard]] auto shade(double iterations, iteration_config const &cfg) const
      -> rgb override {
    return at(normalized(iterations, cfg));
  }

  std::vector<rgb> bands_;
  bool blended_;
};

class periodic_palette final : public palette {
public:
  periodic_palette(double period, banded_palette bands)
      : period_(period), bands_(std::move(bands)) {}

private:
  [[nodiscard]] auto shade(double iterations, iteration_config const &) const
      -> rgb override {
    auto const &colors = bands_.bands();
    auto const n = static_cast<double>(colors.size());
    auto const cycle = std::fmod(iterations / period_, n);
    auto const i = static_cast<std::size_t>(cycle);
    if (not bands_.blended()) {
      return colors[i];
    }
    return lerp(colors[i], colors[(i + 1) % colors.size()], cycle - static_cast<double>(i));
  }

  double period_;
  banded_palette bands_;
};

[[nodiscard]] inline auto spectrum() -> spectral_palette { return spectral_palette{360.0}; }

[[nodiscard]] inline auto pretty_bands() -> banded_palette {
  return banded_palette{{
      hsv(24.0, 0.38, 0.33),
      hsv(158.0, 0.48, 0.73),
      hsv(58.0, 0.72, 0.83),
      hsv(58.0, 0.32, 0.95),
      hsv(24.0, 0.86, 0.97),
  }};
}

// pretty_bands with extra orange tones
[[nodiscard]] inline auto pretty_bands2() -> banded_palette {
  return banded_palette{{
      hsv(27.0, 0.75, 0.25),
      hsv(188.0, 0.35, 0.82),
      hsv(175.0, 0.13, 0.91),
      hsv(35.0, 0.17, 0.85),
      hsv(52.0, 0.06, 1.00),
  }};
}

[[nodiscard]] inline auto bw_bands() -> banded_palette {
  return banded_palette{{hsv(0.0, 0.0, 0.0), hsv(0.0, 0.0, 1.0)}};
}

[[nodiscard]] inline auto blended(banded_palette const &bands) -> banded_palette {
  return banded_palette{bands.bands(), true};
}

[[nodiscard]] inline auto pretty_blends() -> banded_palette { return blended(pretty_bands()); }
[[nodiscard]] inline auto pretty_blends2() -> banded_palette { return blended(pretty_bands2()); }
[[nodiscard]] inline auto bw_blends() -> banded_palette { return blended(bw_bands()); }

[[nodiscard]] inline auto pretty_periodic() -> periodic_palette {
  return periodic_palette{1.0, pretty_bands()};
}

[[nodiscard]] inline auto pretty_periodic2() -> periodic_palette {
  return periodic_palette{10.0, pretty_bands2()};
}

[[nodiscard]] inline auto bw_stripes() -> periodic_palette {
  return periodic_palette{1.0, bw_bands()};
}

} // namespace fracit
