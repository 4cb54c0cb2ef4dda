#include "fracit/fracit.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <complex>
#include <format>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <vector>

#include <exec/static_thread_pool.hpp>

struct TestPoint {
  fracit::point point;
  std::string_view name;
};

constexpr TestPoint test_points[] = {
    {{-1.3, 0.0}, "WorstCase"},   // Will run full iterations
    {{-0.75, 0.01}, "EdgeCase"},  // Medium iterations
    {{2.0, 2.0}, "BestCase"},     // Will escape quickly
};

constexpr auto MAX_ITER = 10'000;
constexpr auto WIDTH = 1920;
constexpr auto HEIGHT = 1080;
static auto THREAD_COUNT = std::thread::hardware_concurrency();

/// Global state
static std::unique_ptr<exec::static_thread_pool> pool;

/// Setup and Teardown
static void MTSetup(const benchmark::State &state) {
  pool = std::make_unique<exec::static_thread_pool>(state.range(1));
}
static void MTTeardown(const benchmark::State &state) { pool.reset(); }

template <typename Fractal>
static auto configured(Fractal f) -> Fractal {
  if (auto ok = f.set_max_iterations(MAX_ITER); not ok) {
    throw std::runtime_error(ok.error().message);
  }
  return f;
}

static auto make_mandelbrot() { return configured(fracit::mandelbrot{fracit::default_radius}); }

static auto make_julia() {
  return configured(fracit::julia{fracit::default_radius, {-0.8, 0.156}});
}

static auto make_rational_julia() {
  return configured(fracit::rational_julia{
      fracit::default_radius,
      [](fracit::point z) { return z * z * z * z * z - 0.0625; },
      [](fracit::point z) { return z * z * z; },
      {0.0, 0.0},
  });
}

static auto make_newton() {
  return configured(fracit::polynomiograph{
      fracit::default_epsilon,
      fracit::newton_unity_roots(3),
      [](fracit::point) { return fracit::point{}; },
      [](fracit::point c) { return c; },
  });
}

/// Benchmarks
static void BM_Evaluate(benchmark::State &state, fracit::fractal const &sut, std::string_view name) {
  auto const &test_point = test_points[state.range(0)];
  auto c = test_point.point;
  state.SetLabel(std::format("{} [{}]", name, test_point.name));
  for (auto _ : state) {
    benchmark::DoNotOptimize(c);
    auto result = sut.evaluate(c);
    benchmark::DoNotOptimize(result);
  }
  state.counters["calc"] = benchmark::Counter(1, benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK_CAPTURE(BM_Evaluate, mandelbrot, make_mandelbrot(), "Mandelbrot")->DenseRange(0, 2);
BENCHMARK_CAPTURE(BM_Evaluate, julia, make_julia(), "Quadratic Julia")->DenseRange(0, 2);
BENCHMARK_CAPTURE(BM_Evaluate, rational_julia, make_rational_julia(), "Rational Julia")
    ->DenseRange(0, 2);
BENCHMARK_CAPTURE(BM_Evaluate, newton, make_newton(), "Newton z^3 - 1")->DenseRange(0, 2);

// One row of identical points, scalar loop versus SIMD kernel.
static void BM_Row(benchmark::State &state) {
  auto const sut = make_mandelbrot();
  auto const &test_point = test_points[state.range(0)];
  auto const simd = state.range(1) != 0;
  state.SetLabel(std::format("{} row [{}]", simd ? "SIMD" : "Scalar", test_point.name));

  auto points = std::vector<fracit::point>(WIDTH, test_point.point);
  auto out = std::vector<fracit::result>(WIDTH);
  for (auto _ : state) {
    if (simd) {
      sut.evaluate_row(points, out);
    } else {
      sut.fractal::evaluate_row(points, out);
    }
    benchmark::ClobberMemory();
  }
  state.counters["calc"] =
      benchmark::Counter(double(WIDTH), benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_Row)->ArgsProduct({{0, 1, 2}, {0, 1}});

static void BM_Run(benchmark::State &state) {
  state.SetLabel(std::format("Multithreaded full HD, {} threads", state.range(1)));

  auto sut = make_mandelbrot();
  auto const domain = fracit::grid::centered({-0.7, 0.0}, 3.0, WIDTH, HEIGHT);
  auto const max_iterations = static_cast<int>(state.range(0));

  auto scheduler = pool->get_scheduler();
  for (auto _ : state) {
    auto start = std::chrono::high_resolution_clock::now();
    auto store = fracit::run(domain, sut, max_iterations, scheduler);
    auto end = std::chrono::high_resolution_clock::now();
    if (not store) {
      state.SkipWithError(store.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(store);
    auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(end - start);
    state.SetIterationTime(elapsed_seconds.count());
  }
  state.counters["calc"] =
      benchmark::Counter(double(WIDTH * HEIGHT), benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_Run)
    ->UseManualTime()
    ->Setup(MTSetup)
    ->Teardown(MTTeardown)
    ->Args({256, 1})
    ->Args({256, THREAD_COUNT})
    ->Args({1'000, THREAD_COUNT});

BENCHMARK_MAIN();
