#pragma once

#include "fracit/domain.hpp"
#include "fracit/error.hpp"
#include "fracit/fractal.hpp"
#include "fracit/results.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include <exec/static_thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <stdexec/execution.hpp>

namespace fracit {

[[nodiscard]] inline auto worker_count() -> std::uint32_t {
  auto const n = std::thread::hardware_concurrency();
  if (n == 0) {
    spdlog::warn("fracit: hardware_concurrency() failed, using 1 worker");
    return 1;
  }
  return n;
}

namespace detail {

template <sample_domain Domain>
[[nodiscard]] auto prepare(Domain const &domain, fractal &variant, int max_iterations)
    -> std::expected<void, error> {
  if (auto configured = variant.set_max_iterations(max_iterations); not configured) {
    return configured;
  }
  if (domain.rows() < 1 or domain.cols() < 1) {
    return std::unexpected(make_error(
        errc::domain_shape,
        std::format(
            "the domain must be sampled at least once along each axis, got {}x{}",
            domain.cols(), domain.rows()
        )
    ));
  }
  return {};
}

template <sample_domain Domain>
[[nodiscard]] auto fetch_row(Domain const &domain, int row, std::span<point> out)
    -> std::expected<void, error> {
  for (std::size_t col = 0; col != out.size(); ++col) {
    auto p = domain.at(static_cast<int>(col), row);
    if (not p) {
      return std::unexpected(std::move(p.error()));
    }
    out[col] = *p;
  }
  return {};
}

// First domain fault of a run plus how much work it cost.
class fault_log {
public:
  void record(error e) {
    auto lock = std::lock_guard{mutex_};
    ++failed_rows_;
    if (not first_) {
      first_ = std::move(e);
    }
  }

  void skipped() { skipped_rows_.fetch_add(1, std::memory_order_relaxed); }

  [[nodiscard]] auto take() -> std::optional<error> {
    auto lock = std::lock_guard{mutex_};
    if (not first_) {
      return std::nullopt;
    }
    return make_error(
        errc::domain_access,
        std::format(
            "{} row(s) could not be sampled, {} row(s) skipped; first fault: {}",
            failed_rows_, skipped_rows_.load(std::memory_order_relaxed), first_->message
        )
    );
  }

private:
  std::mutex mutex_;
  std::optional<error> first_;
  int failed_rows_ = 0;
  std::atomic<int> skipped_rows_{0};
};

template <sample_domain Domain, stdexec::scheduler Scheduler>
[[nodiscard]] auto dispatch(Domain const &domain, fractal const &variant, Scheduler scheduler)
    -> std::expected<results, error> {
  auto const rows = domain.rows();
  auto const cols = domain.cols();
  auto const &config = variant.config();

  auto store = results(rows, cols, config.max_iterations());
  auto stop = std::stop_source{};
  auto faults = fault_log{};

  spdlog::debug(
      "fracit: evaluating {}x{} samples, at most {} iterations", cols, rows,
      config.max_iterations()
  );

  auto sender = stdexec::bulk_chunked(
      stdexec::schedule(scheduler),
      stdexec::par,
      static_cast<std::size_t>(rows),
      [&](std::size_t begin, std::size_t end) {
        auto points = std::vector<point>(static_cast<std::size_t>(cols));
        for (auto i = begin; i != end; ++i) {
          auto const row = static_cast<int>(i);
          if (stop.stop_requested()) {
            faults.skipped();
            continue;
          }
          auto fetched = fetch_row(domain, row, points);
          if (not fetched) {
            spdlog::error("fracit: row {}: {}", row, fetched.error().message);
            faults.record(std::move(fetched.error()));
            stop.request_stop();
            continue;
          }
          variant.evaluate_row(points, store.row(row));
        }
      }
  );

  stdexec::sync_wait(std::move(sender));

  if (auto fault = faults.take()) {
    return std::unexpected(std::move(*fault));
  }

  store.seal();
  spdlog::debug("fracit: {}x{} samples done", cols, rows);
  return store;
}

} // namespace detail

// Shape and configuration are checked before any work is scheduled.
template <sample_domain Domain, stdexec::scheduler Scheduler>
[[nodiscard]] auto run(Domain const &domain, fractal &variant, int max_iterations,
                       Scheduler scheduler) -> std::expected<results, error> {
  if (auto ready = detail::prepare(domain, variant, max_iterations); not ready) {
    return std::unexpected(std::move(ready.error()));
  }
  return detail::dispatch(domain, std::as_const(variant), std::move(scheduler));
}

template <sample_domain Domain>
[[nodiscard]] auto run(Domain const &domain, fractal &variant, int max_iterations)
    -> std::expected<results, error> {
  if (auto ready = detail::prepare(domain, variant, max_iterations); not ready) {
    return std::unexpected(std::move(ready.error()));
  }
  auto const workers = worker_count();
  spdlog::debug("fracit: starting pool with {} workers", workers);
  auto pool = exec::static_thread_pool(workers);
  return detail::dispatch(domain, std::as_const(variant), pool.get_scheduler());
}

} // namespace fracit
