#pragma once

#include "fracit/result.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace fracit {

class results {
public:
  results(int rows, int cols, int capacity)
      : rows_(rows), cols_(cols), capacity_(capacity),
        data_(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols)) {}

  void set(int row, int col, result const &r) { data_[index(row, col)] = r; }

  [[nodiscard]] auto at(int row, int col) const -> result const & {
    return data_[index(row, col)];
  }

  [[nodiscard]] auto row(int r) -> std::span<result> {
    return std::span<result>{data_}.subspan(index(r, 0), static_cast<std::size_t>(cols_));
  }

  [[nodiscard]] auto row(int r) const -> std::span<result const> {
    return std::span<result const>{data_}.subspan(index(r, 0), static_cast<std::size_t>(cols_));
  }

  void seal() {
    if (sealed_) {
      return;
    }
    histogram_.assign(static_cast<std::size_t>(capacity_), 0);
    for (auto const &r : data_) {
      if (r.iterations >= 0 and r.iterations < capacity_) {
        ++histogram_[static_cast<std::size_t>(r.iterations)];
      }
    }
    sealed_ = true;
  }

  [[nodiscard]] auto rows() const noexcept -> int { return rows_; }
  [[nodiscard]] auto cols() const noexcept -> int { return cols_; }
  [[nodiscard]] auto capacity() const noexcept -> int { return capacity_; }
  [[nodiscard]] auto sealed() const noexcept -> bool { return sealed_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return data_.size(); }

  // histogram()[i] == number of records with iterations == i; empty until sealed
  [[nodiscard]] auto histogram() const noexcept -> std::vector<std::size_t> const & {
    return histogram_;
  }

  [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
  [[nodiscard]] auto end() const noexcept { return data_.cend(); }

private:
  [[nodiscard]] auto index(int row, int col) const noexcept -> std::size_t {
    return static_cast<std::size_t>(row) * static_cast<std::size_t>(cols_) +
           static_cast<std::size_t>(col);
  }

  int rows_;
  int cols_;
  int capacity_;
  std::vector<result> data_;
  std::vector<std::size_t> histogram_;
  bool sealed_ = false;
};

} // namespace fracit
