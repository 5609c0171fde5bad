#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

#include "seiswave/core/grid.hpp"

namespace seiswave {

// Row-major scalar field over a Grid2D.
template <typename Scalar>
class Field2D {
 public:
  Field2D() = default;

  explicit Field2D(Grid2D grid, Scalar value = Scalar{})
      : grid_(std::move(grid)), values_(grid_.total_points(), value) {}

  Field2D(Grid2D grid, std::vector<Scalar> values) : grid_(std::move(grid)), values_(std::move(values)) {
    if (values_.size() != grid_.total_points()) {
      throw std::invalid_argument("Field2D value count does not match grid shape");
    }
  }

  void fill(Scalar value) { std::fill(values_.begin(), values_.end(), value); }

  const Grid2D& grid() const { return grid_; }
  std::size_t rows() const { return grid_.rows(); }
  std::size_t cols() const { return grid_.cols(); }
  std::size_t size() const { return values_.size(); }

  Scalar& at(std::size_t row, std::size_t col) { return values_[grid_.flatten(row, col)]; }
  const Scalar& at(std::size_t row, std::size_t col) const { return values_[grid_.flatten(row, col)]; }

  // Unchecked access for inner loops.
  Scalar& operator()(std::size_t row, std::size_t col) { return values_[row * grid_.cols() + col]; }
  const Scalar& operator()(std::size_t row, std::size_t col) const { return values_[row * grid_.cols() + col]; }

  std::vector<Scalar>& data() { return values_; }
  const std::vector<Scalar>& data() const { return values_; }

  // Independent copy of the window [row0, row0 + target.rows()) x [col0, col0 + target.cols()).
  Field2D crop(const Grid2D& target, std::size_t row0, std::size_t col0) const {
    if (row0 + target.rows() > rows() || col0 + target.cols() > cols()) {
      throw std::out_of_range("crop window exceeds field bounds");
    }
    Field2D out(target);
    for (std::size_t r = 0; r < target.rows(); ++r) {
      const auto first = values_.begin() + static_cast<std::ptrdiff_t>((row0 + r) * cols() + col0);
      std::copy(first, first + static_cast<std::ptrdiff_t>(target.cols()),
                out.values_.begin() + static_cast<std::ptrdiff_t>(r * target.cols()));
    }
    return out;
  }

 private:
  Grid2D grid_ = Grid2D(kMinGridExtent, kMinGridExtent, 1.0);
  std::vector<Scalar> values_ = std::vector<Scalar>(kMinGridExtent * kMinGridExtent, Scalar{});
};

}  // namespace seiswave
