#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "seiswave/api/config.hpp"
#include "seiswave/api/errors.hpp"

namespace seiswave {

// Widest stencil half-width is 2; five cells per axis keep every stencil read in range.
inline constexpr std::size_t kMinGridExtent = 5;

class Grid2D {
 public:
  explicit Grid2D(const GridSpec& spec) : rows_(spec.rows), cols_(spec.cols), spacing_(spec.spacing) {
    if (!(spacing_ > 0.0) || !std::isfinite(spacing_)) {
      throw InvalidMediumError("grid spacing must be positive and finite");
    }
    if (rows_ < kMinGridExtent || cols_ < kMinGridExtent) {
      throw InvalidMediumError("grid shape " + std::to_string(rows_) + "x" + std::to_string(cols_) +
                               " is smaller than the minimum " + std::to_string(kMinGridExtent) + " cells per axis");
    }
  }

  Grid2D(std::size_t rows, std::size_t cols, double spacing) : Grid2D(GridSpec{rows, cols, spacing}) {}

  std::size_t rows() const { return rows_; }
  std::size_t cols() const { return cols_; }
  double spacing() const { return spacing_; }
  std::size_t total_points() const { return rows_ * cols_; }

  double height() const { return static_cast<double>(rows_) * spacing_; }
  double width() const { return static_cast<double>(cols_) * spacing_; }

  bool contains(std::size_t row, std::size_t col) const { return row < rows_ && col < cols_; }

  std::size_t flatten(std::size_t row, std::size_t col) const {
    if (!contains(row, col)) {
      throw std::out_of_range("grid index (" + std::to_string(row) + ", " + std::to_string(col) + ") out of bounds");
    }
    return row * cols_ + col;
  }

  Grid2D padded(std::size_t top, std::size_t bottom, std::size_t left, std::size_t right) const {
    return Grid2D(rows_ + top + bottom, cols_ + left + right, spacing_);
  }

  GridExtent extent() const { return GridExtent{rows_, cols_, spacing_, width(), height()}; }

  friend bool operator==(const Grid2D& lhs, const Grid2D& rhs) {
    return lhs.rows_ == rhs.rows_ && lhs.cols_ == rhs.cols_ && lhs.spacing_ == rhs.spacing_;
  }

 private:
  std::size_t rows_;
  std::size_t cols_;
  double spacing_;
};

}  // namespace seiswave
