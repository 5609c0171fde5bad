#pragma once

#include <cstddef>
#include <vector>

#include "seiswave/core/field.hpp"
#include "seiswave/core/grid.hpp"

namespace seiswave {

// Horizontal layer starting at `top_row` and extending down to the next layer.
struct Layer {
  std::size_t top_row = 0;
  double velocity = 0.0;
  double density = 0.0;
};

// Isotropic acoustic medium: co-registered velocity (m/s) and density (kg/m^3)
// fields over a uniform grid. Immutable once constructed.
class Medium {
 public:
  // Throws InvalidMediumError when a field does not match the grid shape or
  // holds a non-positive or non-finite value.
  Medium(const Grid2D& grid, std::vector<double> velocity, std::vector<double> density);
  Medium(Field2D<double> velocity, Field2D<double> density);

  static Medium uniform(const Grid2D& grid, double velocity, double density);
  // Layers must start at row 0 with strictly increasing top rows inside the grid.
  static Medium layered(const Grid2D& grid, const std::vector<Layer>& layers);

  const Grid2D& grid() const { return velocity_.grid(); }

  double velocity(std::size_t row, std::size_t col) const { return velocity_.at(row, col); }
  double density(std::size_t row, std::size_t col) const { return density_.at(row, col); }

  const Field2D<double>& velocity_field() const { return velocity_; }
  const Field2D<double>& density_field() const { return density_; }

  double max_velocity() const { return max_velocity_; }
  double min_velocity() const { return min_velocity_; }

  // Extends the medium outward by replicating its edge cells.
  Medium padded(std::size_t top, std::size_t bottom, std::size_t left, std::size_t right) const;

 private:
  void validate();

  Field2D<double> velocity_;
  Field2D<double> density_;
  double max_velocity_ = 0.0;
  double min_velocity_ = 0.0;
};

}  // namespace seiswave
