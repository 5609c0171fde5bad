#include "seiswave/medium/medium.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "seiswave/api/errors.hpp"

namespace seiswave {
namespace {

Field2D<double> checked_field(const Grid2D& grid, std::vector<double> values, const char* name) {
  if (values.size() != grid.total_points()) {
    std::ostringstream out;
    out << name << " field has " << values.size() << " values but grid " << grid.rows() << "x" << grid.cols()
        << " needs " << grid.total_points();
    throw InvalidMediumError(out.str());
  }
  return Field2D<double>(grid, std::move(values));
}

void require_positive(const Field2D<double>& field, const char* name) {
  for (std::size_t row = 0; row < field.rows(); ++row) {
    for (std::size_t col = 0; col < field.cols(); ++col) {
      const double value = field(row, col);
      if (!(value > 0.0) || !std::isfinite(value)) {
        std::ostringstream out;
        out << name << " must be positive and finite, got " << value << " at (" << row << ", " << col << ")";
        throw InvalidMediumError(out.str());
      }
    }
  }
}

Field2D<double> replicate_edges(const Field2D<double>& source, const Grid2D& target, std::size_t top, std::size_t left) {
  Field2D<double> out(target);
  const std::size_t last_row = source.rows() - 1;
  const std::size_t last_col = source.cols() - 1;
  for (std::size_t row = 0; row < target.rows(); ++row) {
    const std::size_t src_row = std::min(row < top ? 0 : row - top, last_row);
    for (std::size_t col = 0; col < target.cols(); ++col) {
      const std::size_t src_col = std::min(col < left ? 0 : col - left, last_col);
      out(row, col) = source(src_row, src_col);
    }
  }
  return out;
}

}  // namespace

Medium::Medium(const Grid2D& grid, std::vector<double> velocity, std::vector<double> density)
    : velocity_(checked_field(grid, std::move(velocity), "velocity")),
      density_(checked_field(grid, std::move(density), "density")) {
  validate();
}

Medium::Medium(Field2D<double> velocity, Field2D<double> density)
    : velocity_(std::move(velocity)), density_(std::move(density)) {
  if (!(velocity_.grid() == density_.grid())) {
    throw InvalidMediumError("velocity and density fields must share the same grid");
  }
  validate();
}

Medium Medium::uniform(const Grid2D& grid, double velocity, double density) {
  return Medium(Field2D<double>(grid, velocity), Field2D<double>(grid, density));
}

Medium Medium::layered(const Grid2D& grid, const std::vector<Layer>& layers) {
  if (layers.empty() || layers.front().top_row != 0) {
    throw InvalidMediumError("layered medium needs a first layer starting at row 0");
  }
  for (std::size_t i = 1; i < layers.size(); ++i) {
    if (layers[i].top_row <= layers[i - 1].top_row || layers[i].top_row >= grid.rows()) {
      std::ostringstream out;
      out << "layer " << i << " top row " << layers[i].top_row << " must increase and lie inside " << grid.rows()
          << " rows";
      throw InvalidMediumError(out.str());
    }
  }

  Field2D<double> velocity(grid);
  Field2D<double> density(grid);
  std::size_t layer = 0;
  for (std::size_t row = 0; row < grid.rows(); ++row) {
    while (layer + 1 < layers.size() && layers[layer + 1].top_row <= row) {
      ++layer;
    }
    for (std::size_t col = 0; col < grid.cols(); ++col) {
      velocity(row, col) = layers[layer].velocity;
      density(row, col) = layers[layer].density;
    }
  }
  return Medium(std::move(velocity), std::move(density));
}

Medium Medium::padded(std::size_t top, std::size_t bottom, std::size_t left, std::size_t right) const {
  const Grid2D target = grid().padded(top, bottom, left, right);
  return Medium(replicate_edges(velocity_, target, top, left), replicate_edges(density_, target, top, left));
}

void Medium::validate() {
  require_positive(velocity_, "velocity");
  require_positive(density_, "density");

  const auto [lowest, highest] = std::minmax_element(velocity_.data().begin(), velocity_.data().end());
  min_velocity_ = *lowest;
  max_velocity_ = *highest;
}

}  // namespace seiswave
