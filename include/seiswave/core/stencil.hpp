#pragma once

#include <cstddef>
#include <vector>

#include "seiswave/core/field.hpp"
#include "seiswave/medium/medium.hpp"

namespace seiswave {

// Largest Courant number v*dt/dx for which the explicit leapfrog update with
// the given spatial order stays bounded in 2D. Throws UnsupportedOrderError.
double stability_constant(std::size_t spatial_order);

// Central second-derivative weights for the 2D Laplacian, already scaled by
// 1/dx^2. weights()[0] is the centre weight of one axis and weights()[k] the
// weight of the two neighbours at offset k along that axis.
class StencilCoefficients {
 public:
  static StencilCoefficients make(std::size_t spatial_order, double spacing);

  std::size_t order() const { return order_; }
  std::size_t half_width() const { return weights_.size() - 1; }
  double spacing() const { return spacing_; }
  double stability_constant() const { return stability_constant_; }
  const std::vector<double>& weights() const { return weights_; }

  // (dt * v)^2 per cell, the factor applied to the Laplacian each step.
  Field2D<double> update_weights(const Medium& medium, double dt) const;

  // Laplacian at `idx` of a row-major buffer with rows of length `stride`.
  // Every neighbour within half_width() of the cell must lie inside the buffer.
  double interior(const double* p, std::size_t idx, std::size_t stride) const {
    double sum = 2.0 * weights_[0] * p[idx];
    for (std::size_t k = 1; k < weights_.size(); ++k) {
      const std::size_t vertical = k * stride;
      sum += weights_[k] * ((p[idx - vertical] + p[idx + vertical]) + (p[idx - k] + p[idx + k]));
    }
    return sum;
  }

  // Laplacian at any cell. Neighbours past the edge wrap around when `wraps`
  // is set and read zero otherwise.
  double laplacian(const Field2D<double>& field, std::size_t row, std::size_t col, bool wraps = false) const;

 private:
  StencilCoefficients(std::size_t order, double spacing, std::vector<double> weights, double stability);

  std::size_t order_;
  double spacing_;
  std::vector<double> weights_;
  double stability_constant_;
};

}  // namespace seiswave
