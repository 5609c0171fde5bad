#include "seiswave/core/stencil.hpp"

#include <cmath>
#include <utility>

#include "seiswave/api/errors.hpp"

namespace seiswave {
namespace {

// 1D second-derivative weights on a unit grid, centre first.
std::vector<double> unit_weights(std::size_t order) {
  switch (order) {
    case 2:
      return {-2.0, 1.0};
    case 4:
      return {-5.0 / 2.0, 4.0 / 3.0, -1.0 / 12.0};
    default:
      throw UnsupportedOrderError(order);
  }
}

// Magnitude of the most negative eigenvalue of the 1D operator on a unit grid,
// reached at the Nyquist wavenumber.
double nyquist_eigenvalue(const std::vector<double>& weights) {
  double symbol = weights[0];
  for (std::size_t k = 1; k < weights.size(); ++k) {
    symbol += 2.0 * weights[k] * ((k % 2 == 1) ? -1.0 : 1.0);
  }
  return std::fabs(symbol);
}

}  // namespace

double stability_constant(std::size_t spatial_order) {
  // Leapfrog is stable while (v dt)^2 * |lambda_2d| <= 4, lambda_2d = 2 * lambda_1d / dx^2.
  const double lambda_2d = 2.0 * nyquist_eigenvalue(unit_weights(spatial_order));
  return std::sqrt(4.0 / lambda_2d);
}

StencilCoefficients StencilCoefficients::make(std::size_t spatial_order, double spacing) {
  std::vector<double> weights = unit_weights(spatial_order);
  if (!(spacing > 0.0) || !std::isfinite(spacing)) {
    throw InvalidMediumError("stencil spacing must be positive and finite");
  }

  const double inv_h2 = 1.0 / (spacing * spacing);
  for (double& weight : weights) {
    weight *= inv_h2;
  }
  return StencilCoefficients(spatial_order, spacing, std::move(weights), seiswave::stability_constant(spatial_order));
}

StencilCoefficients::StencilCoefficients(std::size_t order, double spacing, std::vector<double> weights, double stability)
    : order_(order), spacing_(spacing), weights_(std::move(weights)), stability_constant_(stability) {}

Field2D<double> StencilCoefficients::update_weights(const Medium& medium, double dt) const {
  Field2D<double> out(medium.grid());
  const auto& velocity = medium.velocity_field().data();
  auto& values = out.data();
  for (std::size_t i = 0; i < values.size(); ++i) {
    const double courant = dt * velocity[i];
    values[i] = courant * courant;
  }
  return out;
}

double StencilCoefficients::laplacian(const Field2D<double>& field, std::size_t row, std::size_t col, bool wraps) const {
  const auto rows = static_cast<std::ptrdiff_t>(field.rows());
  const auto cols = static_cast<std::ptrdiff_t>(field.cols());
  const auto value = [&field, rows, cols, wraps](std::size_t r, std::size_t c, std::ptrdiff_t dr, std::ptrdiff_t dc) {
    std::ptrdiff_t rr = static_cast<std::ptrdiff_t>(r) + dr;
    std::ptrdiff_t cc = static_cast<std::ptrdiff_t>(c) + dc;
    if (rr < 0 || cc < 0 || rr >= rows || cc >= cols) {
      if (!wraps) {
        return 0.0;
      }
      rr = ((rr % rows) + rows) % rows;
      cc = ((cc % cols) + cols) % cols;
    }
    return field(static_cast<std::size_t>(rr), static_cast<std::size_t>(cc));
  };

  double sum = 2.0 * weights_[0] * field.at(row, col);
  for (std::size_t k = 1; k < weights_.size(); ++k) {
    const auto offset = static_cast<std::ptrdiff_t>(k);
    sum += weights_[k] * ((value(row, col, -offset, 0) + value(row, col, offset, 0)) +
                          (value(row, col, 0, -offset) + value(row, col, 0, offset)));
  }
  return sum;
}

}  // namespace seiswave
