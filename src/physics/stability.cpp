#include "seiswave/physics/stability.hpp"

#include <cmath>
#include <stdexcept>

#include "seiswave/api/errors.hpp"
#include "seiswave/core/stencil.hpp"

namespace seiswave {

double cfl_limit(double max_velocity, double spacing, std::size_t spatial_order) {
  if (!(max_velocity > 0.0) || !(spacing > 0.0)) {
    throw std::invalid_argument("CFL limit requires positive velocity and spacing");
  }
  return stability_constant(spatial_order) * spacing / max_velocity;
}

void check_stability(double max_velocity, double spacing, double dt, std::size_t spatial_order) {
  const double limit = cfl_limit(max_velocity, spacing, spatial_order);
  if (!(dt > 0.0) || !std::isfinite(dt) || dt > limit) {
    throw UnstableConfigurationError(dt, limit);
  }
}

}  // namespace seiswave
