#pragma once

#include <cstddef>

namespace seiswave {

// Largest stable time step, C(order) * dx / v_max.
double cfl_limit(double max_velocity, double spacing, std::size_t spatial_order);

// Throws UnstableConfigurationError when dt exceeds cfl_limit or is not a
// positive finite number.
void check_stability(double max_velocity, double spacing, double dt, std::size_t spatial_order);

}  // namespace seiswave
