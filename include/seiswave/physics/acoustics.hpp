#pragma once

#include <cstddef>

namespace seiswave {

double wavelength(double velocity, double frequency);

// Grid cells per shortest wavelength. Below ~5 for order 2 (or ~4 for order 4)
// the scheme's numerical dispersion becomes visible.
double points_per_wavelength(double min_velocity, double max_frequency, double spacing);
double min_points_per_wavelength(std::size_t spatial_order);

}  // namespace seiswave
