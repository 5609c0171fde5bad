#include "seiswave/physics/acoustics.hpp"

#include <stdexcept>

namespace seiswave {

double wavelength(double velocity, double frequency) {
  if (velocity <= 0.0 || frequency <= 0.0) {
    throw std::invalid_argument("velocity and frequency must be positive");
  }
  return velocity / frequency;
}

double points_per_wavelength(double min_velocity, double max_frequency, double spacing) {
  if (spacing <= 0.0) {
    throw std::invalid_argument("spacing must be positive");
  }
  return wavelength(min_velocity, max_frequency) / spacing;
}

double min_points_per_wavelength(std::size_t spatial_order) {
  return spatial_order >= 4 ? 4.0 : 5.0;
}

}  // namespace seiswave
