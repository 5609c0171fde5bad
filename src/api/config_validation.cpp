#include "seiswave/api/config_validation.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "seiswave/core/threading.hpp"
#include "seiswave/physics/acoustics.hpp"

namespace seiswave {

std::vector<ValidationIssue> validate_config(const SimulationConfig& config) {
  std::vector<ValidationIssue> issues;

  if (config.time_step.has_value() && (!(*config.time_step > 0.0) || !std::isfinite(*config.time_step))) {
    issues.push_back({"config.time_step must be positive and finite", true});
  }

  if (!(config.cfl_safety > 0.0) || config.cfl_safety > 1.0) {
    issues.push_back({"config.cfl_safety must be in (0, 1]", true});
  }

  if (config.threads == 0) {
    issues.push_back({"config.threads must be >= 1", true});
  } else if (config.threads > hardware_threads()) {
    issues.push_back({"config.threads exceeds hardware concurrency and will be clamped", false});
  }

  if (config.overflow_sample_stride == 0) {
    issues.push_back({"config.overflow_sample_stride must be >= 1", true});
  }
  if (!(config.overflow_threshold > 0.0)) {
    issues.push_back({"config.overflow_threshold must be positive", true});
  }

  if (config.boundary.kind == BoundaryKind::Damping) {
    if (config.boundary.width == 0) {
      issues.push_back({"boundary.width must be >= 1 for damping boundaries", true});
    }
    if (!(config.boundary.taper >= 0.0) || !std::isfinite(config.boundary.taper)) {
      issues.push_back({"boundary.taper must be non-negative and finite", true});
    } else if (config.boundary.taper == 0.0) {
      issues.push_back({"boundary.taper of 0 disables damping", false});
    }
  }

  return issues;
}

std::vector<ValidationIssue> check_dispersion(
    double min_velocity,
    double max_frequency,
    double spacing,
    std::size_t spatial_order) {
  std::vector<ValidationIssue> issues;
  if (max_frequency <= 0.0) {
    return issues;
  }

  const double points = points_per_wavelength(min_velocity, max_frequency, spacing);
  const double required = min_points_per_wavelength(spatial_order);
  if (points < required) {
    std::ostringstream out;
    out << "shortest wavelength spans " << points << " cells (< " << required
        << "); expect numerical dispersion";
    issues.push_back({out.str(), false});
  }
  return issues;
}

void throw_if_invalid(const SimulationConfig& config) {
  const auto issues = validate_config(config);

  std::ostringstream out;
  out << "Invalid seiswave simulation config:";
  bool any_fatal = false;
  for (const auto& issue : issues) {
    if (issue.fatal) {
      out << "\n - " << issue.message;
      any_fatal = true;
    }
  }
  if (any_fatal) {
    throw std::invalid_argument(out.str());
  }
}

}  // namespace seiswave
