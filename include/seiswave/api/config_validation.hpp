#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "seiswave/api/config.hpp"

namespace seiswave {

struct ValidationIssue {
  std::string message;
  bool fatal = true;
};

std::vector<ValidationIssue> validate_config(const SimulationConfig& config);

// Non-fatal: warns when the shortest wavelength is sampled by too few cells.
std::vector<ValidationIssue> check_dispersion(
    double min_velocity,
    double max_frequency,
    double spacing,
    std::size_t spatial_order);

// Throws std::invalid_argument listing every fatal issue.
void throw_if_invalid(const SimulationConfig& config);

}  // namespace seiswave
