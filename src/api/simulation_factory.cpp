#include "seiswave/api/simulation.hpp"

#include <utility>

#include "../core/acoustic_simulation.hpp"

namespace seiswave {

const char* state_name(SimulationState state) {
  switch (state) {
    case SimulationState::Uninitialized:
      return "Uninitialized";
    case SimulationState::Ready:
      return "Ready";
    case SimulationState::Running:
      return "Running";
    case SimulationState::Completed:
      return "Completed";
    case SimulationState::Cancelled:
      return "Cancelled";
    case SimulationState::Failed:
      return "Failed";
  }
  return "Unknown";
}

const char* boundary_name(BoundaryKind kind) {
  switch (kind) {
    case BoundaryKind::Damping:
      return "Damping";
    case BoundaryKind::Rigid:
      return "Rigid";
    case BoundaryKind::Periodic:
      return "Periodic";
  }
  return "Unknown";
}

std::unique_ptr<ISimulation> make_simulation(Medium medium, const SimulationConfig& config) {
  auto simulation = make_acoustic_simulation();
  simulation->initialize(std::move(medium), config);
  return simulation;
}

}  // namespace seiswave
