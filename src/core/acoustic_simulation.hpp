#pragma once

#include <memory>

#include "seiswave/api/simulation.hpp"

namespace seiswave {

std::unique_ptr<ISimulation> make_acoustic_simulation();

}  // namespace seiswave
