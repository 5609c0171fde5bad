#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "seiswave/api/config.hpp"
#include "seiswave/core/field.hpp"
#include "seiswave/core/snapshot.hpp"
#include "seiswave/medium/medium.hpp"
#include "seiswave/source/wavelet.hpp"

namespace seiswave {

// One acoustic simulation session.
//
// States: Uninitialized -> Ready (initialize) -> Running (run, after the CFL
// gate) -> Completed | Cancelled | Failed. A session in any of the last three
// states may run again, either fresh (wavefield and snapshots reset) or resumed.
class ISimulation {
 public:
  virtual ~ISimulation() = default;

  virtual void initialize(Medium medium, const SimulationConfig& config) = 0;

  // Locations are physical-grid (row, col). Throws OutOfBoundsSourceError.
  virtual SourceHandle add_source(std::size_t row, std::size_t col, const WaveletSpec& wavelet) = 0;
  virtual SourceHandle add_source(std::size_t row, std::size_t col, std::unique_ptr<IWavelet> wavelet) = 0;
  virtual bool remove_source(SourceHandle handle) = 0;
  virtual std::size_t source_count() const = 0;

  // Throws UnstableConfigurationError before stepping, StepOverflowError when
  // the wavefield blows up. Snapshots taken before a failure are kept.
  virtual RunResult run(const RunRequest& request) = 0;

  // Safe to call from any thread; the active run stops after its current step.
  // A request made between runs stops the next run before its first step.
  // Every run clears pending requests when it ends.
  virtual void request_cancel() = 0;

  virtual SimulationState state() const = 0;
  virtual double time_step() const = 0;
  virtual double stability_limit() const = 0;
  virtual std::size_t steps_completed() const = 0;
  virtual double current_time() const = 0;

  virtual const Medium& medium() const = 0;
  virtual GridExtent extent() const = 0;

  virtual double sample(std::size_t row, std::size_t col) const = 0;
  virtual Field2D<double> wavefield() const = 0;

  virtual SnapshotSequence snapshots() const = 0;
  virtual void clear_snapshots() = 0;

  virtual std::string diagnostics_json() const = 0;
};

std::unique_ptr<ISimulation> make_simulation(Medium medium, const SimulationConfig& config);

}  // namespace seiswave
