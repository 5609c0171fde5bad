#pragma once

#include <cstddef>
#include <functional>
#include <optional>

namespace seiswave {

enum class BoundaryKind {
  Damping,
  Rigid,
  Periodic,
};

enum class WaveletKind {
  Ricker,
  Gaussian,
};

enum class SimulationState {
  Uninitialized,
  Ready,
  Running,
  Completed,
  Cancelled,
  Failed,
};

struct GridSpec {
  std::size_t rows = 0;
  std::size_t cols = 0;
  double spacing = 1.0;
};

// Physical size of the visible grid, handed to snapshot consumers.
struct GridExtent {
  std::size_t rows = 0;
  std::size_t cols = 0;
  double spacing = 1.0;
  double width = 0.0;
  double height = 0.0;
};

struct BoundarySpec {
  BoundaryKind kind = BoundaryKind::Damping;
  std::size_t width = 50;
  double taper = 0.007;
  bool free_surface = false;
};

struct WaveletSpec {
  WaveletKind kind = WaveletKind::Ricker;
  double frequency = 10.0;
  std::optional<double> delay;
  double amplitude = 1.0;
};

struct SimulationConfig {
  std::size_t spatial_order = 2;
  std::optional<double> time_step;
  double cfl_safety = 0.9;
  BoundarySpec boundary;
  std::size_t threads = 1;
  std::size_t overflow_sample_stride = 7;
  double overflow_threshold = 1.0e30;
};

struct RunRequest {
  std::size_t steps = 0;
  std::size_t snapshot_every = 1;
  bool resume = false;
  std::function<void(std::size_t)> on_step;
};

struct RunResult {
  std::size_t steps_completed = 0;
  std::size_t snapshots_recorded = 0;
  bool cancelled = false;
};

struct SourceHandle {
  std::size_t id = 0;

  friend bool operator==(const SourceHandle& lhs, const SourceHandle& rhs) { return lhs.id == rhs.id; }
};

const char* state_name(SimulationState state);
const char* boundary_name(BoundaryKind kind);

}  // namespace seiswave
