#include "acoustic_simulation.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "seiswave/api/config_validation.hpp"
#include "seiswave/api/errors.hpp"
#include "seiswave/core/field.hpp"
#include "seiswave/core/grid.hpp"
#include "seiswave/core/snapshot.hpp"
#include "seiswave/core/stencil.hpp"
#include "seiswave/core/threading.hpp"
#include "seiswave/physics/boundary.hpp"
#include "seiswave/physics/stability.hpp"
#include "seiswave/source/source_injector.hpp"

namespace seiswave {
namespace {

bool overflowed(double value, double threshold) {
  return !std::isfinite(value) || std::fabs(value) > threshold;
}

class AcousticSimulation final : public ISimulation {
 public:
  void initialize(Medium medium, const SimulationConfig& config) override {
    if (state_ == SimulationState::Running) {
      throw std::logic_error("cannot re-initialize a running simulation");
    }

    StencilCoefficients stencil = StencilCoefficients::make(config.spatial_order, medium.grid().spacing());
    throw_if_invalid(config);
    std::unique_ptr<IBoundary> boundary = make_boundary(config.boundary);
    const Padding pad = boundary->padding();

    config_ = config;
    stencil_.emplace(std::move(stencil));
    boundary_ = std::move(boundary);
    padding_ = pad;
    padded_medium_.emplace(medium.padded(pad.top, pad.bottom, pad.left, pad.right));
    medium_.emplace(std::move(medium));

    stability_limit_ = cfl_limit(medium_->max_velocity(), medium_->grid().spacing(), config_.spatial_order);
    dt_ = config_.time_step.value_or(config_.cfl_safety * stability_limit_);
    update_weights_ = stencil_->update_weights(*padded_medium_, dt_);

    const Grid2D& computational = padded_medium_->grid();
    previous_ = Field2D<double>(computational);
    current_ = Field2D<double>(computational);
    next_ = Field2D<double>(computational);

    injector_.emplace(medium_->grid(), pad.top, pad.left);
    recorder_.emplace(medium_->grid(), pad.top, pad.left);

    step_count_ = 0;
    refresh_warnings();
    state_ = SimulationState::Ready;
  }

  SourceHandle add_source(std::size_t row, std::size_t col, const WaveletSpec& wavelet) override {
    return add_source(row, col, make_wavelet(wavelet));
  }

  SourceHandle add_source(std::size_t row, std::size_t col, std::unique_ptr<IWavelet> wavelet) override {
    require_initialized();
    require_idle("add a source to");
    const SourceHandle handle = injector_->add(row, col, std::move(wavelet));
    refresh_warnings();
    return handle;
  }

  bool remove_source(SourceHandle handle) override {
    require_initialized();
    require_idle("remove a source from");
    const bool removed = injector_->remove(handle);
    refresh_warnings();
    return removed;
  }

  std::size_t source_count() const override { return injector_ ? injector_->size() : 0; }

  RunResult run(const RunRequest& request) override {
    require_initialized();
    require_idle("run");
    if (request.snapshot_every == 0) {
      throw std::invalid_argument("snapshot_every must be >= 1");
    }
    if (request.resume && state_ == SimulationState::Failed) {
      throw std::logic_error("a failed run cannot be resumed");
    }

    check_stability(medium_->max_velocity(), medium_->grid().spacing(), dt_, config_.spatial_order);

    const bool resume = request.resume &&
                        (state_ == SimulationState::Completed || state_ == SimulationState::Cancelled);
    if (!resume) {
      reset();
    }

    state_ = SimulationState::Running;

    RunResult result;
    try {
      for (std::size_t i = 0; i < request.steps; ++i) {
        if (cancel_requested_.exchange(false)) {
          state_ = SimulationState::Cancelled;
          result.cancelled = true;
          return result;
        }

        const std::size_t step = step_count_;
        if (advance(step, step % request.snapshot_every == 0)) {
          ++result.snapshots_recorded;
        }
        ++step_count_;
        ++result.steps_completed;

        if (request.on_step) {
          request.on_step(step);
        }
      }
    } catch (...) {
      cancel_requested_.store(false);
      state_ = SimulationState::Failed;
      throw;
    }

    cancel_requested_.store(false);
    state_ = SimulationState::Completed;
    return result;
  }

  void request_cancel() override { cancel_requested_.store(true); }

  SimulationState state() const override { return state_; }
  double time_step() const override { return dt_; }
  double stability_limit() const override { return stability_limit_; }
  std::size_t steps_completed() const override { return step_count_; }
  double current_time() const override { return static_cast<double>(step_count_) * dt_; }

  const Medium& medium() const override {
    require_initialized();
    return *medium_;
  }

  GridExtent extent() const override {
    require_initialized();
    return medium_->grid().extent();
  }

  double sample(std::size_t row, std::size_t col) const override {
    require_initialized();
    if (!medium_->grid().contains(row, col)) {
      throw std::out_of_range("sample location outside the grid");
    }
    return current_(row + padding_.top, col + padding_.left);
  }

  Field2D<double> wavefield() const override {
    require_initialized();
    return current_.crop(medium_->grid(), padding_.top, padding_.left);
  }

  SnapshotSequence snapshots() const override {
    require_initialized();
    return recorder_->sequence();
  }

  void clear_snapshots() override {
    require_initialized();
    require_idle("clear snapshots of");
    recorder_->clear();
  }

  std::string diagnostics_json() const override {
    double max_amplitude = 0.0;
    double sum_squares = 0.0;
    std::size_t rows = 0;
    std::size_t cols = 0;
    if (medium_) {
      rows = medium_->grid().rows();
      cols = medium_->grid().cols();
      for (std::size_t row = 0; row < rows; ++row) {
        for (std::size_t col = 0; col < cols; ++col) {
          const double value = current_(row + padding_.top, col + padding_.left);
          max_amplitude = std::max(max_amplitude, std::fabs(value));
          sum_squares += value * value;
        }
      }
    }
    const double rms = rows * cols > 0 ? std::sqrt(sum_squares / static_cast<double>(rows * cols)) : 0.0;

    std::ostringstream out;
    out << "{"
        << "\"rows\":" << rows << ","
        << "\"cols\":" << cols << ","
        << "\"padded_rows\":" << current_.rows() << ","
        << "\"padded_cols\":" << current_.cols() << ","
        << "\"order\":" << config_.spatial_order << ","
        << "\"boundary\":\"" << boundary_name(config_.boundary.kind) << "\","
        << "\"state\":\"" << state_name(state_) << "\","
        << "\"steps\":" << step_count_ << ","
        << "\"dt\":" << dt_ << ","
        << "\"cfl_limit\":" << stability_limit_ << ","
        << "\"time\":" << current_time() << ","
        << "\"sources\":" << source_count() << ","
        << "\"snapshots\":" << (recorder_ ? recorder_->size() : 0) << ","
        << "\"max_amplitude\":" << max_amplitude << ","
        << "\"rms\":" << rms << ","
        << "\"warnings\":[";
    for (std::size_t i = 0; i < warnings_.size(); ++i) {
      out << (i == 0 ? "" : ",") << "\"" << warnings_[i] << "\"";
    }
    out << "]}";
    return out.str();
  }

 private:
  void require_initialized() const {
    if (state_ == SimulationState::Uninitialized) {
      throw std::logic_error("AcousticSimulation is not initialized");
    }
  }

  void require_idle(const char* action) const {
    if (state_ == SimulationState::Running) {
      throw std::logic_error(std::string("cannot ") + action + " a running simulation");
    }
  }

  void reset() {
    previous_.fill(0.0);
    current_.fill(0.0);
    next_.fill(0.0);
    step_count_ = 0;
    recorder_->clear();
  }

  void refresh_warnings() {
    warnings_.clear();
    for (const auto& issue : validate_config(config_)) {
      if (!issue.fatal) {
        warnings_.push_back(issue.message);
      }
    }
    const auto dispersion = check_dispersion(
        medium_->min_velocity(), injector_->max_peak_frequency(), medium_->grid().spacing(), config_.spatial_order);
    for (const auto& issue : dispersion) {
      warnings_.push_back(issue.message);
    }
  }

  // One time step in fixed order: inject, stencil update, boundary, overflow
  // check, optional snapshot, rotate. Returns whether a snapshot was taken.
  bool advance(std::size_t step, bool record) {
    const double time = static_cast<double>(step) * dt_;
    injector_->inject(current_, time, update_weights_);

    parallel_for_rows(current_.rows(), config_.threads, [this](std::size_t begin, std::size_t end) {
      update_rows(begin, end);
    });

    boundary_->apply(next_, current_, config_.threads);

    scan_sampled(step);
    if (record) {
      scan_window(step);
      recorder_->record(step, time + dt_, next_);
    }

    previous_.data().swap(current_.data());
    current_.data().swap(next_.data());
    return record;
  }

  void update_rows(std::size_t begin, std::size_t end) {
    const std::size_t rows = current_.rows();
    const std::size_t cols = current_.cols();
    const std::size_t half = stencil_->half_width();
    const StencilCoefficients& stencil = *stencil_;
    const bool wraps = boundary_->wraps();

    const double* curr = current_.data().data();
    const double* prev = previous_.data().data();
    const double* factor = update_weights_.data().data();
    double* next = next_.data().data();

    for (std::size_t row = begin; row < end; ++row) {
      const bool interior_row = row >= half && row + half < rows;
      for (std::size_t col = 0; col < cols; ++col) {
        const std::size_t idx = row * cols + col;
        const bool interior = interior_row && col >= half && col + half < cols;
        const double lap = interior ? stencil.interior(curr, idx, cols) : stencil.laplacian(current_, row, col, wraps);
        next[idx] = 2.0 * curr[idx] - prev[idx] + factor[idx] * lap;
      }
    }
  }

  // Cheap per-step scan: every stride-th cell, starting offset rotating with the step.
  void scan_sampled(std::size_t step) const {
    const std::vector<double>& values = next_.data();
    const std::size_t stride = config_.overflow_sample_stride;
    for (std::size_t i = step % stride; i < values.size(); i += stride) {
      if (overflowed(values[i], config_.overflow_threshold)) {
        throw StepOverflowError(step, values[i]);
      }
    }
  }

  void scan_window(std::size_t step) const {
    const Grid2D& grid = medium_->grid();
    for (std::size_t row = 0; row < grid.rows(); ++row) {
      for (std::size_t col = 0; col < grid.cols(); ++col) {
        const double value = next_(row + padding_.top, col + padding_.left);
        if (overflowed(value, config_.overflow_threshold)) {
          throw StepOverflowError(step, value);
        }
      }
    }
  }

  SimulationConfig config_;
  std::optional<Medium> medium_;
  std::optional<Medium> padded_medium_;
  std::optional<StencilCoefficients> stencil_;
  std::unique_ptr<IBoundary> boundary_;
  Padding padding_;
  std::optional<SourceInjector> injector_;
  std::optional<SnapshotRecorder> recorder_;

  Field2D<double> update_weights_;
  Field2D<double> previous_;
  Field2D<double> current_;
  Field2D<double> next_;

  std::vector<std::string> warnings_;
  std::atomic<bool> cancel_requested_{false};
  SimulationState state_ = SimulationState::Uninitialized;
  std::size_t step_count_ = 0;
  double dt_ = 0.0;
  double stability_limit_ = 0.0;
};

}  // namespace

std::unique_ptr<ISimulation> make_acoustic_simulation() {
  return std::make_unique<AcousticSimulation>();
}

}  // namespace seiswave
