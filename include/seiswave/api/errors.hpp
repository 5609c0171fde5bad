#pragma once

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

namespace seiswave {

class SimulationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidMediumError : public SimulationError {
 public:
  using SimulationError::SimulationError;
};

class UnsupportedOrderError : public SimulationError {
 public:
  explicit UnsupportedOrderError(std::size_t order)
      : SimulationError("unsupported stencil order " + std::to_string(order) + " (expected 2 or 4)"), order_(order) {}

  std::size_t order() const { return order_; }

 private:
  std::size_t order_;
};

class UnstableConfigurationError : public SimulationError {
 public:
  UnstableConfigurationError(double dt, double limit)
      : SimulationError(format(dt, limit)), dt_(dt), limit_(limit) {}

  double time_step() const { return dt_; }
  double limit() const { return limit_; }

 private:
  static std::string format(double dt, double limit) {
    std::ostringstream out;
    out << "time step " << dt << " s violates the CFL limit " << limit << " s";
    return out.str();
  }

  double dt_;
  double limit_;
};

class OutOfBoundsSourceError : public SimulationError {
 public:
  OutOfBoundsSourceError(std::size_t row, std::size_t col, std::size_t rows, std::size_t cols)
      : SimulationError("source location (" + std::to_string(row) + ", " + std::to_string(col) +
                        ") lies outside grid " + std::to_string(rows) + "x" + std::to_string(cols)),
        row_(row),
        col_(col) {}

  std::size_t row() const { return row_; }
  std::size_t col() const { return col_; }

 private:
  std::size_t row_;
  std::size_t col_;
};

class StepOverflowError : public SimulationError {
 public:
  StepOverflowError(std::size_t step, double value)
      : SimulationError(format(step, value)), step_(step), value_(value) {}

  std::size_t step() const { return step_; }
  double value() const { return value_; }

 private:
  static std::string format(std::size_t step, double value) {
    std::ostringstream out;
    out << "wavefield overflow detected at step " << step << " (sampled value " << value << ")";
    return out.str();
  }

  std::size_t step_;
  double value_;
};

}  // namespace seiswave
