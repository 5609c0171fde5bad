#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "seiswave/api/config.hpp"

namespace seiswave {

// Source time function. Implementations are pure functions of time.
class IWavelet {
 public:
  virtual ~IWavelet() = default;

  virtual double value(double time) const = 0;
  virtual std::string describe() const = 0;
  virtual std::unique_ptr<IWavelet> clone() const = 0;

  // Dominant frequency in Hz, or 0 when unknown.
  virtual double peak_frequency() const { return 0.0; }

  double operator()(double time) const { return value(time); }
};

// Mexican hat: A * (1 - 2 pi^2 f^2 (t - t0)^2) * exp(-pi^2 f^2 (t - t0)^2).
// The delay defaults to 1/f so the pulse starts close to zero at t = 0.
class RickerWavelet final : public IWavelet {
 public:
  RickerWavelet(double frequency, std::optional<double> delay = std::nullopt, double amplitude = 1.0);

  double value(double time) const override;
  std::string describe() const override;
  std::unique_ptr<IWavelet> clone() const override { return std::make_unique<RickerWavelet>(*this); }
  double peak_frequency() const override { return frequency_; }

  double delay() const { return delay_; }
  double amplitude() const { return amplitude_; }

 private:
  double frequency_;
  double delay_;
  double amplitude_;
};

// A * exp(-pi^2 f^2 (t - t0)^2), delay defaulting to 1/f.
class GaussianWavelet final : public IWavelet {
 public:
  GaussianWavelet(double frequency, std::optional<double> delay = std::nullopt, double amplitude = 1.0);

  double value(double time) const override;
  std::string describe() const override;
  std::unique_ptr<IWavelet> clone() const override { return std::make_unique<GaussianWavelet>(*this); }
  double peak_frequency() const override { return frequency_; }

  double delay() const { return delay_; }
  double amplitude() const { return amplitude_; }

 private:
  double frequency_;
  double delay_;
  double amplitude_;
};

class FunctionWavelet final : public IWavelet {
 public:
  explicit FunctionWavelet(std::function<double(double)> fn, double peak_frequency = 0.0);

  double value(double time) const override { return fn_(time); }
  std::string describe() const override;
  std::unique_ptr<IWavelet> clone() const override { return std::make_unique<FunctionWavelet>(*this); }
  double peak_frequency() const override { return peak_frequency_; }

 private:
  std::function<double(double)> fn_;
  double peak_frequency_;
};

std::unique_ptr<IWavelet> make_wavelet(const WaveletSpec& spec);

}  // namespace seiswave
