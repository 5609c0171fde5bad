#include "seiswave/source/wavelet.hpp"

#include <cmath>
#include <numbers>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace seiswave {
namespace {

double checked_frequency(double frequency) {
  if (!(frequency > 0.0) || !std::isfinite(frequency)) {
    throw std::invalid_argument("wavelet frequency must be positive and finite");
  }
  return frequency;
}

double resolve_delay(std::optional<double> delay, double frequency) {
  const double value = delay.value_or(1.0 / frequency);
  if (!std::isfinite(value)) {
    throw std::invalid_argument("wavelet delay must be finite");
  }
  return value;
}

// pi^2 f^2 (t - t0)^2
double gaussian_argument(double frequency, double delay, double time) {
  const double shifted = std::numbers::pi * frequency * (time - delay);
  return shifted * shifted;
}

}  // namespace

RickerWavelet::RickerWavelet(double frequency, std::optional<double> delay, double amplitude)
    : frequency_(checked_frequency(frequency)), delay_(resolve_delay(delay, frequency)), amplitude_(amplitude) {}

double RickerWavelet::value(double time) const {
  const double arg = gaussian_argument(frequency_, delay_, time);
  return amplitude_ * (1.0 - 2.0 * arg) * std::exp(-arg);
}

std::string RickerWavelet::describe() const {
  std::ostringstream out;
  out << "{\"kind\":\"ricker\",\"frequency\":" << frequency_ << ",\"delay\":" << delay_
      << ",\"amplitude\":" << amplitude_ << "}";
  return out.str();
}

GaussianWavelet::GaussianWavelet(double frequency, std::optional<double> delay, double amplitude)
    : frequency_(checked_frequency(frequency)), delay_(resolve_delay(delay, frequency)), amplitude_(amplitude) {}

double GaussianWavelet::value(double time) const {
  return amplitude_ * std::exp(-gaussian_argument(frequency_, delay_, time));
}

std::string GaussianWavelet::describe() const {
  std::ostringstream out;
  out << "{\"kind\":\"gaussian\",\"frequency\":" << frequency_ << ",\"delay\":" << delay_
      << ",\"amplitude\":" << amplitude_ << "}";
  return out.str();
}

FunctionWavelet::FunctionWavelet(std::function<double(double)> fn, double peak_frequency)
    : fn_(std::move(fn)), peak_frequency_(peak_frequency) {
  if (!fn_) {
    throw std::invalid_argument("function wavelet requires a callable");
  }
}

std::string FunctionWavelet::describe() const {
  std::ostringstream out;
  out << "{\"kind\":\"function\",\"frequency\":" << peak_frequency_ << "}";
  return out.str();
}

std::unique_ptr<IWavelet> make_wavelet(const WaveletSpec& spec) {
  switch (spec.kind) {
    case WaveletKind::Ricker:
      return std::make_unique<RickerWavelet>(spec.frequency, spec.delay, spec.amplitude);
    case WaveletKind::Gaussian:
      return std::make_unique<GaussianWavelet>(spec.frequency, spec.delay, spec.amplitude);
  }
  throw std::invalid_argument("unknown wavelet kind");
}

}  // namespace seiswave
