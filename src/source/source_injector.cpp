#include "seiswave/source/source_injector.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "seiswave/api/errors.hpp"

namespace seiswave {

SourceInjector::SourceInjector(Grid2D physical, std::size_t row_offset, std::size_t col_offset)
    : physical_(std::move(physical)), row_offset_(row_offset), col_offset_(col_offset) {}

SourceHandle SourceInjector::add(std::size_t row, std::size_t col, std::unique_ptr<IWavelet> wavelet) {
  if (!physical_.contains(row, col)) {
    throw OutOfBoundsSourceError(row, col, physical_.rows(), physical_.cols());
  }
  if (!wavelet) {
    throw std::invalid_argument("source requires a wavelet");
  }

  const SourceHandle handle{next_id_++};
  sources_.push_back(PointSource{handle, row, col, std::move(wavelet)});
  return handle;
}

bool SourceInjector::remove(SourceHandle handle) {
  const auto it = std::find_if(sources_.begin(), sources_.end(),
                               [handle](const PointSource& source) { return source.handle == handle; });
  if (it == sources_.end()) {
    return false;
  }
  sources_.erase(it);
  return true;
}

double SourceInjector::max_peak_frequency() const {
  double peak = 0.0;
  for (const auto& source : sources_) {
    peak = std::max(peak, source.wavelet->peak_frequency());
  }
  return peak;
}

void SourceInjector::inject(Field2D<double>& field, double time, const Field2D<double>& weights) const {
  for (const auto& source : sources_) {
    const std::size_t row = source.row + row_offset_;
    const std::size_t col = source.col + col_offset_;
    field.at(row, col) += source.wavelet->value(time) * weights.at(row, col);
  }
}

}  // namespace seiswave
