#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "seiswave/api/config.hpp"
#include "seiswave/core/field.hpp"
#include "seiswave/core/grid.hpp"
#include "seiswave/source/wavelet.hpp"

namespace seiswave {

struct PointSource {
  SourceHandle handle;
  std::size_t row = 0;
  std::size_t col = 0;
  std::unique_ptr<IWavelet> wavelet;
};

// Holds the registered point sources. Locations are given in physical-grid
// coordinates and shifted by the padding offset when injected into the
// computational field.
class SourceInjector {
 public:
  SourceInjector(Grid2D physical, std::size_t row_offset, std::size_t col_offset);

  // Throws OutOfBoundsSourceError when (row, col) is outside the physical grid.
  SourceHandle add(std::size_t row, std::size_t col, std::unique_ptr<IWavelet> wavelet);
  bool remove(SourceHandle handle);

  std::size_t size() const { return sources_.size(); }
  bool empty() const { return sources_.empty(); }
  const std::vector<PointSource>& sources() const { return sources_; }

  // Highest peak frequency among the registered wavelets, 0 when unknown.
  double max_peak_frequency() const;

  // Adds wavelet(time) * weights(cell) at every source cell of `field`.
  // Co-located sources accumulate.
  void inject(Field2D<double>& field, double time, const Field2D<double>& weights) const;

 private:
  Grid2D physical_;
  std::size_t row_offset_;
  std::size_t col_offset_;
  std::size_t next_id_ = 1;
  std::vector<PointSource> sources_;
};

}  // namespace seiswave
