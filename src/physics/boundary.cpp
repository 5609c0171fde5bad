#include "seiswave/physics/boundary.hpp"

#include <cmath>
#include <stdexcept>

#include "seiswave/core/threading.hpp"

namespace seiswave {
namespace {

// Depth of `index` into a padding band of size `lower` at the start and
// `upper` at the end of an axis of length `extent`; 0 inside the physical region.
std::size_t band_depth(std::size_t index, std::size_t extent, std::size_t lower, std::size_t upper) {
  if (index < lower) {
    return lower - index;
  }
  if (upper > 0 && index >= extent - upper) {
    return index - (extent - upper) + 1;
  }
  return 0;
}

}  // namespace

DampingBoundary::DampingBoundary(std::size_t width, double taper, bool free_surface)
    : width_(width), taper_(taper), free_surface_(free_surface) {
  if (width_ == 0) {
    throw std::invalid_argument("damping boundary width must be at least one cell");
  }
  if (!(taper_ >= 0.0) || !std::isfinite(taper_)) {
    throw std::invalid_argument("damping taper must be non-negative and finite");
  }

  profile_.assign(width_ + 1, 1.0);
  for (std::size_t depth = 1; depth <= width_; ++depth) {
    const double scaled = taper_ * static_cast<double>(depth);
    profile_[depth] = std::exp(-scaled * scaled);
  }
}

Padding DampingBoundary::padding() const {
  return Padding{free_surface_ ? 0 : width_, width_, width_, width_};
}

double DampingBoundary::coefficient(std::size_t depth) const {
  if (depth > width_) {
    throw std::out_of_range("damping depth exceeds boundary width");
  }
  return profile_[depth];
}

void DampingBoundary::apply(Field2D<double>& next, Field2D<double>& current, std::size_t threads) const {
  damp(current, threads);
  damp(next, threads);
}

void DampingBoundary::damp(Field2D<double>& field, std::size_t threads) const {
  const Padding pad = padding();
  const std::size_t rows = field.rows();
  const std::size_t cols = field.cols();

  parallel_for_rows(rows, threads, [&](std::size_t begin, std::size_t end) {
    for (std::size_t row = begin; row < end; ++row) {
      const double row_factor = profile_[band_depth(row, rows, pad.top, pad.bottom)];
      if (row_factor != 1.0) {
        for (std::size_t col = 0; col < cols; ++col) {
          field(row, col) *= row_factor * profile_[band_depth(col, cols, pad.left, pad.right)];
        }
        continue;
      }
      for (std::size_t col = 0; col < pad.left; ++col) {
        field(row, col) *= profile_[pad.left - col];
      }
      for (std::size_t col = cols - pad.right; col < cols; ++col) {
        field(row, col) *= profile_[col - (cols - pad.right) + 1];
      }
    }
  });
}

void RigidBoundary::apply(Field2D<double>& next, Field2D<double>&, std::size_t) const {
  const std::size_t rows = next.rows();
  const std::size_t cols = next.cols();
  for (std::size_t col = 0; col < cols; ++col) {
    next(0, col) = 0.0;
    next(rows - 1, col) = 0.0;
  }
  for (std::size_t row = 0; row < rows; ++row) {
    next(row, 0) = 0.0;
    next(row, cols - 1) = 0.0;
  }
}

std::unique_ptr<IBoundary> make_boundary(const BoundarySpec& spec) {
  switch (spec.kind) {
    case BoundaryKind::Damping:
      return std::make_unique<DampingBoundary>(spec.width, spec.taper, spec.free_surface);
    case BoundaryKind::Rigid:
      return std::make_unique<RigidBoundary>();
    case BoundaryKind::Periodic:
      return std::make_unique<PeriodicBoundary>();
  }
  throw std::invalid_argument("unknown boundary kind");
}

}  // namespace seiswave
