#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "seiswave/api/config.hpp"
#include "seiswave/core/field.hpp"

namespace seiswave {

// Cells added outside the physical grid on each side.
struct Padding {
  std::size_t top = 0;
  std::size_t bottom = 0;
  std::size_t left = 0;
  std::size_t right = 0;
};

class IBoundary {
 public:
  virtual ~IBoundary() = default;

  virtual BoundaryKind kind() const = 0;
  virtual Padding padding() const = 0;

  // Whether stencil reads past the grid edge wrap around. Otherwise they read
  // zero pressure.
  virtual bool wraps() const = 0;

  // In-place treatment after the stencil update. `next` is the freshly
  // computed slice, `current` the slice it was computed from.
  virtual void apply(Field2D<double>& next, Field2D<double>& current, std::size_t threads) const = 0;
};

// Sponge layer: padding cells at depth d (1 <= d <= width) from the physical
// region are scaled by exp(-(taper * d)^2) after every step.
class DampingBoundary final : public IBoundary {
 public:
  DampingBoundary(std::size_t width, double taper, bool free_surface);

  BoundaryKind kind() const override { return BoundaryKind::Damping; }
  Padding padding() const override;
  bool wraps() const override { return false; }
  void apply(Field2D<double>& next, Field2D<double>& current, std::size_t threads) const override;

  std::size_t width() const { return width_; }
  double taper() const { return taper_; }
  bool free_surface() const { return free_surface_; }

  // Multiplier at the given depth into the padding; 1.0 at depth 0.
  double coefficient(std::size_t depth) const;

 private:
  void damp(Field2D<double>& field, std::size_t threads) const;

  std::size_t width_;
  double taper_;
  bool free_surface_;
  std::vector<double> profile_;
};

// Pressure held at zero on the outermost ring of cells.
class RigidBoundary final : public IBoundary {
 public:
  BoundaryKind kind() const override { return BoundaryKind::Rigid; }
  Padding padding() const override { return {}; }
  bool wraps() const override { return false; }
  void apply(Field2D<double>& next, Field2D<double>& current, std::size_t threads) const override;
};

class PeriodicBoundary final : public IBoundary {
 public:
  BoundaryKind kind() const override { return BoundaryKind::Periodic; }
  Padding padding() const override { return {}; }
  bool wraps() const override { return true; }
  void apply(Field2D<double>&, Field2D<double>&, std::size_t) const override {}
};

std::unique_ptr<IBoundary> make_boundary(const BoundarySpec& spec);

}  // namespace seiswave
