#pragma once

#include <cstddef>
#include <vector>

#include "seiswave/api/config.hpp"
#include "seiswave/core/field.hpp"
#include "seiswave/core/grid.hpp"

namespace seiswave {

struct Snapshot {
  std::size_t step = 0;
  double time = 0.0;
  Field2D<double> pressure;
};

// Read-only view over recorded snapshots, in increasing step order. Iteration
// copies nothing and may be repeated. The view is invalidated by the next
// record() or clear() on the owning recorder.
class SnapshotSequence {
 public:
  using const_iterator = std::vector<Snapshot>::const_iterator;

  SnapshotSequence(const std::vector<Snapshot>& entries, GridExtent extent) : entries_(&entries), extent_(extent) {}

  const_iterator begin() const { return entries_->begin(); }
  const_iterator end() const { return entries_->end(); }
  std::size_t size() const { return entries_->size(); }
  bool empty() const { return entries_->empty(); }
  const Snapshot& operator[](std::size_t i) const { return (*entries_)[i]; }
  const Snapshot& at(std::size_t i) const { return entries_->at(i); }

  const GridExtent& extent() const { return extent_; }

  std::vector<std::size_t> steps() const;

 private:
  const std::vector<Snapshot>* entries_;
  GridExtent extent_;
};

// Append-only store of wavefield copies keyed by step index. Each record
// copies the physical window of the computational field.
class SnapshotRecorder {
 public:
  SnapshotRecorder(Grid2D physical, std::size_t row_offset, std::size_t col_offset);

  // Throws std::invalid_argument unless `step` is greater than the last recorded step.
  const Snapshot& record(std::size_t step, double time, const Field2D<double>& live);

  void clear() { entries_.clear(); }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  const Snapshot* find(std::size_t step) const;
  const Snapshot& latest() const;

  SnapshotSequence sequence() const { return SnapshotSequence(entries_, physical_.extent()); }

 private:
  Grid2D physical_;
  std::size_t row_offset_;
  std::size_t col_offset_;
  std::vector<Snapshot> entries_;
};

}  // namespace seiswave
