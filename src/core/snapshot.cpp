#include "seiswave/core/snapshot.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace seiswave {

std::vector<std::size_t> SnapshotSequence::steps() const {
  std::vector<std::size_t> out;
  out.reserve(entries_->size());
  for (const auto& entry : *entries_) {
    out.push_back(entry.step);
  }
  return out;
}

SnapshotRecorder::SnapshotRecorder(Grid2D physical, std::size_t row_offset, std::size_t col_offset)
    : physical_(std::move(physical)), row_offset_(row_offset), col_offset_(col_offset) {}

const Snapshot& SnapshotRecorder::record(std::size_t step, double time, const Field2D<double>& live) {
  if (!entries_.empty() && step <= entries_.back().step) {
    throw std::invalid_argument("snapshot step " + std::to_string(step) + " does not follow recorded step " +
                                std::to_string(entries_.back().step));
  }
  entries_.push_back(Snapshot{step, time, live.crop(physical_, row_offset_, col_offset_)});
  return entries_.back();
}

const Snapshot* SnapshotRecorder::find(std::size_t step) const {
  const auto it = std::lower_bound(entries_.begin(), entries_.end(), step,
                                   [](const Snapshot& entry, std::size_t value) { return entry.step < value; });
  if (it == entries_.end() || it->step != step) {
    return nullptr;
  }
  return &*it;
}

const Snapshot& SnapshotRecorder::latest() const {
  if (entries_.empty()) {
    throw std::out_of_range("no snapshots recorded");
  }
  return entries_.back();
}

}  // namespace seiswave
