#pragma once

#include <algorithm>
#include <cstddef>
#include <thread>
#include <vector>

namespace seiswave {

inline std::size_t hardware_threads() {
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

inline std::size_t normalized_thread_count(std::size_t requested) {
  if (requested == 0) {
    return hardware_threads();
  }
  return std::min(requested, hardware_threads());
}

// Splits [0, rows) into contiguous row tiles, one per worker. Each tile must
// only write cells of its own rows; reads of other rows are fine as long as
// nobody writes them during the pass. The calling thread runs the last tile.
// If starting a worker or the calling thread's tile throws, the workers already
// started are joined before the exception propagates.
template <typename Func>
void parallel_for_rows(std::size_t rows, std::size_t requested_threads, Func&& fn) {
  if (rows == 0) {
    return;
  }

  const std::size_t thread_count = std::max<std::size_t>(1, std::min(normalized_thread_count(requested_threads), rows));
  if (thread_count == 1) {
    fn(std::size_t{0}, rows);
    return;
  }

  const std::size_t tile = rows / thread_count;
  const std::size_t remainder = rows % thread_count;

  std::vector<std::thread> workers;
  workers.reserve(thread_count - 1);

  const auto join_all = [&workers]() {
    for (auto& worker : workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  };

  try {
    std::size_t begin = 0;
    for (std::size_t i = 0; i < thread_count; ++i) {
      const std::size_t end = begin + tile + (i < remainder ? 1 : 0);
      if (i + 1 == thread_count) {
        fn(begin, end);
      } else {
        workers.emplace_back([begin, end, &fn]() { fn(begin, end); });
      }
      begin = end;
    }
  } catch (...) {
    join_all();
    throw;
  }

  join_all();
}

}  // namespace seiswave
