#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "transfer_types.hpp"

struct StatisticsSnapshot {
  uint64_t files_processed = 0;
  uint64_t files_moved = 0;
  uint64_t files_skipped = 0;
  uint64_t errors = 0;
  uint64_t requeued = 0;
  uint64_t total_bytes_moved = 0;
  std::size_t queue_size = 0;
};

// Counters only ever grow during a run.
class Statistics {
public:
  void record(const TransferOutcome& outcome);

  StatisticsSnapshot snapshot(std::size_t queue_size) const;

private:
  std::atomic<uint64_t> files_processed_{0};
  std::atomic<uint64_t> files_moved_{0};
  std::atomic<uint64_t> files_skipped_{0};
  std::atomic<uint64_t> errors_{0};
  std::atomic<uint64_t> requeued_{0};
  std::atomic<uint64_t> total_bytes_moved_{0};
};
