#include "statistics.hpp"

void Statistics::record(const TransferOutcome& outcome) {
  switch(outcome.status) {
    case OutcomeStatus::Success:
      files_processed_.fetch_add(1, std::memory_order_relaxed);
      files_moved_.fetch_add(1, std::memory_order_relaxed);
      total_bytes_moved_.fetch_add(outcome.bytes, std::memory_order_relaxed);
      break;
    case OutcomeStatus::Skipped:
      files_processed_.fetch_add(1, std::memory_order_relaxed);
      files_skipped_.fetch_add(1, std::memory_order_relaxed);
      break;
    case OutcomeStatus::Failed:
      files_processed_.fetch_add(1, std::memory_order_relaxed);
      errors_.fetch_add(1, std::memory_order_relaxed);
      break;
    case OutcomeStatus::Requeued:
      requeued_.fetch_add(1, std::memory_order_relaxed);
      break;
  }
}

StatisticsSnapshot Statistics::snapshot(std::size_t queue_size) const {
  StatisticsSnapshot s;
  s.files_processed = files_processed_.load(std::memory_order_relaxed);
  s.files_moved = files_moved_.load(std::memory_order_relaxed);
  s.files_skipped = files_skipped_.load(std::memory_order_relaxed);
  s.errors = errors_.load(std::memory_order_relaxed);
  s.requeued = requeued_.load(std::memory_order_relaxed);
  s.total_bytes_moved = total_bytes_moved_.load(std::memory_order_relaxed);
  s.queue_size = queue_size;
  return s;
}
