#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

enum class FileOrigin { Watched, ExistingScan };

struct QueuedFile {
  std::filesystem::path source_path;
  std::chrono::system_clock::time_point detected_at{};
  FileOrigin origin = FileOrigin::Watched;
  uint32_t requeue_count = 0;
  // Set on age-gate requeue; the item is not evaluated before this point.
  std::chrono::steady_clock::time_point not_before{};

  static QueuedFile detected(std::filesystem::path path, FileOrigin origin) {
    QueuedFile item;
    item.source_path = std::move(path);
    item.detected_at = std::chrono::system_clock::now();
    item.origin = origin;
    return item;
  }
};

enum class OutcomeStatus { Success, Skipped, Failed, Requeued };

enum class OutcomeReason {
  None,
  Moved,
  AlreadyPresent,
  UnsupportedType,
  Gone,
  Locked,
  Unstable,
  TimedOut,
  AgeGate,
  RequeueLimit,
  ConflictExhausted,
  ConfigurationError,
  TransferError,
  ValidationFailed,
  SourceDeleteFailed
};

struct TransferOutcome {
  OutcomeStatus status = OutcomeStatus::Failed;
  OutcomeReason reason = OutcomeReason::None;
  uint64_t bytes = 0;
  std::string destination;
  std::string detail;

  bool succeeded() const { return status == OutcomeStatus::Success; }

  static TransferOutcome success(uint64_t bytes, std::string destination) {
    return {OutcomeStatus::Success, OutcomeReason::Moved, bytes, std::move(destination), {}};
  }
  static TransferOutcome skipped(OutcomeReason reason, std::string detail = {}) {
    return {OutcomeStatus::Skipped, reason, 0, {}, std::move(detail)};
  }
  static TransferOutcome failed(OutcomeReason reason, std::string detail = {}) {
    return {OutcomeStatus::Failed, reason, 0, {}, std::move(detail)};
  }
  static TransferOutcome requeued(OutcomeReason reason, std::string detail = {}) {
    return {OutcomeStatus::Requeued, reason, 0, {}, std::move(detail)};
  }
};

inline const char* to_string(FileOrigin origin) {
  switch(origin) {
    case FileOrigin::Watched: return "watched";
    case FileOrigin::ExistingScan: return "existing";
  }
  return "unknown";
}

inline const char* to_string(OutcomeStatus status) {
  switch(status) {
    case OutcomeStatus::Success: return "success";
    case OutcomeStatus::Skipped: return "skipped";
    case OutcomeStatus::Failed: return "failed";
    case OutcomeStatus::Requeued: return "requeued";
  }
  return "unknown";
}

inline const char* to_string(OutcomeReason reason) {
  switch(reason) {
    case OutcomeReason::None: return "none";
    case OutcomeReason::Moved: return "moved";
    case OutcomeReason::AlreadyPresent: return "already-present";
    case OutcomeReason::UnsupportedType: return "unsupported-type";
    case OutcomeReason::Gone: return "gone";
    case OutcomeReason::Locked: return "locked";
    case OutcomeReason::Unstable: return "unstable";
    case OutcomeReason::TimedOut: return "timed-out";
    case OutcomeReason::AgeGate: return "age-gate";
    case OutcomeReason::RequeueLimit: return "requeue-limit";
    case OutcomeReason::ConflictExhausted: return "conflict-exhausted";
    case OutcomeReason::ConfigurationError: return "configuration-error";
    case OutcomeReason::TransferError: return "transfer-error";
    case OutcomeReason::ValidationFailed: return "validation-failed";
    case OutcomeReason::SourceDeleteFailed: return "source-delete-failed";
  }
  return "unknown";
}
