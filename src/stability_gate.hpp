#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "transfer_types.hpp"

struct StabilityPolicy {
  bool lock_check = true;
  std::chrono::milliseconds sample_interval{5000};
  std::chrono::milliseconds final_quiet{10000};
  // Zero means one evaluation: Locked/Unstable are reported instead of retried.
  std::chrono::milliseconds timeout{300000};
};

enum class GateStatus { Ready, NotReady, Gone };
enum class NotReadyReason { None, Locked, Unstable, TimedOut };

struct GateResult {
  GateStatus status = GateStatus::NotReady;
  NotReadyReason reason = NotReadyReason::None;
  std::string detail;

  bool ready() const { return status == GateStatus::Ready; }
};

const char* to_string(GateStatus status);
const char* to_string(NotReadyReason reason);

// Decides whether a file has finished being written. Files from the startup
// scan only get the lock check; live detections also get the size/mtime
// sampling and the final quiet period.
class StabilityGate {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  explicit StabilityGate(std::shared_ptr<Logger> logger = nullptr, Sleeper sleeper = {});

  GateResult is_ready_to_move(const std::filesystem::path& path,
                              FileOrigin origin,
                              const StabilityPolicy& policy) const;

  enum class LockProbe { Available, Locked, Missing };
  static LockProbe probe_lock(const std::filesystem::path& path, bool lock_check);

private:
  struct FileSample {
    uintmax_t size = 0;
    std::filesystem::file_time_type mtime{};
    bool operator==(const FileSample& other) const {
      return size == other.size && mtime == other.mtime;
    }
    bool operator!=(const FileSample& other) const { return !(*this == other); }
  };

  static std::optional<FileSample> sample(const std::filesystem::path& path);

  std::shared_ptr<Logger> logger_;
  Sleeper sleeper_;
};
