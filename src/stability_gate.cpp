#include "stability_gate.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <thread>

namespace {

constexpr std::chrono::milliseconds kDefaultLockRetry{1000};

} // namespace

const char* to_string(GateStatus status) {
  switch(status) {
    case GateStatus::Ready: return "ready";
    case GateStatus::NotReady: return "not-ready";
    case GateStatus::Gone: return "gone";
  }
  return "unknown";
}

const char* to_string(NotReadyReason reason) {
  switch(reason) {
    case NotReadyReason::None: return "none";
    case NotReadyReason::Locked: return "locked";
    case NotReadyReason::Unstable: return "unstable";
    case NotReadyReason::TimedOut: return "timed-out";
  }
  return "unknown";
}

StabilityGate::StabilityGate(std::shared_ptr<Logger> logger, Sleeper sleeper)
  : logger_(std::move(logger)),
    sleeper_(std::move(sleeper)) {
  if(!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d){ std::this_thread::sleep_for(d); };
  }
}

// Exclusive flock on a read-only descriptor. A writer that holds any flock on
// the file (most sync clients do while downloading) makes this fail.
StabilityGate::LockProbe StabilityGate::probe_lock(const std::filesystem::path& path, bool lock_check) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if(fd < 0) {
    return (errno == ENOENT || errno == ENOTDIR) ? LockProbe::Missing : LockProbe::Locked;
  }
  LockProbe result = LockProbe::Available;
  if(lock_check) {
    if(::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      result = LockProbe::Locked;
    } else {
      ::flock(fd, LOCK_UN);
    }
  }
  ::close(fd);
  return result;
}

std::optional<StabilityGate::FileSample> StabilityGate::sample(const std::filesystem::path& path) {
  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec) || ec) return std::nullopt;
  FileSample s;
  s.size = std::filesystem::file_size(path, ec);
  if(ec) return std::nullopt;
  s.mtime = std::filesystem::last_write_time(path, ec);
  if(ec) return std::nullopt;
  return s;
}

GateResult StabilityGate::is_ready_to_move(const std::filesystem::path& path,
                                           FileOrigin origin,
                                           const StabilityPolicy& policy) const {
  using namespace std::chrono;
  const bool single_pass = policy.timeout.count() <= 0;
  const auto started = steady_clock::now();
  milliseconds slept{0};

  // The budget counts both wall time and requested sleeps so an injected
  // sleeper that returns immediately still makes progress towards the timeout.
  auto spent = [&]{
    auto wall = duration_cast<milliseconds>(steady_clock::now() - started);
    return std::max(wall, slept);
  };
  auto wait = [&](milliseconds d) -> bool {
    if(!single_pass && spent() + d > policy.timeout) return false;
    if(d.count() > 0) sleeper_(d);
    slept += d;
    return true;
  };
  auto gone = [&](const char* stage) {
    log_debug(logger_.get(), "{} disappeared during {}", path.string(), stage);
    return GateResult{GateStatus::Gone, NotReadyReason::None, stage};
  };
  auto timed_out = [&](NotReadyReason last) {
    return GateResult{GateStatus::NotReady, NotReadyReason::TimedOut,
                      std::string("last observation: ") + to_string(last)};
  };

  const auto lock_retry = policy.sample_interval.count() > 0 ? policy.sample_interval : kDefaultLockRetry;
  NotReadyReason last = NotReadyReason::None;

  for(;;) {
    auto probe = probe_lock(path, policy.lock_check);
    if(probe == LockProbe::Missing) return gone("lock check");
    if(probe == LockProbe::Locked) {
      last = NotReadyReason::Locked;
      if(single_pass) return {GateStatus::NotReady, NotReadyReason::Locked, "exclusive open failed"};
      if(!wait(lock_retry)) return timed_out(last);
      continue;
    }

    if(origin == FileOrigin::ExistingScan) {
      return {GateStatus::Ready, NotReadyReason::None, {}};
    }

    auto before = sample(path);
    if(!before) return gone("first sample");
    if(!wait(policy.sample_interval)) return timed_out(last);
    auto after = sample(path);
    if(!after) return gone("second sample");
    if(*before != *after) {
      last = NotReadyReason::Unstable;
      log_debug(logger_.get(), "{} still changing ({} -> {} bytes)", path.string(), before->size, after->size);
      if(single_pass) return {GateStatus::NotReady, NotReadyReason::Unstable, "size or mtime changed"};
      continue;
    }

    if(!wait(policy.final_quiet)) return timed_out(last);

    probe = probe_lock(path, policy.lock_check);
    if(probe == LockProbe::Missing) return gone("final check");
    if(probe == LockProbe::Locked) {
      last = NotReadyReason::Locked;
      if(single_pass) return {GateStatus::NotReady, NotReadyReason::Locked, "locked after quiet period"};
      continue;
    }
    auto settled = sample(path);
    if(!settled) return gone("final check");
    if(*settled != *after) {
      last = NotReadyReason::Unstable;
      if(single_pass) return {GateStatus::NotReady, NotReadyReason::Unstable, "changed during quiet period"};
      continue;
    }
    return {GateStatus::Ready, NotReadyReason::None, {}};
  }
}
