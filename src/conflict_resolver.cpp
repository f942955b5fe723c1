#include "conflict_resolver.hpp"

#include <spdlog/fmt/fmt.h>

#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

bool occupied(const std::filesystem::path& path) {
  std::error_code ec;
  // symlink_status so a dangling link still counts as taken
  auto st = std::filesystem::symlink_status(path, ec);
  return !ec && std::filesystem::exists(st);
}

} // namespace

std::optional<ConflictStrategy> parse_conflict_strategy(const std::string& name) {
  auto lowered = SettingsManager::to_lower(SettingsManager::trim_copy(name));
  if(lowered == "timestamp") return ConflictStrategy::Timestamp;
  if(lowered == "counter") return ConflictStrategy::Counter;
  if(lowered == "skip") return ConflictStrategy::Skip;
  return std::nullopt;
}

const char* to_string(ConflictStrategy strategy) {
  switch(strategy) {
    case ConflictStrategy::Timestamp: return "timestamp";
    case ConflictStrategy::Counter: return "counter";
    case ConflictStrategy::Skip: return "skip";
  }
  return "unknown";
}

std::filesystem::path ConflictResolver::with_suffix(const std::filesystem::path& destination,
                                                    const std::string& suffix) {
  auto name = destination.stem().string() + suffix + destination.extension().string();
  return destination.parent_path() / name;
}

std::optional<std::filesystem::path> ConflictResolver::resolve(
  const std::filesystem::path& destination,
  ConflictStrategy strategy,
  std::chrono::system_clock::time_point now) {
  if(!occupied(destination)) return destination;

  switch(strategy) {
    case ConflictStrategy::Skip:
      return std::nullopt;

    case ConflictStrategy::Counter:
      for(int n = 1; n <= kMaxCounter; ++n) {
        auto candidate = with_suffix(destination, fmt::format(" ({})", n));
        if(!occupied(candidate)) return candidate;
      }
      return std::nullopt;

    case ConflictStrategy::Timestamp: {
      auto stamp = format_local_time(now, "_%Y%m%d_%H%M%S");
      auto candidate = with_suffix(destination, stamp);
      if(!occupied(candidate)) return candidate;

      auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
      candidate = with_suffix(destination, fmt::format("{}_{:03}", stamp, millis));
      if(!occupied(candidate)) return candidate;
      return std::nullopt;
    }
  }
  return std::nullopt;
}
