#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

enum class ConflictStrategy { Timestamp, Counter, Skip };

std::optional<ConflictStrategy> parse_conflict_strategy(const std::string& name);
const char* to_string(ConflictStrategy strategy);

// Picks a destination that does not exist yet. Returns nullopt when the
// strategy refuses (Skip on an existing file) or runs out of names.
class ConflictResolver {
public:
  static constexpr int kMaxCounter = 999;

  static std::optional<std::filesystem::path> resolve(
    const std::filesystem::path& destination,
    ConflictStrategy strategy,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

  static std::filesystem::path with_suffix(const std::filesystem::path& destination,
                                           const std::string& suffix);
};
