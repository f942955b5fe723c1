#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "conflict_resolver.hpp"
#include "stability_gate.hpp"

class SettingsManager;

enum class TransportKind { Local, Remote };

std::optional<TransportKind> parse_transport_kind(const std::string& name);
const char* to_string(TransportKind kind);

// Lowercased, dot-prefixed, de-duplicated. "JPG, .mov" -> {".jpg", ".mov"}.
std::vector<std::string> parse_extension_list(const std::string& text);

struct RemoteSettings {
  std::string host;
  std::string user;
  int port = 22;
  std::string key_file;
  std::string path;
  bool validate_size = true;
  bool delete_source = true;
  int connect_timeout = 10;
  std::string cipher;
  int retry_attempts = 3;
  std::chrono::milliseconds retry_delay{2000};

  std::string target() const { return user + "@" + host; }
};

// Immutable view of the settings taken at one point in time.
struct MoverConfig {
  std::filesystem::path source_dir;
  std::filesystem::path destination_dir;
  TransportKind transport = TransportKind::Local;
  std::vector<std::string> extensions;
  bool mirror_subdirectories = true;
  ConflictStrategy conflict_strategy = ConflictStrategy::Timestamp;
  StabilityPolicy stability;
  std::chrono::milliseconds min_age{0};
  uint32_t max_requeue_count = 0;
  std::chrono::milliseconds requeue_delay{30000};
  std::chrono::milliseconds retry_cooldown{300000};
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::seconds watch_interval{5};
  bool process_existing = true;
  uint64_t hash_size_limit = 512ull * 1024 * 1024;
  RemoteSettings remote;

  // Values that could not be interpreted (unknown strategy name, ...).
  std::vector<std::string> problems;

  bool accepts_extension(const std::filesystem::path& path) const;

  // Missing remote host/user/path when the remote transport is selected.
  std::optional<std::string> remote_error() const;

  // Everything that makes a run impossible before the first file.
  std::optional<std::string> start_error() const;

  static MoverConfig from_settings(const SettingsManager& settings);
};

using ConfigProvider = std::function<MoverConfig()>;

// Re-reads the shared settings on every call.
ConfigProvider make_settings_provider(std::shared_ptr<SettingsManager> settings);
