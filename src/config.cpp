#include "config.hpp"

#include <algorithm>
#include <sstream>

#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
  if(seconds <= 0.0) return std::chrono::milliseconds(0);
  return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // namespace

std::optional<TransportKind> parse_transport_kind(const std::string& name) {
  auto lowered = SettingsManager::to_lower(SettingsManager::trim_copy(name));
  if(lowered == "local") return TransportKind::Local;
  if(lowered == "remote" || lowered == "ssh") return TransportKind::Remote;
  return std::nullopt;
}

const char* to_string(TransportKind kind) {
  switch(kind) {
    case TransportKind::Local: return "local";
    case TransportKind::Remote: return "remote";
  }
  return "unknown";
}

std::vector<std::string> parse_extension_list(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string token;
  while(std::getline(ss, token, ',')) {
    token = SettingsManager::to_lower(SettingsManager::trim_copy(token));
    if(token.empty()) continue;
    if(token.front() != '.') token.insert(token.begin(), '.');
    if(std::find(out.begin(), out.end(), token) == out.end()) {
      out.push_back(std::move(token));
    }
  }
  return out;
}

bool MoverConfig::accepts_extension(const std::filesystem::path& path) const {
  if(extensions.empty()) return true;
  auto ext = SettingsManager::to_lower(path.extension().string());
  return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

std::optional<std::string> MoverConfig::remote_error() const {
  std::vector<std::string> missing;
  if(remote.host.empty()) missing.push_back("remote_host");
  if(remote.user.empty()) missing.push_back("remote_user");
  if(remote.path.empty()) missing.push_back("remote_path");
  if(missing.empty()) return std::nullopt;
  return "remote transport requires " + join_strings(missing, ", ");
}

std::optional<std::string> MoverConfig::start_error() const {
  if(!problems.empty()) return join_strings(problems, "; ");
  if(source_dir.empty()) return std::string("source_dir is not set");
  std::error_code ec;
  if(!std::filesystem::is_directory(source_dir, ec)) {
    return "source_dir " + source_dir.string() + " is not an accessible directory";
  }
  if(transport == TransportKind::Local && destination_dir.empty()) {
    return std::string("destination_dir is not set");
  }
  if(transport == TransportKind::Remote) {
    return remote_error();
  }
  return std::nullopt;
}

MoverConfig MoverConfig::from_settings(const SettingsManager& settings) {
  // one locked copy so every field comes from the same moment
  const nlohmann::json doc = settings.get_json(false);
  MoverConfig cfg;
  cfg.source_dir = doc.at("source_dir").get<std::string>();
  cfg.destination_dir = doc.at("destination_dir").get<std::string>();

  auto transport_name = doc.at("transport").get<std::string>();
  if(auto kind = parse_transport_kind(transport_name)) {
    cfg.transport = *kind;
  } else {
    cfg.problems.push_back("unknown transport '" + transport_name + "'");
  }

  cfg.extensions = parse_extension_list(doc.at("extensions").get<std::string>());
  cfg.mirror_subdirectories = doc.at("mirror_subdirectories").get<bool>();

  auto strategy_name = doc.at("conflict_strategy").get<std::string>();
  if(auto strategy = parse_conflict_strategy(strategy_name)) {
    cfg.conflict_strategy = *strategy;
  } else {
    cfg.problems.push_back("unknown conflict_strategy '" + strategy_name + "'");
  }

  cfg.stability.lock_check = doc.at("lock_check").get<bool>();
  cfg.stability.sample_interval = seconds_to_ms(doc.at("stability_sample_seconds").get<double>());
  cfg.stability.final_quiet = seconds_to_ms(doc.at("final_quiet_seconds").get<double>());
  cfg.stability.timeout = seconds_to_ms(doc.at("stability_timeout_seconds").get<double>());

  cfg.min_age = seconds_to_ms(doc.at("min_age_hours").get<double>() * 3600.0);
  cfg.max_requeue_count = static_cast<uint32_t>(std::max(0, doc.at("max_requeue_count").get<int>()));
  cfg.requeue_delay = seconds_to_ms(doc.at("requeue_delay_seconds").get<double>());
  cfg.retry_cooldown = seconds_to_ms(doc.at("retry_cooldown_seconds").get<double>());
  cfg.poll_interval = std::chrono::milliseconds(std::max(10, doc.at("poll_interval_ms").get<int>()));
  cfg.watch_interval = std::chrono::seconds(std::max(1, doc.at("watch_interval_seconds").get<int>()));
  cfg.process_existing = doc.at("process_existing").get<bool>();
  cfg.hash_size_limit = static_cast<uint64_t>(std::max(0, doc.at("hash_size_limit_mb").get<int>())) * 1024 * 1024;

  cfg.remote.host = doc.at("remote_host").get<std::string>();
  cfg.remote.user = doc.at("remote_user").get<std::string>();
  cfg.remote.port = doc.at("remote_port").get<int>();
  cfg.remote.key_file = doc.at("remote_key").get<std::string>();
  cfg.remote.path = doc.at("remote_path").get<std::string>();
  cfg.remote.validate_size = doc.at("remote_validate_size").get<bool>();
  cfg.remote.delete_source = doc.at("remote_delete_source").get<bool>();
  cfg.remote.connect_timeout = doc.at("remote_connect_timeout").get<int>();
  cfg.remote.cipher = doc.at("remote_cipher").get<std::string>();
  cfg.remote.retry_attempts = std::max(1, doc.at("remote_retry_attempts").get<int>());
  cfg.remote.retry_delay = seconds_to_ms(doc.at("remote_retry_delay_seconds").get<double>());

  if(cfg.remote.port <= 0 || cfg.remote.port > 65535) {
    cfg.problems.push_back("invalid remote_port " + std::to_string(cfg.remote.port));
  }
  return cfg;
}

ConfigProvider make_settings_provider(std::shared_ptr<SettingsManager> settings) {
  return [settings = std::move(settings)]() {
    return MoverConfig::from_settings(*settings);
  };
}
