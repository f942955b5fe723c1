#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","source_dir"},                 {"aliases", {"src","s"}},            {"type","string"}, {"default",""},          {"description","Directory watched for finished media files"}, {"persistent", true}},
  {{"key","destination_dir"},            {"aliases", {"dest","d"}},           {"type","string"}, {"default",""},          {"description","Local destination root (local transport)"}, {"persistent", true}},
  {{"key","transport"},                  {"aliases", {"t"}},                  {"type","string"}, {"default","local"},     {"description","Transfer backend: local | remote"}, {"persistent", true}},
  {{"key","extensions"},                 {"aliases", {"ext"}},                {"type","string"}, {"default",".jpg,.jpeg,.png,.heic,.heif,.gif,.tif,.tiff,.dng,.cr2,.cr3,.nef,.arw,.raf,.orf,.rw2,.mp4,.mov,.m4v,.avi,.mts,.3gp"}, {"description","Comma separated list of handled file extensions (empty = all)"}, {"persistent", true}},
  {{"key","mirror_subdirectories"},      {"aliases", {"mirror"}},             {"type","bool"},   {"default",true},        {"description","Recreate the source sub-directory layout at the destination"}, {"persistent", true}},
  {{"key","conflict_strategy"},          {"aliases", {"conflict","cs"}},      {"type","string"}, {"default","timestamp"}, {"description","Name collision policy: timestamp | counter | skip"}, {"persistent", true}},
  {{"key","lock_check"},                 {"aliases", {"lock"}},               {"type","bool"},   {"default",true},        {"description","Require an exclusive lock before a file is considered finished"}, {"persistent", true}},
  {{"key","stability_sample_seconds"},   {"aliases", {"sample","sss"}},       {"type","float"},  {"default",5.0},         {"description","Seconds between the two size/mtime samples"}, {"persistent", true}},
  {{"key","final_quiet_seconds"},        {"aliases", {"quiet","fqs"}},        {"type","float"},  {"default",10.0},        {"description","Extra settle period after the file looked stable"}, {"persistent", true}},
  {{"key","stability_timeout_seconds"},  {"aliases", {"timeout","sts"}},      {"type","float"},  {"default",300.0},       {"description","Upper bound for the whole readiness check (0 = single pass)"}, {"persistent", true}},
  {{"key","min_age_hours"},              {"aliases", {"age","mah"}},          {"type","float"},  {"default",0.0},         {"description","Minimum age since creation before a file may move (0 = off)"}, {"persistent", true}},
  {{"key","max_requeue_count"},          {"aliases", {"mrc"}},                {"type","int"},    {"default",0},           {"description","Drop an age-gated item after this many requeues (0 = unlimited)"}, {"persistent", true}},
  {{"key","requeue_delay_seconds"},      {"aliases", {"rds"}},                {"type","float"},  {"default",30.0},        {"description","Delay before an age-gated item is evaluated again"}, {"persistent", true}},
  {{"key","retry_cooldown_seconds"},     {"aliases", {"cooldown","rcs"}},     {"type","float"},  {"default",300.0},       {"description","Wait before a failed file still in the source is picked up again"}, {"persistent", true}},
  {{"key","poll_interval_ms"},           {"aliases", {"poll","pim"}},         {"type","int"},    {"default",1000},        {"description","Idle sleep of the processing loop"}, {"persistent", true}},
  {{"key","watch_interval_seconds"},     {"aliases", {"watch","wis"}},        {"type","int"},    {"default",5},           {"description","Seconds between scans of the source tree"}, {"persistent", true}},
  {{"key","process_existing"},           {"aliases", {"existing","pe"}},      {"type","bool"},   {"default",true},        {"description","Queue files already present at startup"}, {"persistent", true}},
  {{"key","hash_size_limit_mb"},         {"aliases", {"hash_limit","hsl"}},   {"type","int"},    {"default",512},         {"description","Largest file (MiB) verified by SHA-256 on local moves"}, {"persistent", true}},
  {{"key","remote_host"},                {"aliases", {"host","rh"}},          {"type","string"}, {"default",""},          {"description","Remote host for the remote transport"}, {"persistent", true}},
  {{"key","remote_user"},                {"aliases", {"user","ru"}},          {"type","string"}, {"default",""},          {"description","Remote login user"}, {"persistent", true}},
  {{"key","remote_port"},                {"aliases", {"port","rp"}},          {"type","int"},    {"default",22},          {"description","Remote ssh port"}, {"persistent", true}},
  {{"key","remote_key"},                 {"aliases", {"key","rk"}},           {"type","string"}, {"default",""},          {"description","Private key file passed to ssh/scp"}, {"persistent", true}},
  {{"key","remote_path"},                {"aliases", {"rpath"}},              {"type","string"}, {"default",""},          {"description","Destination root on the remote host"}, {"persistent", true}},
  {{"key","remote_validate_size"},       {"aliases", {"rvs"}},                {"type","bool"},   {"default",true},        {"description","Compare remote and local size after upload"}, {"persistent", true}},
  {{"key","remote_delete_source"},       {"aliases", {"rds_move","move"}},    {"type","bool"},   {"default",true},        {"description","Delete the local file after a validated upload"}, {"persistent", true}},
  {{"key","remote_connect_timeout"},     {"aliases", {"rct"}},                {"type","int"},    {"default",10},          {"description","ssh ConnectTimeout in seconds"}, {"persistent", true}},
  {{"key","remote_cipher"},              {"aliases", {"cipher"}},             {"type","string"}, {"default","aes128-gcm@openssh.com"}, {"description","Preferred cipher for the fast copy path"}, {"persistent", true}},
  {{"key","remote_retry_attempts"},      {"aliases", {"rra"}},                {"type","int"},    {"default",3},           {"description","Attempts for remote commands failing at the connection level"}, {"persistent", true}},
  {{"key","remote_retry_delay_seconds"}, {"aliases", {"rrd"}},                {"type","float"},  {"default",2.0},         {"description","Delay between remote command attempts"}, {"persistent", true}},
  {{"key","log_file"},                   {"aliases", {"lf"}},                 {"type","string"}, {"default",""},          {"description","Rotating log file (empty = console only)"}, {"persistent", true}},
  {{"key","log_max_size_mb"},            {"aliases", {"lms"}},                {"type","int"},    {"default",10},          {"description","Size of one log file before rotation"}, {"persistent", true}},
  {{"key","log_max_files"},              {"aliases", {"lmf"}},                {"type","int"},    {"default",3},           {"description","Rotated log files kept"}, {"persistent", true}},
  {{"key","verbose"},                    {"aliases", {"v"}},                  {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","interactive"},                {"aliases", {"i","console"}},        {"type","bool"},   {"default",false},       {"description","Start the interactive status console"}, {"persistent", false}},
  {{"key","help"},                       {"aliases", {"h","?"}},              {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                       {"aliases", {"persist"}},            {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Every public member takes the settings lock, so a reader thread can build a
// snapshot while the console thread edits a value.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string description(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  void set_json(const nlohmann::json& doc);
  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const std::vector<SettingSpec>& setting_specs() const { return setting_specs_; }

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
  mutable std::recursive_mutex mutex_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs().size());
  for(const auto& spec : setting_specs()) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::string SettingsManager::description(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->description : std::string();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline void SettingsManager::set_json(const nlohmann::json& doc) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  merge_from_json(doc);
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs()) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "float") {
    if(value.is_number()) {
      settings_[spec.key] = value.get<double>();
      return true;
    }
    error = "expected number";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int parsed = std::stoi(clean, &consumed);
      if(consumed != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "float") {
    try {
      std::size_t consumed = 0;
      double parsed = std::stod(clean, &consumed);
      if(consumed != clean.size()) {
        error = "expected number";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if(!settings_.contains(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
