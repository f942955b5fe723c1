#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstring>
#include <mutex>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> g_file_sink;
std::mutex g_init_mutex;
std::atomic<bool> g_log_passthrough{true};

constexpr const char* kRecordPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

void create_loggers() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kRecordPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kRecordPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("log.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("log.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("log.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("log.print_err", std::move(plain_err_sink));

  spdlog::register_logger(g_info_logger);
  spdlog::register_logger(g_error_logger);
  spdlog::register_logger(g_print_logger);
  spdlog::register_logger(g_print_err_logger);

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_init_mutex);
  if(!g_info_logger) create_loggers();
}

// Records from the info and error loggers are mirrored to the rotating file.
// Console-only output (print channels) is not.
void attach_file_sink(const LogOptions& options) {
  if(g_file_sink || options.file_path.empty()) return;
  try {
    g_file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      options.file_path,
      options.max_file_size > 0 ? options.max_file_size : 1024 * 1024,
      options.max_files > 0 ? options.max_files : 1);
    g_file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    g_info_logger->sinks().push_back(g_file_sink);
    g_error_logger->sinks().push_back(g_file_sink);
  } catch(const spdlog::spdlog_ex& e) {
    g_file_sink.reset();
    g_error_logger->error("Unable to open log file {}: {}", options.file_path, e.what());
  }
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", "log-listener", spdlog::level::err,
                              std::string("listener threw: ") + e.what());
    }
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      const std::string& channel_name,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(base_channel, channel_name, level, message);
}

void init(bool verbose) {
  LogOptions options;
  options.verbose = verbose;
  init(options);
}

void init(const LogOptions& options) {
  ensure_loggers();
  auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    attach_file_sink(options);
  }

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!g_log_passthrough.load(std::memory_order_acquire)) return;

  spdlog::logger* sink = nullptr;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
  } else if(std::strcmp(base_channel, "error") == 0 || std::strcmp(base_channel, "warn") == 0) {
    sink = g_error_logger.get();
  } else {
    sink = g_info_logger.get();
  }

  if(!sink) return;
  try {
    if(!channel_name.empty() && channel_name != base_channel) {
      sink->log(level, fmt::format("[{}] {}", channel_name, message));
    } else {
      sink->log(level, message);
    }
  } catch(const spdlog::spdlog_ex&) {
    // a failing sink must not propagate into the pipeline
  }
}

} // namespace detail
