#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "log.hpp"

// Polls the source tree on a steady_timer and reports regular files it has
// not seen before. Hidden files and directories are ignored.
class WatcherAdapter {
public:
  using FileDetected = std::function<void(const std::filesystem::path&)>;

  explicit WatcherAdapter(std::filesystem::path root, std::shared_ptr<Logger> logger = nullptr);
  ~WatcherAdapter();

  WatcherAdapter(const WatcherAdapter&) = delete;
  WatcherAdapter& operator=(const WatcherAdapter&) = delete;

  void set_callback(FileDetected callback);

  // Lists files present now and marks them as known, so the timer does not
  // report them again.
  std::vector<std::filesystem::path> enumerate_existing();

  void start(std::chrono::seconds interval);
  void stop();
  bool running() const { return running_.load(); }

  // One scan; returns the number of files reported.
  std::size_t poll_once();

  // Lets a known file be reported again once `cooldown` has passed, as long as
  // it is still in the tree.
  void release(const std::filesystem::path& path, std::chrono::milliseconds cooldown);

  std::size_t known_count() const;

  const std::filesystem::path& root() const { return root_; }

private:
  using Clock = std::chrono::steady_clock;

  void schedule_tick();
  std::vector<std::filesystem::path> list_files() const;

  std::filesystem::path root_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  FileDetected callback_;
  // Path -> earliest time it may be reported again; max() while tracked.
  std::unordered_map<std::string, Clock::time_point> known_;

  asio::io_context io_;
  std::unique_ptr<asio::steady_timer> timer_;
  std::thread io_thread_;
  std::chrono::seconds interval_{5};
  std::atomic<bool> running_{false};
};
