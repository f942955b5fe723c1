#include "watcher_adapter.hpp"

#include <algorithm>
#include <unordered_set>

namespace {

bool is_hidden(const std::filesystem::path& path) {
  auto name = path.filename().string();
  return !name.empty() && name[0] == '.';
}

} // namespace

WatcherAdapter::WatcherAdapter(std::filesystem::path root, std::shared_ptr<Logger> logger)
  : root_(std::move(root)), logger_(std::move(logger)) {}

WatcherAdapter::~WatcherAdapter() {
  stop();
}

void WatcherAdapter::set_callback(FileDetected callback) {
  std::lock_guard<std::mutex> lk(mutex_);
  callback_ = std::move(callback);
}

std::vector<std::filesystem::path> WatcherAdapter::list_files() const {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(
    root_, std::filesystem::directory_options::skip_permission_denied, ec);
  if(ec) {
    log_warn(logger_.get(), "Cannot scan {}: {}", root_.string(), ec.message());
    return files;
  }
  for(auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
    if(ec) {
      log_warn(logger_.get(), "Scan of {} interrupted: {}", root_.string(), ec.message());
      break;
    }
    const auto& entry = *it;
    if(is_hidden(entry.path())) {
      if(entry.is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    if(entry.is_regular_file(ec)) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::vector<std::filesystem::path> WatcherAdapter::enumerate_existing() {
  auto files = list_files();
  std::lock_guard<std::mutex> lk(mutex_);
  for(const auto& file : files) {
    known_[file.string()] = Clock::time_point::max();
  }
  return files;
}

std::size_t WatcherAdapter::poll_once() {
  auto files = list_files();
  std::vector<std::filesystem::path> fresh;
  FileDetected callback;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    auto now = Clock::now();
    std::unordered_set<std::string> present;
    for(const auto& file : files) {
      auto key = file.string();
      present.insert(key);
      auto it = known_.find(key);
      if(it == known_.end()) {
        known_.emplace(key, Clock::time_point::max());
        fresh.push_back(file);
      } else if(it->second != Clock::time_point::max() && it->second <= now) {
        it->second = Clock::time_point::max();
        fresh.push_back(file);
      }
    }
    // Forget files that left the tree so a new file with the same name counts.
    for(auto it = known_.begin(); it != known_.end();) {
      if(present.count(it->first) == 0) {
        it = known_.erase(it);
      } else {
        ++it;
      }
    }
    callback = callback_;
  }
  if(callback) {
    for(const auto& file : fresh) {
      log_debug(logger_.get(), "Detected {}", file.string());
      callback(file);
    }
  }
  return fresh.size();
}

void WatcherAdapter::release(const std::filesystem::path& path, std::chrono::milliseconds cooldown) {
  std::lock_guard<std::mutex> lk(mutex_);
  auto it = known_.find(path.string());
  if(it == known_.end()) return;
  it->second = Clock::now() + cooldown;
}

std::size_t WatcherAdapter::known_count() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return known_.size();
}

void WatcherAdapter::start(std::chrono::seconds interval) {
  if(running_.exchange(true)) return;
  interval_ = interval.count() > 0 ? interval : std::chrono::seconds(1);
  io_.restart();
  timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_tick();
  io_thread_ = std::thread([this](){
    io_.run();
  });
  log_info(logger_.get(), "Watching {} every {}s", root_.string(), interval_.count());
}

void WatcherAdapter::schedule_tick() {
  if(!timer_) return;
  timer_->expires_after(interval_);
  timer_->async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    try {
      poll_once();
    } catch(const std::exception& e) {
      log_error(logger_.get(), "Watcher scan failed: {}", e.what());
    }
    schedule_tick();
  });
}

void WatcherAdapter::stop() {
  if(!running_.exchange(false)) return;
  asio::post(io_, [this](){
    if(timer_) timer_->cancel();
  });
  io_.stop();
  if(io_thread_.joinable()) io_thread_.join();
  timer_.reset();
}
