#include "transfer_orchestrator.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "local_transport.hpp"
#include "remote_shell_executor.hpp"
#include "remote_shell_transport.hpp"
#include "utils.hpp"

namespace {

OutcomeReason reason_for(NotReadyReason reason) {
  switch(reason) {
    case NotReadyReason::Locked: return OutcomeReason::Locked;
    case NotReadyReason::Unstable: return OutcomeReason::Unstable;
    case NotReadyReason::TimedOut: return OutcomeReason::TimedOut;
    case NotReadyReason::None: break;
  }
  return OutcomeReason::Unstable;
}

// Failures after which the file is still in the source and worth another look.
bool retry_later(const TransferOutcome& outcome) {
  if(outcome.status != OutcomeStatus::Failed) return false;
  return outcome.reason != OutcomeReason::RequeueLimit &&
         outcome.reason != OutcomeReason::SourceDeleteFailed;
}

std::chrono::system_clock::time_point from_statx(const struct statx_timestamp& ts) {
  auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
  return std::chrono::system_clock::time_point(
    std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

} // namespace

TransferOrchestrator::TransferOrchestrator(ConfigProvider config, std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    logger_(std::move(logger)),
    directory_cache_(std::make_shared<RemoteDirectoryCache>()),
    validator_(std::make_shared<IntegrityValidator>(logger_)),
    gate_(std::make_unique<StabilityGate>(logger_)) {
  if(!config_) {
    throw std::invalid_argument("TransferOrchestrator needs a configuration provider");
  }
  local_transport_ = std::make_shared<LocalTransport>(validator_, logger_);
  remote_transport_ = std::make_shared<RemoteShellTransport>(std::make_shared<SshShellExecutor>(logger_),
                                                             directory_cache_,
                                                             validator_,
                                                             logger_);
}

TransferOrchestrator::~TransferOrchestrator() {
  stop();
  std::lock_guard<std::mutex> lk(components_mutex_);
  if(watcher_) watcher_->stop();
}

void TransferOrchestrator::set_transport(TransportKind kind, std::shared_ptr<TransportBackend> backend) {
  std::lock_guard<std::mutex> lk(components_mutex_);
  if(kind == TransportKind::Local) {
    local_transport_ = std::move(backend);
  } else {
    remote_transport_ = std::move(backend);
  }
}

void TransferOrchestrator::set_sleeper(Sleeper sleeper) {
  std::lock_guard<std::mutex> lk(components_mutex_);
  gate_ = std::make_unique<StabilityGate>(logger_, std::move(sleeper));
}

void TransferOrchestrator::set_outcome_listener(OutcomeListener listener) {
  std::lock_guard<std::mutex> lk(components_mutex_);
  outcome_listener_ = std::move(listener);
}

void TransferOrchestrator::enqueue(QueuedFile item) {
  queue_.enqueue(std::move(item));
  wake();
}

void TransferOrchestrator::enqueue_detected(const std::filesystem::path& path, FileOrigin origin) {
  enqueue(QueuedFile::detected(path, origin));
}

void TransferOrchestrator::wake() {
  {
    std::lock_guard<std::mutex> lk(wake_mutex_);
    wake_pending_ = true;
  }
  wake_cv_.notify_all();
}

WatcherAdapter& TransferOrchestrator::ensure_watcher(const MoverConfig& config) {
  if(!watcher_ || watcher_->root() != config.source_dir) {
    if(watcher_) watcher_->stop();
    watcher_ = std::make_unique<WatcherAdapter>(config.source_dir, logger_);
    watcher_->set_callback([this](const std::filesystem::path& path){
      enqueue_detected(path, FileOrigin::Watched);
    });
  }
  return *watcher_;
}

std::size_t TransferOrchestrator::scan_existing() {
  auto config = config_();
  std::vector<std::filesystem::path> files;
  {
    std::lock_guard<std::mutex> lk(components_mutex_);
    files = ensure_watcher(config).enumerate_existing();
  }
  std::unordered_set<std::string> queued;
  for(const auto& item : queue_.snapshot()) {
    queued.insert(item.source_path.string());
  }
  std::size_t added = 0;
  for(const auto& file : files) {
    if(queued.count(file.string())) continue;
    queue_.enqueue(QueuedFile::detected(file, FileOrigin::ExistingScan));
    ++added;
  }
  if(added > 0) wake();
  log_info(logger_.get(), "Scan of {} queued {} file(s)", config.source_dir.string(), added);
  return added;
}

std::optional<std::chrono::system_clock::time_point> TransferOrchestrator::creation_time(const std::filesystem::path& path) {
  struct statx stx{};
  if(::statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT, STATX_BTIME | STATX_MTIME, &stx) != 0) {
    return std::nullopt;
  }
  if(stx.stx_mask & STATX_BTIME) return from_statx(stx.stx_btime);
  if(stx.stx_mask & STATX_MTIME) return from_statx(stx.stx_mtime);
  return std::nullopt;
}

TransferOutcome TransferOrchestrator::check_age(QueuedFile& item, const MoverConfig& config) {
  if(config.min_age.count() <= 0) return TransferOutcome::success(0, {});

  auto created = creation_time(item.source_path);
  if(!created) {
    return TransferOutcome::skipped(OutcomeReason::Gone, "creation time unavailable");
  }
  auto age = std::chrono::system_clock::now() - *created;
  if(age >= config.min_age) return TransferOutcome::success(0, {});

  if(draining_) {
    log_info(logger_.get(), "{} is younger than the minimum age, leaving it for the next run",
             item.source_path.string());
    return TransferOutcome::skipped(OutcomeReason::AgeGate, "shutdown");
  }

  item.requeue_count += 1;
  if(config.max_requeue_count > 0 && item.requeue_count > config.max_requeue_count) {
    log_warn(logger_.get(), "{} still too young after {} requeues, giving up",
             item.source_path.string(), config.max_requeue_count);
    return TransferOutcome::failed(OutcomeReason::RequeueLimit,
                                   "requeued " + std::to_string(config.max_requeue_count) + " times");
  }
  item.not_before = std::chrono::steady_clock::now() + config.requeue_delay;
  auto remaining = std::chrono::duration_cast<std::chrono::minutes>(config.min_age - age);
  log_debug(logger_.get(), "{} too young ({} min to go), requeue #{}",
            item.source_path.string(), remaining.count(), item.requeue_count);
  return TransferOutcome::requeued(OutcomeReason::AgeGate, std::to_string(remaining.count()) + " min to go");
}

TransferOutcome TransferOrchestrator::run_pipeline(QueuedFile& item, const MoverConfig& config) {
  if(!config.problems.empty()) {
    auto detail = join_strings(config.problems, "; ");
    log_error(logger_.get(), "Not moving {}: {}", item.source_path.string(), detail);
    return TransferOutcome::failed(OutcomeReason::ConfigurationError, detail);
  }

  if(!config.accepts_extension(item.source_path)) {
    log_debug(logger_.get(), "Ignoring {}: unsupported type", item.source_path.string());
    return TransferOutcome::skipped(OutcomeReason::UnsupportedType, item.source_path.extension().string());
  }

  std::shared_ptr<TransportBackend> transport;
  {
    std::lock_guard<std::mutex> lk(components_mutex_);
    transport = config.transport == TransportKind::Local ? local_transport_ : remote_transport_;
  }
  // Creation time never changes: a requeued item re-checks its age before
  // paying for another stability wait.
  const bool age_first = item.requeue_count > 0;
  if(age_first) {
    auto age = check_age(item, config);
    if(!age.succeeded()) return age;
  }

  auto gate = gate_->is_ready_to_move(item.source_path, item.origin, config.stability);
  if(gate.status == GateStatus::Gone) {
    log_info(logger_.get(), "{} disappeared before it could be moved", item.source_path.string());
    return TransferOutcome::skipped(OutcomeReason::Gone, gate.detail);
  }
  if(!gate.ready()) {
    log_warn(logger_.get(), "{} is not ready ({}): {}", item.source_path.string(),
             to_string(gate.reason), gate.detail);
    return TransferOutcome::failed(reason_for(gate.reason), gate.detail);
  }

  if(!age_first) {
    auto age = check_age(item, config);
    if(!age.succeeded()) return age;
  }

  if(!transport) {
    return TransferOutcome::failed(OutcomeReason::ConfigurationError,
                                   std::string("no ") + to_string(config.transport) + " transport");
  }
  return transport->move(item, config);
}

TransferOutcome TransferOrchestrator::guarded_run(QueuedFile& item, const MoverConfig& config) {
  try {
    return run_pipeline(item, config);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Unexpected error while processing {}: {}", item.source_path.string(), e.what());
    return TransferOutcome::failed(OutcomeReason::TransferError, e.what());
  }
}

std::optional<MoverConfig> TransferOrchestrator::snapshot_config() const {
  try {
    return config_();
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Configuration unavailable: {}", e.what());
    return std::nullopt;
  }
}

TransferOutcome TransferOrchestrator::process_item(QueuedFile& item) {
  auto config = snapshot_config();
  if(!config) {
    return TransferOutcome::failed(OutcomeReason::ConfigurationError, "configuration unavailable");
  }
  return guarded_run(item, *config);
}

void TransferOrchestrator::record(const QueuedFile& item, const TransferOutcome& outcome, std::chrono::milliseconds cooldown) {
  statistics_.record(outcome);

  if(retry_later(outcome)) {
    std::lock_guard<std::mutex> lk(components_mutex_);
    if(watcher_) watcher_->release(item.source_path, cooldown);
  }

  OutcomeListener listener;
  {
    std::lock_guard<std::mutex> lk(components_mutex_);
    listener = outcome_listener_;
  }
  if(!listener) return;
  try {
    listener(item, outcome);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Outcome listener failed: {}", e.what());
  }
}

std::optional<TransferOutcome> TransferOrchestrator::process_next() {
  // Deferred items rotate to the tail; look at each queued item at most once.
  auto budget = queue_.count();
  for(std::size_t i = 0; i < budget; ++i) {
    auto next = queue_.try_dequeue();
    if(!next) return std::nullopt;
    auto item = std::move(*next);
    if(!draining_ && item.not_before > std::chrono::steady_clock::now()) {
      queue_.enqueue(std::move(item));
      continue;
    }

    auto config = snapshot_config();
    auto outcome = config
      ? guarded_run(item, *config)
      : TransferOutcome::failed(OutcomeReason::ConfigurationError, "configuration unavailable");
    if(outcome.status == OutcomeStatus::Requeued) {
      queue_.enqueue(item);
    }
    record(item, outcome, config ? config->retry_cooldown : std::chrono::milliseconds(0));
    return outcome;
  }
  return std::nullopt;
}

void TransferOrchestrator::start() {
  if(running_.exchange(true)) {
    throw std::runtime_error("transfer loop is already running");
  }
  MoverConfig config;
  try {
    config = config_();
  } catch(const std::exception& e) {
    running_ = false;
    throw std::runtime_error(std::string("unable to read configuration: ") + e.what());
  }
  if(auto error = config.start_error()) {
    running_ = false;
    throw std::runtime_error(*error);
  }
  draining_ = false;

  log_info(logger_.get(), "Moving files from {} to {} ({} transport, conflicts: {})",
           config.source_dir.string(),
           config.transport == TransportKind::Local ? config.destination_dir.string()
                                                    : config.remote.target() + ":" + config.remote.path,
           to_string(config.transport),
           to_string(config.conflict_strategy));

  if(config.process_existing) {
    scan_existing();
  } else {
    std::lock_guard<std::mutex> lk(components_mutex_);
    ensure_watcher(config).enumerate_existing();
  }
  {
    std::lock_guard<std::mutex> lk(components_mutex_);
    watcher_->start(config.watch_interval);
  }

  while(!stop_requested_) {
    auto outcome = process_next();
    if(outcome) continue;
    std::chrono::milliseconds idle = config.poll_interval;
    if(auto current = snapshot_config()) idle = current->poll_interval;
    std::unique_lock<std::mutex> lk(wake_mutex_);
    wake_cv_.wait_for(lk, idle, [this]{ return stop_requested_.load() || wake_pending_; });
    wake_pending_ = false;
  }

  {
    std::lock_guard<std::mutex> lk(components_mutex_);
    if(watcher_) watcher_->stop();
  }
  drain_on_shutdown();
  stop_requested_ = false;
  running_ = false;
  auto stats = statistics();
  log_info(logger_.get(), "Stopped: {} moved, {} skipped, {} errors, {} bytes",
           stats.files_moved, stats.files_skipped, stats.errors, stats.total_bytes_moved);
}

void TransferOrchestrator::drain_on_shutdown() {
  auto remaining = queue_.drain();
  if(remaining.empty()) return;
  log_info(logger_.get(), "Finishing {} queued file(s) before exit", remaining.size());
  draining_ = true;
  for(auto& item : remaining) {
    queue_.enqueue(std::move(item));
  }
  while(process_next()) {}
  draining_ = false;
}

void TransferOrchestrator::stop() {
  stop_requested_ = true;
  wake();
}

StatisticsSnapshot TransferOrchestrator::statistics() const {
  return statistics_.snapshot(queue_.count());
}
