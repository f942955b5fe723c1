#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "config.hpp"
#include "integrity_validator.hpp"
#include "log.hpp"
#include "processing_queue.hpp"
#include "remote_directory_cache.hpp"
#include "stability_gate.hpp"
#include "statistics.hpp"
#include "transfer_types.hpp"
#include "transport_backend.hpp"
#include "watcher_adapter.hpp"

// Owns the per-run state and drives every queued file through
// extension filter -> stability gate -> age gate -> transport.
class TransferOrchestrator {
public:
  using Sleeper = StabilityGate::Sleeper;
  using OutcomeListener = std::function<void(const QueuedFile&, const TransferOutcome&)>;

  explicit TransferOrchestrator(ConfigProvider config, std::shared_ptr<Logger> logger = nullptr);
  ~TransferOrchestrator();

  TransferOrchestrator(const TransferOrchestrator&) = delete;
  TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

  void set_transport(TransportKind kind, std::shared_ptr<TransportBackend> backend);
  void set_sleeper(Sleeper sleeper);
  void set_outcome_listener(OutcomeListener listener);

  void enqueue(QueuedFile item);
  void enqueue_detected(const std::filesystem::path& path, FileOrigin origin);

  // Queues every file under the source root that is not already queued.
  std::size_t scan_existing();

  // Runs one item through the pipeline. Age-gated items come back with an
  // updated requeue count and not_before but are not put back by this call.
  TransferOutcome process_item(QueuedFile& item);

  // Takes the first eligible item off the queue, processes it and records the
  // outcome. nullopt when nothing is eligible right now.
  std::optional<TransferOutcome> process_next();

  // Blocks until stop(); throws std::runtime_error when the configuration is
  // unusable or the loop is already running.
  void start();
  void stop();
  bool is_running() const { return running_.load(); }

  StatisticsSnapshot statistics() const;
  ProcessingQueue& queue() { return queue_; }
  const RemoteDirectoryCache& directory_cache() const { return *directory_cache_; }
  std::shared_ptr<RemoteDirectoryCache> shared_directory_cache() const { return directory_cache_; }
  std::shared_ptr<IntegrityValidator> validator() const { return validator_; }
  MoverConfig current_config() const { return config_(); }

  // Creation time used by the age gate: birth time where the filesystem
  // records it, modification time otherwise.
  static std::optional<std::chrono::system_clock::time_point> creation_time(const std::filesystem::path& path);

private:
  TransferOutcome run_pipeline(QueuedFile& item, const MoverConfig& config);
  TransferOutcome guarded_run(QueuedFile& item, const MoverConfig& config);
  std::optional<MoverConfig> snapshot_config() const;
  TransferOutcome check_age(QueuedFile& item, const MoverConfig& config);
  void record(const QueuedFile& item, const TransferOutcome& outcome, std::chrono::milliseconds cooldown);
  void drain_on_shutdown();
  void wake();
  WatcherAdapter& ensure_watcher(const MoverConfig& config);

  ConfigProvider config_;
  std::shared_ptr<Logger> logger_;

  ProcessingQueue queue_;
  Statistics statistics_;
  std::shared_ptr<RemoteDirectoryCache> directory_cache_;
  std::shared_ptr<IntegrityValidator> validator_;
  std::unique_ptr<StabilityGate> gate_;
  std::shared_ptr<TransportBackend> local_transport_;
  std::shared_ptr<TransportBackend> remote_transport_;
  std::unique_ptr<WatcherAdapter> watcher_;
  OutcomeListener outcome_listener_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  bool draining_ = false;
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  bool wake_pending_ = false;
  mutable std::mutex components_mutex_;
};
