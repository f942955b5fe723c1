#include "config.hpp"
#include "conflict_resolver.hpp"
#include "processing_queue.hpp"
#include "remote_directory_cache.hpp"
#include "settings_manager.hpp"
#include "stability_gate.hpp"
#include "statistics.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <ctime>

namespace mover::test {
namespace {

std::chrono::system_clock::time_point local_time(int year, int month, int day, int hour, int min, int sec) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = min;
  tm.tm_sec = sec;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

// Holds an exclusive flock for its lifetime, like a sync client mid-download.
class HeldLock {
public:
  explicit HeldLock(const std::filesystem::path& path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if(fd_ >= 0 && ::flock(fd_, LOCK_EX) != 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }
  ~HeldLock() {
    if(fd_ >= 0) ::close(fd_);
  }
  bool held() const { return fd_ >= 0; }
private:
  int fd_ = -1;
};

StabilityPolicy policy(long long sample_ms, long long quiet_ms, long long timeout_ms) {
  StabilityPolicy p;
  p.lock_check = true;
  p.sample_interval = std::chrono::milliseconds(sample_ms);
  p.final_quiet = std::chrono::milliseconds(quiet_ms);
  p.timeout = std::chrono::milliseconds(timeout_ms);
  return p;
}

bool test_queue_fifo_and_drain(TestContext&) {
  ProcessingQueue queue;
  if(queue.try_dequeue()) return false;
  queue.enqueue(QueuedFile::detected("/src/a.jpg", FileOrigin::Watched));
  queue.enqueue(QueuedFile::detected("/src/b.jpg", FileOrigin::ExistingScan));
  queue.enqueue(QueuedFile::detected("/src/c.jpg", FileOrigin::Watched));
  if(queue.count() != 3) return false;

  auto first = queue.try_dequeue();
  if(!first || first->source_path != "/src/a.jpg") return false;
  queue.enqueue(*first);

  auto snapshot = queue.snapshot();
  if(snapshot.size() != 3 || snapshot.back().source_path != "/src/a.jpg") return false;

  auto drained = queue.drain();
  return drained.size() == 3 &&
         drained[0].source_path == "/src/b.jpg" &&
         drained[1].source_path == "/src/c.jpg" &&
         drained[2].source_path == "/src/a.jpg" &&
         queue.count() == 0;
}

bool test_queue_concurrent_producers(TestContext&) {
  ProcessingQueue queue;
  std::vector<std::thread> producers;
  for(int t = 0; t < 4; ++t) {
    producers.emplace_back([&queue, t]{
      for(int i = 0; i < 250; ++i) {
        queue.enqueue(QueuedFile::detected("/src/" + std::to_string(t) + "_" + std::to_string(i), FileOrigin::Watched));
      }
    });
  }
  std::size_t consumed = 0;
  while(consumed < 1000) {
    if(queue.try_dequeue()) ++consumed;
  }
  for(auto& p : producers) p.join();
  return queue.count() == 0;
}

bool test_conflict_free_name_unchanged(TestContext&) {
  Workspace ws("conflict_free");
  auto dest = ws.destination() / "IMG_0001.JPG";
  for(auto strategy : {ConflictStrategy::Timestamp, ConflictStrategy::Counter, ConflictStrategy::Skip}) {
    auto resolved = ConflictResolver::resolve(dest, strategy);
    if(!resolved || *resolved != dest) return false;
  }
  return true;
}

bool test_conflict_timestamp_names(TestContext&) {
  Workspace ws("conflict_timestamp");
  auto dest = ws.destination() / "IMG_0001.JPG";
  write_file(dest, "existing");
  auto now = local_time(2025, 1, 1, 12, 0, 0);

  auto first = ConflictResolver::resolve(dest, ConflictStrategy::Timestamp, now);
  if(!first || first->filename() != "IMG_0001_20250101_120000.JPG") return false;
  write_file(*first, "second");

  auto later = now + std::chrono::milliseconds(123);
  auto second = ConflictResolver::resolve(dest, ConflictStrategy::Timestamp, later);
  if(!second || second->filename() != "IMG_0001_20250101_120000_123.JPG") return false;
  write_file(*second, "third");

  return !ConflictResolver::resolve(dest, ConflictStrategy::Timestamp, later);
}

bool test_conflict_counter_bound(TestContext&) {
  Workspace ws("conflict_counter");
  auto dest = ws.destination() / "clip.mov";
  write_file(dest, "x");
  for(int n = 1; n <= 998; ++n) {
    write_file(ConflictResolver::with_suffix(dest, " (" + std::to_string(n) + ")"), "x");
  }
  auto last = ConflictResolver::resolve(dest, ConflictStrategy::Counter);
  if(!last || last->filename() != "clip (999).mov") return false;
  write_file(*last, "x");
  return !ConflictResolver::resolve(dest, ConflictStrategy::Counter);
}

bool test_conflict_skip_refuses(TestContext&) {
  Workspace ws("conflict_skip");
  auto dest = ws.destination() / "a.jpg";
  write_file(dest, "x");
  return !ConflictResolver::resolve(dest, ConflictStrategy::Skip);
}

bool test_conflict_strategy_parsing(TestContext&) {
  return parse_conflict_strategy("Timestamp") == ConflictStrategy::Timestamp &&
         parse_conflict_strategy(" COUNTER ") == ConflictStrategy::Counter &&
         parse_conflict_strategy("skip") == ConflictStrategy::Skip &&
         !parse_conflict_strategy("overwrite");
}

bool test_gate_stable_file_ready(TestContext& ctx) {
  Workspace ws("gate_stable");
  auto file = ws.source() / "a.jpg";
  write_file(file, "finished");
  auto sleeper = std::make_shared<RecordingSleeper>();
  StabilityGate gate(ctx.logger, sleeper_for(sleeper));
  auto result = gate.is_ready_to_move(file, FileOrigin::Watched, policy(5000, 10000, 300000));
  return result.ready() && sleeper->total_ms() == 15000;
}

bool test_gate_converges_after_growth(TestContext& ctx) {
  Workspace ws("gate_converge");
  auto file = ws.source() / "a.mov";
  write_file(file, "part");
  auto sleeper = std::make_shared<RecordingSleeper>();
  sleeper->on_sleep([&](int call){
    if(call == 1) append_file(file, "-more");
  });
  StabilityGate gate(ctx.logger, sleeper_for(sleeper));
  auto result = gate.is_ready_to_move(file, FileOrigin::Watched, policy(1000, 1000, 10000));
  return result.ready() && sleeper->calls() == 3;
}

bool test_gate_unstable_single_pass(TestContext& ctx) {
  Workspace ws("gate_unstable");
  auto file = ws.source() / "a.mov";
  write_file(file, "part");
  auto sleeper = std::make_shared<RecordingSleeper>();
  sleeper->on_sleep([&](int){ append_file(file, "+"); });
  StabilityGate gate(ctx.logger, sleeper_for(sleeper));
  auto result = gate.is_ready_to_move(file, FileOrigin::Watched, policy(100, 100, 0));
  return result.status == GateStatus::NotReady && result.reason == NotReadyReason::Unstable;
}

bool test_gate_locked_file(TestContext& ctx) {
  Workspace ws("gate_locked");
  auto file = ws.source() / "a.jpg";
  write_file(file, "downloading");
  HeldLock lock(file);
  if(!lock.held()) return false;

  auto sleeper = std::make_shared<RecordingSleeper>();
  StabilityGate gate(ctx.logger, sleeper_for(sleeper));
  auto single = gate.is_ready_to_move(file, FileOrigin::Watched, policy(1000, 1000, 0));
  if(single.status != GateStatus::NotReady || single.reason != NotReadyReason::Locked) return false;

  auto bounded = gate.is_ready_to_move(file, FileOrigin::Watched, policy(1000, 1000, 3000));
  if(bounded.reason != NotReadyReason::TimedOut) return false;

  // Lock checking switched off: the flock is not consulted.
  auto relaxed = policy(0, 0, 0);
  relaxed.lock_check = false;
  return gate.is_ready_to_move(file, FileOrigin::Watched, relaxed).ready();
}

bool test_gate_existing_scan_skips_sampling(TestContext& ctx) {
  Workspace ws("gate_existing");
  auto file = ws.source() / "a.jpg";
  write_file(file, "old");
  auto sleeper = std::make_shared<RecordingSleeper>();
  StabilityGate gate(ctx.logger, sleeper_for(sleeper));
  auto result = gate.is_ready_to_move(file, FileOrigin::ExistingScan, policy(5000, 10000, 300000));
  return result.ready() && sleeper->calls() == 0;
}

bool test_gate_gone(TestContext& ctx) {
  Workspace ws("gate_gone");
  auto sleeper = std::make_shared<RecordingSleeper>();
  StabilityGate gate(ctx.logger, sleeper_for(sleeper));
  auto missing = gate.is_ready_to_move(ws.source() / "nope.jpg", FileOrigin::Watched, policy(10, 10, 0));
  if(missing.status != GateStatus::Gone) return false;

  auto file = ws.source() / "a.jpg";
  write_file(file, "soon deleted");
  sleeper->on_sleep([&](int){
    std::error_code ec;
    std::filesystem::remove(file, ec);
  });
  auto vanished = gate.is_ready_to_move(file, FileOrigin::Watched, policy(10, 10, 1000));
  return vanished.status == GateStatus::Gone;
}

bool test_directory_cache(TestContext&) {
  RemoteDirectoryCache cache;
  if(RemoteDirectoryCache::canonicalize("/a//b///c/") != "/a/b/c") return false;
  if(RemoteDirectoryCache::canonicalize("/") != "/") return false;
  if(!cache.mark_created("/a/b")) return false;
  if(cache.mark_created("/a//b/")) return false;
  return cache.contains("/a/b/") && !cache.contains("/a") && cache.size() == 1;
}

bool test_statistics_counters(TestContext&) {
  Statistics stats;
  stats.record(TransferOutcome::success(100, "/d/a.jpg"));
  stats.record(TransferOutcome::success(50, "/d/b.jpg"));
  stats.record(TransferOutcome::skipped(OutcomeReason::AlreadyPresent));
  stats.record(TransferOutcome::failed(OutcomeReason::TransferError));
  stats.record(TransferOutcome::requeued(OutcomeReason::AgeGate));
  auto s = stats.snapshot(7);
  return s.files_processed == 4 && s.files_moved == 2 && s.files_skipped == 1 &&
         s.errors == 1 && s.requeued == 1 && s.total_bytes_moved == 150 && s.queue_size == 7;
}

bool test_hex_and_hash_helpers(TestContext&) {
  std::string raw;
  for(int i = 0; i < 256; ++i) raw.push_back(static_cast<char>(i));
  auto hex = hex_encode(raw.data(), raw.size());
  if(hex.substr(0, 8) != "00010203" || hex.substr(hex.size() - 4) != "feff") return false;

  std::vector<char> decoded;
  if(!hex_decode(hex.substr(0, 100) + "\n" + hex.substr(100), decoded)) return false;
  if(std::string(decoded.begin(), decoded.end()) != raw) return false;
  std::vector<char> bad;
  if(hex_decode("abc", bad) || hex_decode("zz", bad)) return false;

  Workspace ws("hash");
  write_file(ws.root() / "abc.txt", "abc");
  auto digest = sha256_file(ws.root() / "abc.txt");
  return digest && *digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" &&
         !sha256_file(ws.root() / "missing");
}

bool test_shell_quote(TestContext&) {
  return shell_quote("plain") == "'plain'" &&
         shell_quote("it's") == "'it'\\''s'" &&
         shell_words("mkdir -p " + shell_quote("/a b/it's")) ==
           std::vector<std::string>({"mkdir", "-p", "/a b/it's"}) &&
         contains_whitespace("a b") && contains_whitespace("a\tb") && !contains_whitespace("ab");
}

bool test_extension_list_parsing(TestContext&) {
  auto list = parse_extension_list("JPG, .mov,,jpg ,  .HEIC");
  if(list != std::vector<std::string>({".jpg", ".mov", ".heic"})) return false;
  MoverConfig cfg;
  cfg.extensions = list;
  if(!cfg.accepts_extension("/x/IMG_1.JPG") || cfg.accepts_extension("/x/notes.txt")) return false;
  cfg.extensions.clear();
  return cfg.accepts_extension("/x/notes.txt");
}

bool test_config_snapshot(TestContext&) {
  Workspace ws("config");
  auto settings = make_settings(ws);
  configure(*settings, "conflict_strategy", "Counter");
  configure(*settings, "transport", "ssh");
  configure(*settings, "min_age_hours", 2.0);
  configure(*settings, "requeue_delay_seconds", 1.5);
  configure(*settings, "remote_port", 2222);
  auto provider = make_settings_provider(settings);
  auto cfg = provider();
  if(!cfg.problems.empty()) return false;
  if(cfg.conflict_strategy != ConflictStrategy::Counter) return false;
  if(cfg.transport != TransportKind::Remote) return false;
  if(cfg.min_age != std::chrono::hours(2)) return false;
  if(cfg.requeue_delay != std::chrono::milliseconds(1500)) return false;
  if(cfg.remote.port != 2222 || cfg.remote.target() != "media@nas.local") return false;
  if(cfg.stability.timeout.count() != 0) return false;
  if(cfg.start_error()) return false;

  configure(*settings, "conflict_strategy", "newest");
  auto broken = provider();
  if(broken.problems.size() != 1 || !broken.start_error()) return false;

  configure(*settings, "conflict_strategy", "skip");
  configure(*settings, "remote_host", "");
  auto missing = provider();
  auto err = missing.start_error();
  return err && err->find("remote_host") != std::string::npos;
}

bool test_config_start_errors(TestContext&) {
  Workspace ws("config_start");
  auto settings = make_settings(ws);
  configure(*settings, "source_dir", (ws.root() / "absent").string());
  auto cfg = MoverConfig::from_settings(*settings);
  if(!cfg.start_error()) return false;
  configure(*settings, "source_dir", ws.source().string());
  configure(*settings, "destination_dir", "");
  return MoverConfig::from_settings(*settings).start_error().has_value();
}

bool test_settings_aliases_and_persistence(TestContext&) {
  Workspace ws("settings");
  SettingsManager settings;
  settings.set_settings_path(ws.root() / ".config" / "settings.json");
  std::string error;
  if(!settings.set_from_string("cs", "counter", error)) return false;
  if(!settings.set_from_string("timeout", "12.5", error)) return false;
  if(settings.set_from_string("mrc", "three", error)) return false;
  if(!settings.set_from_string("interactive", "yes", error)) return false;
  if(settings.get<std::string>("conflict_strategy") != "counter") return false;
  if(!settings.save()) return false;

  SettingsManager reloaded;
  reloaded.set_settings_path(settings.settings_path());
  if(!reloaded.load()) return false;
  return reloaded.get<std::string>("conflict_strategy") == "counter" &&
         reloaded.get<double>("stability_timeout_seconds") == 12.5 &&
         !reloaded.get<bool>("interactive");
}

} // namespace

std::vector<TestCase> core_tests() {
  return {
    {"queue_fifo_and_drain", test_queue_fifo_and_drain},
    {"queue_concurrent_producers", test_queue_concurrent_producers},
    {"conflict_free_name_unchanged", test_conflict_free_name_unchanged},
    {"conflict_timestamp_names", test_conflict_timestamp_names},
    {"conflict_counter_bound", test_conflict_counter_bound},
    {"conflict_skip_refuses", test_conflict_skip_refuses},
    {"conflict_strategy_parsing", test_conflict_strategy_parsing},
    {"gate_stable_file_ready", test_gate_stable_file_ready},
    {"gate_converges_after_growth", test_gate_converges_after_growth},
    {"gate_unstable_single_pass", test_gate_unstable_single_pass},
    {"gate_locked_file", test_gate_locked_file},
    {"gate_existing_scan_skips_sampling", test_gate_existing_scan_skips_sampling},
    {"gate_gone", test_gate_gone},
    {"directory_cache", test_directory_cache},
    {"statistics_counters", test_statistics_counters},
    {"hex_and_hash_helpers", test_hex_and_hash_helpers},
    {"shell_quote", test_shell_quote},
    {"extension_list_parsing", test_extension_list_parsing},
    {"config_snapshot", test_config_snapshot},
    {"config_start_errors", test_config_start_errors},
    {"settings_aliases_and_persistence", test_settings_aliases_and_persistence},
  };
}

} // namespace mover::test
