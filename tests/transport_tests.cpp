#include "config.hpp"
#include "integrity_validator.hpp"
#include "local_transport.hpp"
#include "remote_directory_cache.hpp"
#include "remote_shell_executor.hpp"
#include "remote_shell_transport.hpp"
#include "test_runner_utils.hpp"

#include <cerrno>

namespace mover::test {
namespace {

std::string binary_payload(std::size_t repeats) {
  std::string out;
  for(std::size_t r = 0; r < repeats; ++r) {
    for(int i = 0; i < 256; ++i) out.push_back(static_cast<char>(i));
  }
  return out;
}

struct RemoteRig {
  std::shared_ptr<FakeShellExecutor> executor;
  std::shared_ptr<RemoteDirectoryCache> cache;
  std::shared_ptr<RecordingSleeper> sleeper;
  std::unique_ptr<RemoteShellTransport> transport;
};

RemoteRig make_remote(const Workspace& ws, const std::shared_ptr<Logger>& logger) {
  RemoteRig rig;
  rig.executor = std::make_shared<FakeShellExecutor>(ws.remote());
  rig.cache = std::make_shared<RemoteDirectoryCache>();
  rig.sleeper = std::make_shared<RecordingSleeper>();
  rig.transport = std::make_unique<RemoteShellTransport>(rig.executor,
                                                         rig.cache,
                                                         std::make_shared<IntegrityValidator>(logger),
                                                         logger,
                                                         sleeper_for(rig.sleeper));
  return rig;
}

bool test_local_move_mirrors_subdirectories(TestContext& ctx) {
  Workspace ws("local_mirror");
  auto source = ws.source() / "2025" / "01" / "IMG_0001.JPG";
  write_file(source, "jpeg bytes");
  auto cfg = MoverConfig::from_settings(*make_settings(ws));
  LocalTransport transport(std::make_shared<IntegrityValidator>(ctx.logger), ctx.logger);
  auto outcome = transport.move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  auto expected = ws.destination() / "2025" / "01" / "IMG_0001.JPG";
  return outcome.succeeded() &&
         outcome.bytes == 10 &&
         outcome.destination == expected.string() &&
         read_file(expected) == "jpeg bytes" &&
         !std::filesystem::exists(source);
}

bool test_local_move_flat(TestContext& ctx) {
  Workspace ws("local_flat");
  auto source = ws.source() / "nested" / "a.jpg";
  write_file(source, "a");
  auto settings = make_settings(ws);
  configure(*settings, "mirror_subdirectories", false);
  configure(*settings, "hash_size_limit_mb", 0);
  auto cfg = MoverConfig::from_settings(*settings);
  LocalTransport transport(std::make_shared<IntegrityValidator>(ctx.logger), ctx.logger);
  auto outcome = transport.move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  return outcome.succeeded() && std::filesystem::exists(ws.destination() / "a.jpg");
}

bool test_local_counter_conflict(TestContext& ctx) {
  Workspace ws("local_counter");
  auto source = ws.source() / "a.jpg";
  write_file(source, "new");
  write_file(ws.destination() / "a.jpg", "old");
  auto settings = make_settings(ws);
  configure(*settings, "conflict_strategy", "counter");
  auto cfg = MoverConfig::from_settings(*settings);
  LocalTransport transport(std::make_shared<IntegrityValidator>(ctx.logger), ctx.logger);
  auto outcome = transport.move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  return outcome.succeeded() &&
         read_file(ws.destination() / "a.jpg") == "old" &&
         read_file(ws.destination() / "a (1).jpg") == "new";
}

bool test_local_skip_keeps_source(TestContext& ctx) {
  Workspace ws("local_skip");
  auto source = ws.source() / "a.jpg";
  write_file(source, "new");
  write_file(ws.destination() / "a.jpg", "old");
  auto settings = make_settings(ws);
  configure(*settings, "conflict_strategy", "skip");
  auto cfg = MoverConfig::from_settings(*settings);
  LocalTransport transport(std::make_shared<IntegrityValidator>(ctx.logger), ctx.logger);
  auto outcome = transport.move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  return outcome.status == OutcomeStatus::Skipped &&
         outcome.reason == OutcomeReason::AlreadyPresent &&
         read_file(source) == "new" &&
         read_file(ws.destination() / "a.jpg") == "old";
}

bool test_local_missing_source(TestContext& ctx) {
  Workspace ws("local_missing");
  auto cfg = MoverConfig::from_settings(*make_settings(ws));
  LocalTransport transport(std::make_shared<IntegrityValidator>(ctx.logger), ctx.logger);
  auto outcome = transport.move(QueuedFile::detected(ws.source() / "gone.jpg", FileOrigin::Watched), cfg);
  return outcome.status == OutcomeStatus::Skipped && outcome.reason == OutcomeReason::Gone;
}

// Reports EXDEV for the direct source rename to force the copy path.
LocalTransport::Renamer cross_volume_renamer(const std::filesystem::path& source_root, int* calls) {
  return [source_root, calls](const std::filesystem::path& from, const std::filesystem::path& to) {
    ++*calls;
    if(from.string().rfind(source_root.string(), 0) == 0) return EXDEV;
    return LocalTransport::rename_no_replace(from, to);
  };
}

bool test_local_move_cross_volume(TestContext& ctx) {
  Workspace ws("local_cross_volume");
  std::string payload(70000, '\0');
  for(std::size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<char>(i * 31 % 251);
  auto source = ws.source() / "2025" / "clip.mov";
  write_file(source, payload);
  auto cfg = MoverConfig::from_settings(*make_settings(ws));
  LocalTransport transport(std::make_shared<IntegrityValidator>(ctx.logger), ctx.logger);
  int calls = 0;
  transport.set_renamer(cross_volume_renamer(ws.source(), &calls));

  auto outcome = transport.move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  auto expected = ws.destination() / "2025" / "clip.mov";
  return outcome.succeeded() &&
         calls == 2 &&
         outcome.bytes == payload.size() &&
         read_file(expected) == payload &&
         !std::filesystem::exists(source) &&
         !std::filesystem::exists(ws.destination() / "2025" / ".clip.mov.mmpart") &&
         count_files(ws.destination()) == 1;
}

bool test_local_cross_volume_placement_failure(TestContext& ctx) {
  Workspace ws("local_cross_volume_fail");
  auto source = ws.source() / "a.jpg";
  write_file(source, "payload");
  auto cfg = MoverConfig::from_settings(*make_settings(ws));
  LocalTransport transport(std::make_shared<IntegrityValidator>(ctx.logger), ctx.logger);
  // Source rename crosses volumes, then the staged copy cannot be put in place.
  transport.set_renamer([&](const std::filesystem::path& from, const std::filesystem::path&) {
    return from == source ? EXDEV : EACCES;
  });

  auto outcome = transport.move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  return outcome.status == OutcomeStatus::Failed &&
         outcome.reason == OutcomeReason::TransferError &&
         read_file(source) == "payload" &&
         count_files(ws.destination()) == 0;
}

bool test_rename_never_replaces(TestContext&) {
  Workspace ws("rename_noreplace");
  write_file(ws.source() / "a.jpg", "new");
  write_file(ws.destination() / "a.jpg", "old");
  int err = LocalTransport::rename_no_replace(ws.source() / "a.jpg", ws.destination() / "a.jpg");
  return err == EEXIST &&
         read_file(ws.source() / "a.jpg") == "new" &&
         read_file(ws.destination() / "a.jpg") == "old";
}

bool test_validator_local_checks(TestContext& ctx) {
  Workspace ws("validator");
  IntegrityValidator validator(ctx.logger);
  write_file(ws.destination() / "a.jpg", "abc");

  LocalValidationContext ok;
  ok.source = ws.source() / "a.jpg";
  ok.destination = ws.destination() / "a.jpg";
  ok.expected_size = 3;
  ok.source_hash = sha256_file(ws.destination() / "a.jpg");
  if(!validator.verify(ok)) return false;

  auto wrong_hash = ok;
  wrong_hash.source_hash = std::string(64, '0');
  if(validator.verify(wrong_hash)) return false;

  auto wrong_size = ok;
  wrong_size.expected_size = 4;
  if(validator.verify(wrong_size)) return false;

  auto source_left = ok;
  write_file(ok.source, "abc");
  return !validator.verify(source_left);
}

bool test_remote_fast_path(TestContext& ctx) {
  Workspace ws("remote_fast");
  auto source = ws.source() / "trip" / "IMG_0002.JPG";
  write_file(source, binary_payload(4));
  auto cfg = MoverConfig::from_settings(*make_settings(ws));
  auto rig = make_remote(ws, ctx.logger);
  auto outcome = rig.transport->move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  auto remote_file = rig.executor->local_path("/volume1/Photos/trip/IMG_0002.JPG");
  return outcome.succeeded() &&
         outcome.destination == "media@nas.local:/volume1/Photos/trip/IMG_0002.JPG" &&
         rig.executor->copy_count() == 1 &&
         rig.executor->stream_count() == 0 &&
         read_file(remote_file) == binary_payload(4) &&
         !std::filesystem::exists(source) &&
         rig.executor->settings().host == "nas.local";
}

bool test_remote_directory_created_once(TestContext& ctx) {
  Workspace ws("remote_mkdir");
  auto cfg = MoverConfig::from_settings(*make_settings(ws));
  auto rig = make_remote(ws, ctx.logger);
  for(int i = 0; i < 3; ++i) {
    auto source = ws.source() / "trip" / ("IMG_" + std::to_string(i) + ".JPG");
    write_file(source, "data" + std::to_string(i));
    if(!rig.transport->move(QueuedFile::detected(source, FileOrigin::Watched), cfg).succeeded()) return false;
  }
  if(rig.executor->mkdir_count() != 1) return false;

  auto other = ws.source() / "other" / "IMG_9.JPG";
  write_file(other, "x");
  if(!rig.transport->move(QueuedFile::detected(other, FileOrigin::Watched), cfg).succeeded()) return false;
  if(rig.executor->mkdir_count() != 2 || rig.cache->size() != 2) return false;

  // Same directory on another host still needs its own mkdir.
  cfg.remote.host = "backup.local";
  auto moved_host = ws.source() / "trip" / "IMG_7.JPG";
  write_file(moved_host, "y");
  if(!rig.transport->move(QueuedFile::detected(moved_host, FileOrigin::Watched), cfg).succeeded()) return false;
  return rig.executor->mkdir_count() == 3 &&
         rig.cache->size() == 3 &&
         rig.cache->contains("media@backup.local:/volume1/Photos/trip");
}

bool test_remote_hex_safe_path(TestContext& ctx) {
  Workspace ws("remote_hex");
  auto payload = binary_payload(20);
  auto source = ws.source() / "Camera Roll" / "IMG 0001.jpg";
  write_file(source, payload);
  auto cfg = MoverConfig::from_settings(*make_settings(ws));
  auto rig = make_remote(ws, ctx.logger);
  auto outcome = rig.transport->move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  auto remote_file = rig.executor->local_path("/volume1/Photos/Camera Roll/IMG 0001.jpg");
  bool saw_xxd = false;
  for(const auto& command : rig.executor->commands()) {
    if(command.rfind(RemoteShellTransport::kHexDecodeCommand, 0) == 0) saw_xxd = true;
  }
  return outcome.succeeded() &&
         saw_xxd &&
         rig.executor->stream_count() == 1 &&
         rig.executor->copy_count() == 0 &&
         read_file(remote_file) == payload &&
         !std::filesystem::exists(source);
}

bool test_remote_size_mismatch_keeps_source(TestContext& ctx) {
  Workspace ws("remote_mismatch");
  auto source = ws.source() / "a.jpg";
  write_file(source, "0123456789");
  auto cfg = MoverConfig::from_settings(*make_settings(ws));
  auto rig = make_remote(ws, ctx.logger);
  rig.executor->set_size_skew(-1);
  auto outcome = rig.transport->move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  return outcome.status == OutcomeStatus::Failed &&
         outcome.reason == OutcomeReason::ValidationFailed &&
         read_file(source) == "0123456789";
}

bool test_remote_validation_disabled(TestContext& ctx) {
  Workspace ws("remote_novalidate");
  auto source = ws.source() / "a.jpg";
  write_file(source, "0123456789");
  auto settings = make_settings(ws);
  configure(*settings, "remote_validate_size", false);
  configure(*settings, "remote_delete_source", false);
  auto cfg = MoverConfig::from_settings(*settings);
  auto rig = make_remote(ws, ctx.logger);
  rig.executor->set_size_skew(5);
  auto outcome = rig.transport->move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  for(const auto& command : rig.executor->commands()) {
    if(command.rfind("ls ", 0) == 0) return false;
  }
  // Copy semantics: the source stays.
  return outcome.succeeded() && std::filesystem::exists(source);
}

bool test_remote_retries_connection_failures(TestContext& ctx) {
  Workspace ws("remote_retry");
  auto source = ws.source() / "a.jpg";
  write_file(source, "abc");
  auto cfg = MoverConfig::from_settings(*make_settings(ws));
  auto rig = make_remote(ws, ctx.logger);
  rig.executor->fail_next(2);
  auto outcome = rig.transport->move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  return outcome.succeeded() && rig.sleeper->calls() == 2 && rig.executor->mkdir_count() == 1;
}

bool test_remote_gives_up_after_attempts(TestContext& ctx) {
  Workspace ws("remote_giveup");
  auto source = ws.source() / "a.jpg";
  write_file(source, "abc");
  auto cfg = MoverConfig::from_settings(*make_settings(ws));
  auto rig = make_remote(ws, ctx.logger);
  rig.executor->fail_next(3);
  auto outcome = rig.transport->move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  return outcome.status == OutcomeStatus::Failed &&
         outcome.reason == OutcomeReason::TransferError &&
         rig.cache->size() == 0 &&
         std::filesystem::exists(source);
}

bool test_remote_missing_settings(TestContext& ctx) {
  Workspace ws("remote_config");
  auto source = ws.source() / "a.jpg";
  write_file(source, "abc");
  auto settings = make_settings(ws);
  configure(*settings, "remote_user", "");
  auto cfg = MoverConfig::from_settings(*settings);
  auto rig = make_remote(ws, ctx.logger);
  auto outcome = rig.transport->move(QueuedFile::detected(source, FileOrigin::Watched), cfg);
  return outcome.reason == OutcomeReason::ConfigurationError &&
         rig.executor->commands().empty() &&
         std::filesystem::exists(source);
}

bool test_listing_size_parsing(TestContext&) {
  auto size = RemoteShellTransport::parse_listing_size(
    "-rw-r--r-- 1 1000 100 123456 Jan  1 12:00 /volume1/Photos/IMG 0001.jpg\n");
  if(!size || *size != 123456) return false;
  auto with_total = RemoteShellTransport::parse_listing_size("total 8\n-rw------- 1 0 0 42 Mar  3  2024 x\n");
  if(!with_total || *with_total != 42) return false;
  return !RemoteShellTransport::parse_listing_size("drwxr-xr-x 2 0 0 4096 Jan  1 12:00 dir\n") &&
         !RemoteShellTransport::parse_listing_size("ls: cannot access 'x': No such file or directory\n") &&
         !RemoteShellTransport::parse_listing_size("");
}

bool test_remote_directory_for(TestContext&) {
  MoverConfig cfg;
  cfg.source_dir = "/home/me/Pictures";
  cfg.remote.path = "/volume1/Photos/";
  cfg.mirror_subdirectories = true;
  if(RemoteShellTransport::remote_directory_for(cfg, "/home/me/Pictures/2025/a.jpg") != "/volume1/Photos/2025") return false;
  if(RemoteShellTransport::remote_directory_for(cfg, "/home/me/Pictures/a.jpg") != "/volume1/Photos") return false;
  cfg.mirror_subdirectories = false;
  return RemoteShellTransport::remote_directory_for(cfg, "/home/me/Pictures/2025/a.jpg") == "/volume1/Photos";
}

bool test_ssh_command_lines(TestContext&) {
  RemoteSettings remote;
  remote.host = "nas.local";
  remote.user = "media";
  remote.port = 2222;
  remote.key_file = "/keys/id_ed25519";
  remote.connect_timeout = 7;
  remote.cipher = "aes128-gcm@openssh.com";
  SshShellExecutor executor;
  executor.configure(remote);
  auto ssh = executor.ssh_command_line("mkdir -p '/a b'");
  auto stream = executor.ssh_command_line("xxd -r -p > '/a b/c.jpg'", true);
  auto scp = executor.scp_command_line("/src/a.jpg", "/volume1/a.jpg");
  auto has = [](const std::string& haystack, const std::string& needle){
    return haystack.find(needle) != std::string::npos;
  };
  return ssh.rfind("ssh -n ", 0) == 0 && !has(stream, " -n ") &&
         has(ssh, "BatchMode=yes") && has(ssh, "ConnectTimeout=7") && has(ssh, "-p 2222") &&
         has(ssh, "-i '/keys/id_ed25519'") && has(ssh, "'media@nas.local'") &&
         has(ssh, shell_quote("mkdir -p '/a b'")) &&
         has(scp, "Compression=no") && has(scp, "-c 'aes128-gcm@openssh.com'") && has(scp, "-P 2222") &&
         has(scp, "'media@nas.local:/volume1/a.jpg'");
}

} // namespace

std::vector<TestCase> transport_tests() {
  return {
    {"local_move_mirrors_subdirectories", test_local_move_mirrors_subdirectories},
    {"local_move_flat", test_local_move_flat},
    {"local_counter_conflict", test_local_counter_conflict},
    {"local_skip_keeps_source", test_local_skip_keeps_source},
    {"local_missing_source", test_local_missing_source},
    {"local_move_cross_volume", test_local_move_cross_volume},
    {"local_cross_volume_placement_failure", test_local_cross_volume_placement_failure},
    {"rename_never_replaces", test_rename_never_replaces},
    {"validator_local_checks", test_validator_local_checks},
    {"remote_fast_path", test_remote_fast_path},
    {"remote_directory_created_once", test_remote_directory_created_once},
    {"remote_hex_safe_path", test_remote_hex_safe_path},
    {"remote_size_mismatch_keeps_source", test_remote_size_mismatch_keeps_source},
    {"remote_validation_disabled", test_remote_validation_disabled},
    {"remote_retries_connection_failures", test_remote_retries_connection_failures},
    {"remote_gives_up_after_attempts", test_remote_gives_up_after_attempts},
    {"remote_missing_settings", test_remote_missing_settings},
    {"listing_size_parsing", test_listing_size_parsing},
    {"remote_directory_for", test_remote_directory_for},
    {"ssh_command_lines", test_ssh_command_lines},
  };
}

} // namespace mover::test
