#include "remote_shell_transport.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include "utils.hpp"

namespace {

std::string join_remote(const std::string& base, const std::string& rel) {
  if(rel.empty()) return base;
  if(base.empty()) return rel;
  if(base.back() == '/') return base + rel;
  return base + "/" + rel;
}

} // namespace

RemoteShellTransport::RemoteShellTransport(std::shared_ptr<RemoteShellExecutor> executor,
                                           std::shared_ptr<RemoteDirectoryCache> directory_cache,
                                           std::shared_ptr<IntegrityValidator> validator,
                                           std::shared_ptr<Logger> logger,
                                           Sleeper sleeper)
  : executor_(std::move(executor)),
    directory_cache_(directory_cache ? std::move(directory_cache) : std::make_shared<RemoteDirectoryCache>()),
    validator_(validator ? std::move(validator) : std::make_shared<IntegrityValidator>()),
    logger_(std::move(logger)),
    sleeper_(std::move(sleeper)) {
  if(!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d){ std::this_thread::sleep_for(d); };
  }
}

std::string RemoteShellTransport::remote_directory_for(const MoverConfig& config, const std::filesystem::path& source) {
  std::string rel;
  if(config.mirror_subdirectories) {
    rel = relative_subdirectory(config.source_dir, source).generic_string();
  }
  return RemoteDirectoryCache::canonicalize(join_remote(config.remote.path, rel));
}

// `ls -ln` line: mode links uid gid size month day time name...
std::optional<uint64_t> RemoteShellTransport::parse_listing_size(const std::string& listing) {
  std::istringstream lines(listing);
  std::string line;
  while(std::getline(lines, line)) {
    if(line.empty() || line.rfind("total", 0) == 0) continue;
    std::istringstream fields(line);
    std::string mode, links, uid, gid, size;
    if(!(fields >> mode >> links >> uid >> gid >> size)) continue;
    if(mode.empty() || mode[0] != '-') continue;
    try {
      std::size_t consumed = 0;
      auto value = std::stoull(size, &consumed);
      if(consumed == size.size()) return static_cast<uint64_t>(value);
    } catch(const std::exception&) {
      continue;
    }
  }
  return std::nullopt;
}

int RemoteShellTransport::with_retry(const RemoteSettings& remote, const char* what, const std::function<int()>& attempt) {
  int code = -1;
  for(int i = 1; i <= remote.retry_attempts; ++i) {
    code = attempt();
    if(code != RemoteShellExecutor::kConnectionFailure) return code;
    if(i < remote.retry_attempts) {
      log_warn(logger_.get(), "{} on {}: connection failure (attempt {}/{}), retrying",
               what, remote.host, i, remote.retry_attempts);
      sleeper_(remote.retry_delay);
    }
  }
  return code;
}

bool RemoteShellTransport::ensure_remote_directory(const std::string& remote_dir, const RemoteSettings& remote) {
  // Keyed by login target as well: the host may change between items.
  const auto key = remote.target() + ":" + remote_dir;
  if(directory_cache_->contains(key)) return true;
  auto command = "mkdir -p " + shell_quote(remote_dir);
  int code = with_retry(remote, "mkdir", [&]{ return executor_->execute(command).exit_code; });
  if(code != 0) {
    log_error(logger_.get(), "mkdir -p {} on {} failed with exit code {}", remote_dir, remote.host, code);
    return false;
  }
  directory_cache_->mark_created(key);
  return true;
}

int RemoteShellTransport::send_hex(const std::filesystem::path& source,
                                   const std::string& remote_file,
                                   const RemoteSettings& remote) {
  auto command = std::string(kHexDecodeCommand) + shell_quote(remote_file);
  return with_retry(remote, "hex upload", [&]() -> int {
    std::ifstream in(source, std::ios::binary);
    if(!in) return -1;
    std::vector<char> raw;
    auto source_fn = [&](char* buffer, std::size_t capacity) -> std::size_t {
      // Two hex digits per input byte plus one newline per chunk.
      std::size_t want = (capacity - 1) / 2;
      if(want == 0) return 0;
      raw.resize(want);
      in.read(raw.data(), static_cast<std::streamsize>(want));
      auto got = static_cast<std::size_t>(in.gcount());
      if(got == 0) return 0;
      auto hex = hex_encode(raw.data(), got);
      std::copy(hex.begin(), hex.end(), buffer);
      buffer[hex.size()] = '\n';
      return hex.size() + 1;
    };
    int code = executor_->write_stream(command, source_fn);
    if(in.bad()) return -1;
    return code;
  });
}

std::optional<uint64_t> RemoteShellTransport::query_remote_size(const std::string& remote_file,
                                                                const RemoteSettings& remote) {
  auto command = "ls -ln -- " + shell_quote(remote_file);
  CommandResult result;
  with_retry(remote, "size query", [&]{
    result = executor_->execute(command);
    return result.exit_code;
  });
  if(!result.ok()) return std::nullopt;
  return parse_listing_size(result.output);
}

TransferOutcome RemoteShellTransport::move(const QueuedFile& item, const MoverConfig& config) {
  if(!executor_) {
    return TransferOutcome::failed(OutcomeReason::ConfigurationError, "no remote executor");
  }
  if(auto error = config.remote_error()) {
    log_error(logger_.get(), "Cannot upload {}: {}", item.source_path.string(), *error);
    return TransferOutcome::failed(OutcomeReason::ConfigurationError, *error);
  }
  const auto& remote = config.remote;
  executor_->configure(remote);

  const auto& source = item.source_path;
  std::error_code ec;
  auto size = std::filesystem::file_size(source, ec);
  if(ec) {
    return TransferOutcome::skipped(OutcomeReason::Gone, ec.message());
  }

  auto remote_dir = remote_directory_for(config, source);
  auto remote_file = join_remote(remote_dir, source.filename().string());

  if(!ensure_remote_directory(remote_dir, remote)) {
    return TransferOutcome::failed(OutcomeReason::TransferError, "remote mkdir failed");
  }

  const bool safe_path = contains_whitespace(remote_file);
  int code = 0;
  if(safe_path) {
    log_debug(logger_.get(), "{} contains whitespace, using hex stream", remote_file);
    code = send_hex(source, remote_file, remote);
  } else {
    code = with_retry(remote, "copy", [&]{ return executor_->copy_file(source, remote_file); });
  }
  if(code != 0) {
    log_warn(logger_.get(), "Upload of {} to {}:{} failed with exit code {}",
             source.string(), remote.host, remote_file, code);
    return TransferOutcome::failed(OutcomeReason::TransferError, "exit code " + std::to_string(code));
  }

  RemoteValidationContext ctx;
  ctx.remote_path = remote_file;
  ctx.expected_size = size;
  ctx.enabled = remote.validate_size;
  if(ctx.enabled) {
    ctx.reported_size = query_remote_size(remote_file, remote);
  }
  auto check = validator_->verify(ctx);
  if(!check) {
    log_error(logger_.get(), "Validation failed for {}:{}: {}; keeping {}",
              remote.host, remote_file, check.detail, source.string());
    return TransferOutcome::failed(OutcomeReason::ValidationFailed, check.detail);
  }

  auto destination = remote.target() + ":" + remote_file;
  if(remote.delete_source) {
    if(!std::filesystem::remove(source, ec) || ec) {
      log_error(logger_.get(), "Uploaded {} but could not delete it: {}", source.string(), ec.message());
      auto outcome = TransferOutcome::failed(OutcomeReason::SourceDeleteFailed, ec.message());
      outcome.destination = destination;
      return outcome;
    }
  }
  log_info(logger_.get(), "Uploaded {} -> {} ({} bytes{})", source.string(), destination, size,
           safe_path ? ", hex stream" : "");
  return TransferOutcome::success(size, destination);
}
