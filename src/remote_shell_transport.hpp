#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "integrity_validator.hpp"
#include "log.hpp"
#include "remote_directory_cache.hpp"
#include "remote_shell_executor.hpp"
#include "transport_backend.hpp"

// Uploads to user@host:remote_path through a RemoteShellExecutor.
//
// Paths without whitespace go through the native copy tool. Paths with
// whitespace are streamed as hex text into `xxd -r -p > '<path>'` on the
// remote side, because the copy tool cannot reliably quote them across the
// remote shell. After the upload the remote size is compared with the local
// size (unless disabled) and the source is deleted only when that matches.
class RemoteShellTransport : public TransportBackend {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  RemoteShellTransport(std::shared_ptr<RemoteShellExecutor> executor,
                       std::shared_ptr<RemoteDirectoryCache> directory_cache,
                       std::shared_ptr<IntegrityValidator> validator,
                       std::shared_ptr<Logger> logger = nullptr,
                       Sleeper sleeper = {});

  const char* name() const override { return "remote"; }
  TransferOutcome move(const QueuedFile& item, const MoverConfig& config) override;

  static std::string remote_directory_for(const MoverConfig& config, const std::filesystem::path& source);
  static std::optional<uint64_t> parse_listing_size(const std::string& listing);

  static constexpr const char* kHexDecodeCommand = "xxd -r -p > ";

private:
  bool ensure_remote_directory(const std::string& remote_dir, const RemoteSettings& remote);
  int send_hex(const std::filesystem::path& source, const std::string& remote_file, const RemoteSettings& remote);
  std::optional<uint64_t> query_remote_size(const std::string& remote_file, const RemoteSettings& remote);

  // Re-runs `attempt` while it fails at the connection level.
  int with_retry(const RemoteSettings& remote, const char* what, const std::function<int()>& attempt);

  std::shared_ptr<RemoteShellExecutor> executor_;
  std::shared_ptr<RemoteDirectoryCache> directory_cache_;
  std::shared_ptr<IntegrityValidator> validator_;
  std::shared_ptr<Logger> logger_;
  Sleeper sleeper_;
};
