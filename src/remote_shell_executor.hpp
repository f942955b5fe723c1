#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "config.hpp"
#include "log.hpp"

struct CommandResult {
  int exit_code = -1;
  std::string output;

  bool ok() const { return exit_code == 0; }
};

// Fills `buffer` with up to `capacity` bytes and returns the count; 0 ends the stream.
using ByteSource = std::function<std::size_t(char* buffer, std::size_t capacity)>;

// Runs commands on the remote host. `execute` captures stdout,
// `write_stream` feeds `source` into the remote command's stdin and
// `copy_file` uses the native bulk copy tool.
class RemoteShellExecutor {
public:
  // ssh reports connection-level failures with this exit code.
  static constexpr int kConnectionFailure = 255;

  virtual ~RemoteShellExecutor() = default;

  // Called with the current settings before each transfer.
  virtual void configure(const RemoteSettings& settings) = 0;

  virtual CommandResult execute(const std::string& command) = 0;
  virtual int write_stream(const std::string& command, const ByteSource& source) = 0;
  virtual int copy_file(const std::filesystem::path& local, const std::string& remote_path) = 0;
};

class SshShellExecutor : public RemoteShellExecutor {
public:
  explicit SshShellExecutor(std::shared_ptr<Logger> logger = nullptr);

  void configure(const RemoteSettings& settings) override;

  CommandResult execute(const std::string& command) override;
  int write_stream(const std::string& command, const ByteSource& source) override;
  int copy_file(const std::filesystem::path& local, const std::string& remote_path) override;

  // Local shell command lines, exposed for logging and tests.
  // Without stdin, ssh gets -n so it does not read the console's input.
  std::string ssh_command_line(const std::string& remote_command, bool with_stdin = false) const;
  std::string scp_command_line(const std::filesystem::path& local, const std::string& remote_path) const;

private:
  static int decode_status(int status);

  RemoteSettings settings_;
  std::shared_ptr<Logger> logger_;
};
