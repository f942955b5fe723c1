#include "remote_shell_executor.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <vector>

#include "utils.hpp"

SshShellExecutor::SshShellExecutor(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

void SshShellExecutor::configure(const RemoteSettings& settings) {
  settings_ = settings;
}

int SshShellExecutor::decode_status(int status) {
  if(status == -1) return -1;
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

std::string SshShellExecutor::ssh_command_line(const std::string& remote_command, bool with_stdin) const {
  std::string cmd = with_stdin ? "ssh" : "ssh -n";
  cmd += " -o BatchMode=yes";
  cmd += " -o ConnectTimeout=" + std::to_string(settings_.connect_timeout);
  cmd += " -p " + std::to_string(settings_.port);
  if(!settings_.key_file.empty()) {
    cmd += " -i " + shell_quote(settings_.key_file);
  }
  cmd += " " + shell_quote(settings_.target());
  cmd += " " + shell_quote(remote_command);
  return cmd;
}

// Media files are already compressed, so compression is off and a cheap AEAD
// cipher is preferred; CPU is the bottleneck on a LAN.
std::string SshShellExecutor::scp_command_line(const std::filesystem::path& local,
                                               const std::string& remote_path) const {
  std::string cmd = "scp -q -B";
  cmd += " -o ConnectTimeout=" + std::to_string(settings_.connect_timeout);
  cmd += " -o Compression=no";
  if(!settings_.cipher.empty()) {
    cmd += " -c " + shell_quote(settings_.cipher);
  }
  cmd += " -P " + std::to_string(settings_.port);
  if(!settings_.key_file.empty()) {
    cmd += " -i " + shell_quote(settings_.key_file);
  }
  cmd += " " + shell_quote(local.string());
  cmd += " " + shell_quote(settings_.target() + ":" + remote_path);
  return cmd;
}

CommandResult SshShellExecutor::execute(const std::string& command) {
  CommandResult result;
  auto line = ssh_command_line(command);
  log_debug(logger_.get(), "exec: {}", line);

  FILE* pipe = popen(line.c_str(), "r");
  if(!pipe) {
    log_error(logger_.get(), "Unable to start ssh for '{}'", command);
    return result;
  }
  std::array<char, 4096> buf{};
  std::size_t n = 0;
  while((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
    result.output.append(buf.data(), n);
  }
  result.exit_code = decode_status(pclose(pipe));
  return result;
}

int SshShellExecutor::write_stream(const std::string& command, const ByteSource& source) {
  auto line = ssh_command_line(command, true);
  log_debug(logger_.get(), "stream: {}", line);

  FILE* pipe = popen(line.c_str(), "w");
  if(!pipe) {
    log_error(logger_.get(), "Unable to start ssh for '{}'", command);
    return -1;
  }
  std::vector<char> buffer(256 * 1024);
  bool write_failed = false;
  for(;;) {
    std::size_t n = source(buffer.data(), buffer.size());
    if(n == 0) break;
    if(std::fwrite(buffer.data(), 1, n, pipe) != n) {
      write_failed = true;
      break;
    }
  }
  int code = decode_status(pclose(pipe));
  if(write_failed && code == 0) {
    code = -1;
  }
  return code;
}

int SshShellExecutor::copy_file(const std::filesystem::path& local, const std::string& remote_path) {
  auto line = scp_command_line(local, remote_path) + " < /dev/null";
  log_debug(logger_.get(), "copy: {}", line);

  FILE* pipe = popen(line.c_str(), "r");
  if(!pipe) {
    log_error(logger_.get(), "Unable to start scp for {}", local.string());
    return -1;
  }
  std::array<char, 1024> drain{};
  while(std::fread(drain.data(), 1, drain.size(), pipe) > 0) {
  }
  return decode_status(pclose(pipe));
}
