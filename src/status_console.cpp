#include "status_console.hpp"

#include <sys/select.h>
#include <unistd.h>

#include <readline/history.h>
#include <readline/readline.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#include "settings_manager.hpp"
#include "transfer_orchestrator.hpp"
#include "utils.hpp"

namespace {

// readline's callback interface takes a plain function pointer.
StatusConsole* g_active_console = nullptr;

constexpr const char* kPrompt = "mover> ";

std::string rest_of(std::istringstream& iss) {
  std::string rest;
  std::getline(iss, rest);
  return SettingsManager::trim_copy(rest);
}

} // namespace

StatusConsole::StatusConsole(TransferOrchestrator& orchestrator,
                             std::shared_ptr<SettingsManager> settings,
                             std::function<void()> on_quit,
                             std::ostream& out)
  : orchestrator_(orchestrator),
    settings_(std::move(settings)),
    on_quit_(std::move(on_quit)),
    out_(out) {}

StatusConsole::~StatusConsole() {
  stop();
}

void StatusConsole::start() {
  if(running_.exchange(true)) return;
  thread_ = std::thread([this](){ run_loop(); });
}

void StatusConsole::stop() {
  running_ = false;
  if(thread_.joinable()) thread_.join();
}

void StatusConsole::on_line(char* line) {
  auto* console = g_active_console;
  if(!console) {
    std::free(line);
    return;
  }
  if(!line) {
    // EOF closes the console; the transfer loop keeps running.
    console->running_ = false;
    return;
  }
  std::string command(line);
  std::free(line);
  if(!command.empty()) add_history(command.c_str());
  console->execute(command);
}

void StatusConsole::run_loop() {
  g_active_console = this;
  rl_callback_handler_install(kPrompt, &StatusConsole::on_line);
  while(running_) {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(STDIN_FILENO, &fds);
    timeval tv{0, 250000};
    int ready = ::select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv);
    if(ready > 0 && FD_ISSET(STDIN_FILENO, &fds)) {
      rl_callback_read_char();
    }
  }
  rl_callback_handler_remove();
  g_active_console = nullptr;
}

bool StatusConsole::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  if(cmd.empty()) return true;

  if(cmd == "status" || cmd == "st") {
    print_status();
  } else if(cmd == "queue" || cmd == "q") {
    print_queue();
  } else if(cmd == "scan") {
    auto added = orchestrator_.scan_existing();
    out_ << "Queued " << added << " file(s)\n";
  } else if(cmd == "settings" || cmd == "s") {
    auto args = rest_of(iss);
    handle_settings_command(args.empty() ? "list" : args);
  } else if(cmd == "set") {
    auto args = rest_of(iss);
    handle_settings_command(args.empty() ? "list" : "set " + args);
  } else if(cmd == "get") {
    auto args = rest_of(iss);
    handle_settings_command(args.empty() ? "get" : "get " + args);
  } else if(cmd == "save") {
    handle_settings_command("save");
  } else if(cmd == "help" || cmd == "h" || cmd == "?") {
    print_help();
  } else if(cmd == "quit" || cmd == "exit") {
    out_ << "Stopping after the current file...\n";
    running_ = false;
    if(on_quit_) on_quit_();
    return false;
  } else {
    print_help();
    out_ << "Unknown command: " << cmd << "\n";
  }
  out_.flush();
  return true;
}

void StatusConsole::print_status() {
  auto stats = orchestrator_.statistics();
  out_ << "running:     " << (orchestrator_.is_running() ? "yes" : "no") << "\n";
  out_ << "processed:   " << stats.files_processed << "\n";
  out_ << "moved:       " << stats.files_moved << " (" << stats.total_bytes_moved << " bytes)\n";
  out_ << "skipped:     " << stats.files_skipped << "\n";
  out_ << "errors:      " << stats.errors << "\n";
  out_ << "requeued:    " << stats.requeued << "\n";
  out_ << "queued:      " << stats.queue_size << "\n";
  out_ << "remote dirs: " << orchestrator_.directory_cache().size() << "\n";
}

void StatusConsole::print_queue() {
  auto items = orchestrator_.queue().snapshot();
  if(items.empty()) {
    out_ << "Queue is empty\n";
    return;
  }
  auto now = std::chrono::steady_clock::now();
  for(const auto& item : items) {
    out_ << std::left << std::setw(9) << to_string(item.origin)
         << format_local_time(item.detected_at, "%Y-%m-%d %H:%M:%S") << "  "
         << item.source_path.string();
    if(item.requeue_count > 0) {
      out_ << "  (requeued " << item.requeue_count << "x";
      if(item.not_before > now) {
        auto wait = std::chrono::duration_cast<std::chrono::seconds>(item.not_before - now);
        out_ << ", next check in " << wait.count() << "s";
      }
      out_ << ")";
    }
    out_ << "\n";
  }
}

void StatusConsole::handle_settings_command(const std::string& args) {
  std::istringstream iss(args);
  std::string action;
  iss >> action;

  if(action == "list") {
    list_settings();
    return;
  }

  if(action == "get") {
    std::string key;
    iss >> key;
    if(key.empty()) {
      out_ << "Usage: settings get <key>\n";
      return;
    }
    auto resolved = settings_->resolve_key(key);
    if(!resolved) {
      out_ << "Unknown setting '" << key << "'.\n";
      return;
    }
    out_ << *resolved << " = " << settings_->value_as_string(*resolved)
         << "  # " << settings_->description(*resolved) << "\n";
    return;
  }

  if(action == "set") {
    std::string key;
    iss >> key;
    auto value = rest_of(iss);
    if(key.empty() || value.empty()) {
      out_ << "Usage: settings set <key> <value>\n";
      return;
    }
    auto resolved = settings_->resolve_key(key);
    if(!resolved) {
      out_ << "Unknown setting '" << key << "'.\n";
      return;
    }
    std::string error;
    if(settings_->set_from_string(*resolved, value, error)) {
      out_ << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
    } else {
      out_ << "Failed to set " << *resolved << ": " << error << "\n";
    }
    return;
  }

  if(action == "save") {
    if(settings_->save()) {
      out_ << "Saved settings to " << settings_->settings_path().string() << "\n";
    } else {
      out_ << "Failed to save settings.\n";
    }
    return;
  }

  out_ << "Unknown settings command.\n";
}

void StatusConsole::list_settings() {
  auto keys = settings_->keys();
  std::sort(keys.begin(), keys.end());
  for(const auto& key : keys) {
    out_ << key << " = " << settings_->value_as_string(key) << "\n";
  }
}

void StatusConsole::print_help() {
  out_ << "Available commands:\n";
  out_ << "  status|st                     Show counters\n";
  out_ << "  queue|q                       List queued files\n";
  out_ << "  scan                          Queue every file currently in the source\n";
  out_ << "  settings [list|get|set|save]  Inspect or change settings (used from the next file)\n";
  out_ << "  set <key> <value>             Shortcut for settings set\n";
  out_ << "  get <key>                     Shortcut for settings get\n";
  out_ << "  save                          Write settings to disk\n";
  out_ << "  help|h|?                      Show this help\n";
  out_ << "  quit|exit                     Finish the queue and exit\n";
}
