#pragma once

#include <atomic>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

class SettingsManager;
class TransferOrchestrator;

// Interactive readline console next to the transfer loop.
class StatusConsole {
public:
  StatusConsole(TransferOrchestrator& orchestrator,
                std::shared_ptr<SettingsManager> settings,
                std::function<void()> on_quit,
                std::ostream& out = std::cout);
  ~StatusConsole();

  StatusConsole(const StatusConsole&) = delete;
  StatusConsole& operator=(const StatusConsole&) = delete;

  void start();
  void stop();

  // Runs one command line; returns false after `quit`.
  bool execute(const std::string& line);

  void print_help();

private:
  void run_loop();
  static void on_line(char* line);

  void print_status();
  void print_queue();
  void handle_settings_command(const std::string& args);
  void list_settings();

  TransferOrchestrator& orchestrator_;
  std::shared_ptr<SettingsManager> settings_;
  std::function<void()> on_quit_;
  std::ostream& out_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};
