#include <cpptrace/cpptrace.hpp>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>

#include <pthread.h>
#include <signal.h>

#include "command_line_parser.hpp"
#include "config.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "status_console.hpp"
#include "transfer_orchestrator.hpp"

namespace {

LogOptions log_options_from(const SettingsManager& settings) {
  LogOptions options;
  options.verbose = settings.get<bool>("verbose");
  options.file_path = settings.get<std::string>("log_file");
  options.max_file_size = static_cast<std::size_t>(std::max(1, settings.get<int>("log_max_size_mb"))) * 1024 * 1024;
  options.max_files = static_cast<std::size_t>(std::max(1, settings.get<int>("log_max_files")));
  return options;
}

// SIGINT/SIGTERM are blocked in every thread and collected here, so stop()
// runs on an ordinary thread instead of inside a signal handler.
std::thread start_signal_thread(const sigset_t& signals, TransferOrchestrator& orchestrator, Logger& logger) {
  return std::thread([signals, &orchestrator, &logger]() {
    int sig = 0;
    if(sigwait(&signals, &sig) != 0) return;
    if(sig == SIGUSR1) return;
    logger.info("Received signal {}, finishing queued files", sig);
    orchestrator.stop();
  });
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                             ? std::filesystem::path(argv[0]).filename().string()
                             : "mediamover");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(log_options_from(*settings));
    auto logger = std::make_shared<Logger>("mover");
    logger->debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(settings->save()) {
        logger->info("Saved settings to {}", settings->settings_path().string());
      } else {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    std::signal(SIGPIPE, SIG_IGN);
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    TransferOrchestrator orchestrator(make_settings_provider(settings), logger);
    auto signal_thread = start_signal_thread(signals, orchestrator, *logger);

    std::unique_ptr<StatusConsole> console;
    if(settings->get<bool>("interactive")) {
      console = std::make_unique<StatusConsole>(orchestrator, settings, [&orchestrator]() {
        orchestrator.stop();
      });
      console->start();
    }

    int exit_code = 0;
    try {
      orchestrator.start();
    } catch(const std::runtime_error& e) {
      logger->error("Cannot start: {}", e.what());
      exit_code = 1;
    }

    if(console) console->stop();
    // Wake the signal thread if no signal arrived.
    pthread_kill(signal_thread.native_handle(), SIGUSR1);
    signal_thread.join();
    return exit_code;
  } catch(std::exception& e) {
    init(false);
    Logger logger("mover-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
