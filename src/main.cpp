#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <filesystem>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "audit_engine.hpp"
#include "cancellation.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

constexpr int kExitInterrupted = 130;

// Turns SIGINT/SIGTERM into a cancellation request for the running audit.
class SignalWatcher {
public:
  SignalWatcher(std::shared_ptr<CancellationToken> cancel, std::shared_ptr<Logger> logger)
    : signals_(io_, SIGINT, SIGTERM),
      cancel_(std::move(cancel)),
      logger_(std::move(logger)) {
    signals_.async_wait([this](const std::error_code& ec, int signo){
      if(ec) return;
      logger_->warn("Received signal {}, stopping audit", signo);
      cancel_->cancel();
    });
    thread_ = std::thread([this]{ io_.run(); });
  }

  ~SignalWatcher() {
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
  asio::io_context io_;
  asio::signal_set signals_;
  std::shared_ptr<CancellationToken> cancel_;
  std::shared_ptr<Logger> logger_;
  std::thread thread_;
};

std::string command_line(int argc, char** argv) {
  std::string line;
  for(int i = 0; i < argc; ++i) {
    if(i > 0) line += ' ';
    line += argv[i];
  }
  return line;
}

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    if(auto config = CommandLineParser::find_config_path(argc, argv)) {
      settings.set_settings_path(*config);
      if(!settings.load()) {
        print_err(nullptr, "Unable to load settings from {}", *config);
        return 1;
      }
    } else {
      settings.load();
    }

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "integrity_audit");
    try {
      parser.parse(argc, argv, settings);
    } catch(const CommandLineError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage(settings);
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage(settings);
      return 0;
    }

    const auto level_name = settings.get<std::string>("log_level");
    auto level = parse_log_level(level_name);
    if(!level) {
      print_err(nullptr, "Unknown log level '{}'", level_name);
      parser.usage(settings);
      return 1;
    }
    const auto destination = settings.get<std::string>("log");
    init(destination, *level);

    auto logger = std::make_shared<Logger>("integrity-audit");
    if(settings.save_requested()) {
      if(settings.save()) {
        logger->info("Saved settings to {}", settings.settings_path().string());
      } else {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    auto cancel = std::make_shared<CancellationToken>();
    std::unique_ptr<AuditEngine> engine;
    try {
      engine = std::make_unique<AuditEngine>(AuditEngine::options_from_settings(settings), logger, cancel);
    } catch(const std::invalid_argument& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage(settings);
      return 1;
    }
    const auto& options = engine->options();

    logger->info("Starting integrity audit");
    logger->info("Command: {}", command_line(argc, argv));
    logger->info("Log: {}", destination);
    if(options.max_depth >= 0) {
      std::error_code ec;
      auto absolute = std::filesystem::absolute(options.root, ec);
      logger->info("Max depth: {} (absolute {})", options.max_depth,
                   std::distance(absolute.begin(), absolute.end()) - 1 + options.max_depth);
    }

    AuditEngine::Summary summary;
    {
      SignalWatcher watcher(cancel, logger);
      summary = engine->run();
    }
    logger->info("Integrity audit complete: {} changed, {} checksum file write failures",
                 summary.changed, summary.write_failures);
    return 0;
  } catch(const AuditCancelled&) {
    Logger logger("integrity-audit");
    logger.warn("Audit interrupted");
    return kExitInterrupted;
  } catch(std::exception& e) {
    Logger logger("integrity-audit");
    logger.critical("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
