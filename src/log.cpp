#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

#include <syslog.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace {

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

// One spdlog logger per route. Warnings and below go to `audit`, errors to
// `audit_errors`; on syslog and file destinations both share a sink.
struct SinkSet {
  std::shared_ptr<spdlog::logger> audit;
  std::shared_ptr<spdlog::logger> audit_errors;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
};

std::mutex g_sinks_mutex;
SinkSet g_sinks;
std::atomic<bool> g_log_passthrough{true};
std::atomic<int> g_level{spdlog::level::info};

std::shared_ptr<spdlog::logger> make_plain(const char* name, std::shared_ptr<spdlog::sinks::sink> sink) {
  sink->set_pattern("%v");
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_level(spdlog::level::info);
  logger->flush_on(spdlog::level::info);
  return logger;
}

SinkSet make_sinks(const std::string& destination, spdlog::level::level_enum level) {
  std::shared_ptr<spdlog::sinks::sink> normal;
  std::shared_ptr<spdlog::sinks::sink> errors;
  if(destination.empty() || destination == "console" || destination == "-") {
    normal = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    errors = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    normal->set_pattern(kTimestampPattern);
    errors->set_pattern(kTimestampPattern);
  } else if(destination == "syslog") {
    // syslog stamps its own time
    normal = std::make_shared<spdlog::sinks::syslog_sink_mt>("integrity_audit", LOG_PID, LOG_USER, true);
    normal->set_pattern("%l: %v");
    errors = normal;
  } else {
    normal = std::make_shared<spdlog::sinks::basic_file_sink_mt>(destination, false);
    normal->set_pattern(kTimestampPattern);
    errors = normal;
  }

  SinkSet sinks;
  sinks.audit = std::make_shared<spdlog::logger>("audit", std::move(normal));
  sinks.audit_errors = std::make_shared<spdlog::logger>("audit_errors", std::move(errors));
  for(auto* logger : {&sinks.audit, &sinks.audit_errors}) {
    (*logger)->set_level(level);
    (*logger)->flush_on(spdlog::level::warn);
  }
  sinks.print = make_plain("print", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  sinks.print_err = make_plain("print_err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  return sinks;
}

std::shared_ptr<spdlog::logger> route(const LogRecord& record) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if(!g_sinks.audit) {
    g_sinks = make_sinks("console", static_cast<spdlog::level::level_enum>(g_level.load()));
  }
  switch(record.channel) {
    case LogChannel::Print: return g_sinks.print;
    case LogChannel::PrintErr: return g_sinks.print_err;
    case LogChannel::Audit: break;
  }
  return record.level >= spdlog::level::err ? g_sinks.audit_errors : g_sinks.audit;
}

} // namespace

void init(const std::string& destination, spdlog::level::level_enum level) {
  auto sinks = make_sinks(destination, level);
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  g_level.store(static_cast<int>(level), std::memory_order_release);
  g_sinks = std::move(sinks);
  spdlog::set_default_logger(g_sinks.audit);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  if(lowered == "debug") return spdlog::level::debug;
  if(lowered == "info") return spdlog::level::info;
  if(lowered == "warning" || lowered == "warn") return spdlog::level::warn;
  if(lowered == "error") return spdlog::level::err;
  if(lowered == "critical") return spdlog::level::critical;
  return std::nullopt;
}

namespace detail {

bool level_enabled(LogChannel channel, spdlog::level::level_enum level) {
  if(channel != LogChannel::Audit) return true;
  return static_cast<int>(level) >= g_level.load(std::memory_order_acquire);
}

void emit(const LogRecord& record) {
  if(!log_passthrough() || !level_enabled(record.channel, record.level)) return;
  auto sink = route(record);
  if(record.channel == LogChannel::Audit && !record.source.empty()) {
    sink->log(record.level, "[{}] {}", record.source, record.message);
  } else {
    sink->log(record.level, record.message);
  }
}

} // namespace detail

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  listener_count_.store(listeners_.size(), std::memory_order_release);
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
  listener_count_.store(listeners_.size(), std::memory_order_release);
}

void Logger::publish(const LogRecord& record) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool consumed = false;
  for(auto& listener : snapshot) {
    try {
      consumed = listener(record) || consumed;
    } catch(const std::exception& e) {
      detail::emit(LogRecord{"log", LogChannel::Audit, spdlog::level::err,
                             fmt::format("log listener failed: {}", e.what())});
    }
  }
  if(!consumed) detail::emit(record);
}
