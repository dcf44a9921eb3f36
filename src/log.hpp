#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

// Audit messages go to the configured destination; Print and PrintErr are
// plain user-facing text on stdout/stderr (usage, setup errors).
enum class LogChannel { Audit, Print, PrintErr };

struct LogRecord {
  std::string source;
  LogChannel channel = LogChannel::Audit;
  spdlog::level::level_enum level = spdlog::level::info;
  std::string message;
};

// Destination is "syslog", "console" (or "-"), or a log file path.
void init(const std::string& destination = "console",
          spdlog::level::level_enum level = spdlog::level::info);
void set_log_passthrough(bool enabled);
bool log_passthrough();

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

namespace detail {
bool level_enabled(LogChannel channel, spdlog::level::level_enum level);
void emit(const LogRecord& record);
} // namespace detail

using LogListenerHandle = std::size_t;

// Named message source. Listeners see every record before the sinks do;
// a listener returning true consumes the record.
class Logger {
public:
  using Listener = std::function<bool(const LogRecord&)>;

  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void log(LogChannel channel, spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if(!has_listeners() && !detail::level_enabled(channel, level)) return;
    publish(LogRecord{name_, channel, level, fmt::format(fmt, std::forward<Args>(args)...)});
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Audit, spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Audit, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Audit, spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Audit, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Audit, spdlog::level::critical, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::Print, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::PrintErr, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

private:
  bool has_listeners() const { return listener_count_.load(std::memory_order_acquire) != 0; }
  void publish(const LogRecord& record);

  std::string name_;
  std::mutex listener_mutex_;
  std::map<LogListenerHandle, Listener> listeners_;
  LogListenerHandle next_listener_id_ = 1;
  std::atomic<std::size_t> listener_count_{0};
};

// Free helpers for components that may run without a Logger; a null logger
// writes straight to the process sinks.
template<typename... Args>
inline void log_to(Logger* logger, LogChannel channel, spdlog::level::level_enum level,
                   spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->log(channel, level, fmt, std::forward<Args>(args)...);
  } else if(detail::level_enabled(channel, level)) {
    detail::emit(LogRecord{"", channel, level, fmt::format(fmt, std::forward<Args>(args)...)});
  }
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Audit, spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Audit, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Audit, spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Audit, spdlog::level::err, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Print, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::PrintErr, spdlog::level::err, fmt, std::forward<Args>(args)...);
}
