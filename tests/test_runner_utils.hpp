#pragma once

#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace audit::test {

struct CapturedLine {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string source;
  std::string message;
};

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger) {
    if(!logger) return;
    auto handle = logger->add_listener([this](const LogRecord& record) {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.push_back({record.level, record.source, record.message});
      return false;
    });
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<CapturedLine> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  std::size_t count(spdlog::level::level_enum level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(lines_.begin(), lines_.end(),
      [&](const CapturedLine& line){ return line.level == level; }));
  }

  // Number of lines at `level` whose message contains `needle`.
  std::size_t count_containing(const std::string& needle, spdlog::level::level_enum level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(lines_.begin(), lines_.end(),
      [&](const CapturedLine& line){
        return line.level == level && line.message.find(needle) != std::string::npos;
      }));
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const CapturedLine& line){ return line.message.find(needle) != std::string::npos; });
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::vector<CapturedLine> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
  explicit ScratchDir(const std::string& label) {
    static std::atomic<unsigned> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("integrity_audit_" + label + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_);
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::filesystem::path& rel) const { return path_ / rel; }

private:
  std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& file, const std::string& content) {
  if(file.has_parent_path()) {
    std::filesystem::create_directories(file.parent_path());
  }
  std::ofstream out(file, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw std::runtime_error("Unable to write " + file.string());
  }
  out << content;
}

inline std::string read_file(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  if(!in) return std::string();
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

struct TestCase {
  const char* name;
  std::function<bool(LogCapture&)> fn;
};

// Runs `tests` printing '.' per pass and 'F' per failure (with its captured
// log lines). Set AUDIT_TEST_LOGS or pass -v to see log output as it happens.
inline int run_tests(const char* suite, int argc, char** argv, const std::vector<TestCase>& tests) {
  bool verbose = (std::getenv("AUDIT_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  const bool show_logs = (std::getenv("AUDIT_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  } else {
    init("console", spdlog::level::debug);
  }

  LogCapture logs;
  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(logs);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line.source << ": " << line.message << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace audit::test
