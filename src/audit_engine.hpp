#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "digest.hpp"
#include "pattern_matcher.hpp"

class ChecksumBackend;
class Logger;
class SettingsManager;

// Runs an audit in two phases: checksum every inventoried file, then
// reconcile every directory with its manifest. The second phase starts only
// after every checksum worker has exited.
class AuditEngine {
public:
  struct Options {
    std::filesystem::path root;
    DigestAlgorithm algorithm = DigestAlgorithm::Sha512;
    BackendPreference backend = BackendPreference::Auto;
    bool recursive = false;
    int max_depth = -1;
    bool hidden = false;
    bool read_only = false;
    std::size_t threads = 1;
    PatternMode pattern_mode = PatternMode::Exclude;
    std::vector<std::string> patterns;
  };

  struct Summary {
    std::size_t directories = 0;
    std::size_t directories_skipped = 0;
    std::size_t files = 0;
    std::size_t files_hashed = 0;
    std::size_t hash_failures = 0;
    std::size_t new_entries = 0;
    std::size_t matched = 0;
    std::size_t changed = 0;
    std::size_t stale = 0;
    std::size_t vanished = 0;
    std::size_t unrecordable = 0;
    std::size_t manifests_written = 0;
    std::size_t write_failures = 0;
    std::uintmax_t total_bytes = 0;
    double elapsed_seconds = 0.0;
  };

  // Throws std::invalid_argument for unusable options.
  AuditEngine(Options options,
              std::shared_ptr<Logger> logger = nullptr,
              std::shared_ptr<CancellationToken> cancel = nullptr,
              std::shared_ptr<ChecksumBackend> backend = nullptr);

  // Throws AuditCancelled when the token fires.
  Summary run();

  const Options& options() const { return options_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<CancellationToken> cancellation() const { return cancel_; }
  std::shared_ptr<ChecksumBackend> backend() const { return backend_; }

  // Builds Options from parsed settings, enforcing the command line rules
  // (thread count bounded by the machine, include/exclude exclusive).
  static Options options_from_settings(const SettingsManager& settings);

private:
  void validate() const;

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<CancellationToken> cancel_;
  std::shared_ptr<ChecksumBackend> backend_;
  PatternSet patterns_;
};
