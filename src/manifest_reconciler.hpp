#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>

#include "cancellation.hpp"
#include "digest.hpp"
#include "inventory.hpp"

class Logger;
class Manifest;

struct ReconcileOutcome {
  std::filesystem::path directory;
  bool skipped = false;
  bool manifest_written = false;
  bool write_failed = false;
  std::size_t new_entries = 0;
  std::size_t matched = 0;
  std::size_t changed = 0;
  std::size_t stale = 0;
  std::size_t vanished = 0;
  std::size_t unhashed = 0;
  std::size_t unrecordable = 0;  // names the line format cannot hold
};

// Compares one directory's fresh checksums with its manifest and rewrites the
// manifest. Each directory is handed to exactly one worker, so manifest I/O
// needs no locking.
class ManifestReconciler {
public:
  struct Options {
    DigestAlgorithm algorithm = DigestAlgorithm::Sha512;
    bool read_only = false;
  };

  ManifestReconciler(Options options,
                     std::shared_ptr<const CancellationToken> cancel,
                     std::shared_ptr<Logger> logger);

  ReconcileOutcome reconcile(const DirectoryRecord& directory) const;

  std::filesystem::path manifest_path(const std::filesystem::path& directory) const;

private:
  void initialize(const DirectoryRecord& directory, ReconcileOutcome& outcome) const;
  void compare(const DirectoryRecord& directory, Manifest manifest, bool had_malformed_lines,
               ReconcileOutcome& outcome) const;
  bool recordable(const FileRecord& file, ReconcileOutcome& outcome) const;
  void persist(const Manifest& manifest, const std::filesystem::path& file, ReconcileOutcome& outcome) const;

  Options options_;
  std::shared_ptr<const CancellationToken> cancel_;
  std::shared_ptr<Logger> logger_;
};
