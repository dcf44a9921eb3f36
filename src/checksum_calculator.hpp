#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "cancellation.hpp"
#include "digest.hpp"
#include "inventory.hpp"

class Logger;

struct ChecksumJob {
  FileRef ref;
  std::filesystem::path path;
};

// Workers send these back instead of touching the inventory; the engine
// merges them into its own FileRecords.
struct ChecksumResult {
  FileRef ref;
  std::optional<std::string> checksum;
  bool failed = false;    // unexpected error, as opposed to a vanished/unreadable file
};

class ChecksumCalculator {
public:
  ChecksumCalculator(std::shared_ptr<ChecksumBackend> backend,
                     std::shared_ptr<const CancellationToken> cancel,
                     std::shared_ptr<Logger> logger);

  ChecksumResult compute(const ChecksumJob& job) const;

private:
  std::shared_ptr<ChecksumBackend> backend_;
  std::shared_ptr<const CancellationToken> cancel_;
  std::shared_ptr<Logger> logger_;
};
