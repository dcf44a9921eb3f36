#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "pattern_matcher.hpp"

class Logger;

struct FileRecord {
  std::filesystem::path path;   // absolute
  std::uintmax_t size = 0;
  std::time_t mtime = 0;
  std::optional<std::string> checksum; // set once by the checksum phase

  std::string name() const { return path.filename().string(); }
};

struct DirectoryRecord {
  std::filesystem::path path;   // absolute
  std::vector<FileRecord> files;

  std::uintmax_t size() const;
};

// Position of a file inside the inventory; how checksum results find their record.
struct FileRef {
  std::size_t directory = 0;
  std::size_t file = 0;
};

class InventoryBuilder {
public:
  struct Options {
    std::filesystem::path root;
    bool recursive = false;
    int max_depth = -1;          // < 0: unbounded; >= 0 implies recursive
    bool hidden = false;
    // access(2)-style permission check (R_OK, W_OK, X_OK); ::access when empty.
    std::function<bool(const std::filesystem::path&, int mode)> can_access;
  };

  // Invoked once per directory, as soon as its file list is final.
  using DirectoryVisitor = std::function<void(std::size_t index, const DirectoryRecord&)>;

  InventoryBuilder(Options options,
                   PatternSet patterns,
                   std::shared_ptr<Logger> logger = nullptr);

  std::vector<DirectoryRecord> build(const DirectoryVisitor& visitor = {},
                                     const CancellationToken* cancel = nullptr) const;

  const Options& options() const { return options_; }

  static std::filesystem::path normalize_root(const std::filesystem::path& root);

private:
  std::optional<DirectoryRecord> visit_directory(const std::filesystem::path& dir,
                                                 std::vector<std::filesystem::path>& subdirs) const;
  bool within_depth(int depth) const;
  bool allowed(const std::filesystem::path& path, int mode) const;

  Options options_;
  PatternSet patterns_;
  std::shared_ptr<Logger> logger_;
};
