#include "inventory.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <numeric>
#include <system_error>

#include "log.hpp"
#include "manifest.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

std::uintmax_t DirectoryRecord::size() const {
  return std::accumulate(files.begin(), files.end(), std::uintmax_t{0},
                         [](std::uintmax_t total, const FileRecord& f){ return total + f.size; });
}

InventoryBuilder::InventoryBuilder(Options options,
                                   PatternSet patterns,
                                   std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    patterns_(std::move(patterns)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("inventory")) {
  options_.root = normalize_root(options_.root);
  if(options_.max_depth >= 0) {
    options_.recursive = true;
  }
}

fs::path InventoryBuilder::normalize_root(const fs::path& root) {
  std::error_code ec;
  fs::path absolute = fs::absolute(root, ec);
  if(ec) absolute = root;
  absolute = absolute.lexically_normal();
  if(!absolute.has_filename() && absolute.has_parent_path() && absolute != absolute.root_path()) {
    absolute = absolute.parent_path();
  }
  return absolute;
}

bool InventoryBuilder::allowed(const fs::path& path, int mode) const {
  if(options_.can_access) return options_.can_access(path, mode);
  return ::access(path.c_str(), mode) == 0;
}

bool InventoryBuilder::within_depth(int depth) const {
  return options_.max_depth < 0 || depth <= options_.max_depth;
}

std::vector<DirectoryRecord> InventoryBuilder::build(const DirectoryVisitor& visitor,
                                                     const CancellationToken* cancel) const {
  logger_->info("Analyzing file structure from {} downward", options_.root.string());

  std::vector<DirectoryRecord> directories;
  std::vector<std::pair<fs::path, int>> pending{{options_.root, 0}};

  while(!pending.empty()) {
    if(cancel) cancel->throw_if_cancelled();

    auto [dir, depth] = std::move(pending.back());
    pending.pop_back();
    logger_->debug("Found directory: {}", dir.string());

    std::vector<fs::path> subdirs;
    auto record = visit_directory(dir, subdirs);
    if(!record) continue;

    directories.push_back(std::move(*record));
    logger_->debug("Initialized record for directory: {}", dir.string());
    if(visitor) visitor(directories.size() - 1, directories.back());

    if(!options_.recursive) {
      logger_->debug("Recursion deactivated: stopping analysis");
      break;
    }
    const int child_depth = depth + 1;
    if(!within_depth(child_depth)) {
      for(const auto& sub : subdirs) {
        logger_->debug("Directory is {} directories deep: {}", child_depth, sub.string());
        logger_->debug("Skipping directory: {}", sub.string());
      }
      continue;
    }
    // reverse so the stack pops subdirectories in name order
    for(auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
      pending.emplace_back(std::move(*it), child_depth);
    }
  }

  logger_->info("File structure analysis complete");
  return directories;
}

std::optional<DirectoryRecord> InventoryBuilder::visit_directory(const fs::path& dir,
                                                                 std::vector<fs::path>& subdirs) const {
  std::error_code ec;
  if(!fs::is_directory(dir, ec)) {
    logger_->warn("Directory no longer exists: {}", dir.string());
    logger_->warn("Skipping directory: {}", dir.string());
    return std::nullopt;
  }
  if(!allowed(dir, R_OK | X_OK)) {
    logger_->warn("Cannot read from directory: {}", dir.string());
    logger_->warn("Skipping directory: {}", dir.string());
    return std::nullopt;
  }
  if(!allowed(dir, W_OK)) {
    logger_->warn("Cannot write to directory: {}", dir.string());
    logger_->warn("Will attempt to analyze checksums of files anyway");
  } else {
    logger_->debug("Can write to directory: {}", dir.string());
  }

  std::vector<fs::path> entries;
  fs::directory_iterator it(dir, ec);
  if(ec) {
    logger_->warn("Cannot read from directory: {} ({})", dir.string(), ec.message());
    logger_->warn("Skipping directory: {}", dir.string());
    return std::nullopt;
  }
  for(; it != fs::directory_iterator(); it.increment(ec)) {
    if(ec) break;
    entries.push_back(it->path());
  }
  if(ec) {
    logger_->warn("Listing of {} interrupted: {}", dir.string(), ec.message());
  }
  std::sort(entries.begin(), entries.end());

  DirectoryRecord record;
  record.path = dir;

  for(const auto& entry : entries) {
    const std::string name = entry.filename().string();
    const std::string path = entry.string();

    if(!options_.hidden && is_hidden_name(name)) {
      logger_->debug("{} is hidden: skipping", path);
      continue;
    }

    struct stat link_info{};
    if(::lstat(entry.c_str(), &link_info) != 0) {
      logger_->warn("File no longer exists: {}", path);
      logger_->warn("Skipping file: {}", path);
      continue;
    }

    if(S_ISDIR(link_info.st_mode)) {
      if(patterns_.excludes(path, true)) {
        logger_->debug("Directory excluded by pattern: {}", path);
        continue;
      }
      subdirs.push_back(entry);
      continue;
    }

    struct stat info = link_info;
    if(S_ISLNK(link_info.st_mode)) {
      if(::stat(entry.c_str(), &info) != 0) {
        logger_->warn("Skipping broken symlink: {}", path);
        continue;
      }
      if(S_ISDIR(info.st_mode)) {
        logger_->debug("Not following symlinked directory: {}", path);
        continue;
      }
    }

    if(!S_ISREG(info.st_mode)) {
      logger_->warn("Skipping special file: {}", path);
      continue;
    }

    if(Manifest::is_manifest_name(name)) {
      logger_->debug("Skipping checksum file: {}", path);
      continue;
    }

    if(patterns_.excludes(path, false)) {
      logger_->debug("File excluded by pattern: {}", path);
      continue;
    }

    if(!allowed(entry, R_OK)) {
      logger_->warn("Cannot read file: {}", path);
      logger_->warn("Skipping file: {}", path);
      continue;
    }

    FileRecord file;
    file.path = entry;
    file.size = static_cast<std::uintmax_t>(info.st_size);
    file.mtime = info.st_mtime;
    record.files.push_back(std::move(file));
    logger_->debug("Initialized record for file: {}", path);
  }

  return record;
}
