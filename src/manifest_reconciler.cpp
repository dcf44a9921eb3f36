#include "manifest_reconciler.hpp"

#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "log.hpp"
#include "manifest.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::set<std::string> files_on_disk(const fs::path& dir) {
  std::set<std::string> names;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  for(; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if(it->is_regular_file(type_ec)) {
      names.insert(it->path().filename().string());
    }
  }
  return names;
}

bool still_exists(const FileRecord& file) {
  std::error_code ec;
  return fs::is_regular_file(file.path, ec);
}

} // namespace

ManifestReconciler::ManifestReconciler(Options options,
                                       std::shared_ptr<const CancellationToken> cancel,
                                       std::shared_ptr<Logger> logger)
  : options_(options),
    cancel_(cancel ? std::move(cancel) : std::make_shared<const CancellationToken>()),
    logger_(std::move(logger)) {}

fs::path ManifestReconciler::manifest_path(const fs::path& directory) const {
  return directory / Manifest::file_name(options_.algorithm);
}

ReconcileOutcome ManifestReconciler::reconcile(const DirectoryRecord& directory) const {
  cancel_->throw_if_cancelled();

  ReconcileOutcome outcome;
  outcome.directory = directory.path;
  const auto dir = directory.path.string();
  log_debug(logger_.get(), "Comparing checksums for files in directory: {}", dir);

  std::error_code ec;
  if(!fs::is_directory(directory.path, ec)) {
    log_warn(logger_.get(), "Directory no longer exists: {}", dir);
    log_warn(logger_.get(), "Skipping directory: {}", dir);
    outcome.skipped = true;
    return outcome;
  }

  const auto file = manifest_path(directory.path);
  std::string error;
  std::vector<std::string> malformed;
  auto existing = Manifest::load(file, error, &malformed);
  if(!existing && !error.empty()) {
    // an unusable manifest must not be replaced by a fresh one
    log_error(logger_.get(), "Cannot read checksum file {}: {}", file.string(), error);
    log_warn(logger_.get(), "Skipping directory: {}", dir);
    outcome.skipped = true;
    return outcome;
  }
  for(const auto& line : malformed) {
    log_warn(logger_.get(), "Ignoring malformed line in checksum file {}: '{}'", file.string(), line);
  }

  if(!existing) {
    log_debug(logger_.get(), "Could not find checksum file in directory: {}", dir);
    if(options_.read_only) {
      log_info(logger_.get(), "Read-only mode: ignoring directory without checksum file: {}", dir);
      outcome.skipped = true;
      return outcome;
    }
    initialize(directory, outcome);
    return outcome;
  }

  log_debug(logger_.get(), "Found checksum file: {}", file.string());
  compare(directory, std::move(*existing), !malformed.empty(), outcome);
  return outcome;
}

bool ManifestReconciler::recordable(const FileRecord& file, ReconcileOutcome& outcome) const {
  if(Manifest::is_recordable_name(file.name())) return true;
  log_warn(logger_.get(), "File name contains whitespace, cannot be recorded in checksum file: {}",
           file.path.string());
  outcome.unrecordable++;
  return false;
}

void ManifestReconciler::initialize(const DirectoryRecord& directory, ReconcileOutcome& outcome) const {
  log_info(logger_.get(), "Formatting file checksums for directory: {}", directory.path.string());

  Manifest manifest;
  for(const auto& f : directory.files) {
    const auto path = f.path.string();
    if(!still_exists(f)) {
      log_warn(logger_.get(), "File no longer exists: {}", path);
      log_warn(logger_.get(), "Skipping file checksum formatting: {}", path);
      outcome.vanished++;
      continue;
    }
    if(!recordable(f, outcome)) continue;
    if(!f.checksum) {
      log_warn(logger_.get(), "No checksum computed, not recorded: {}", path);
      outcome.unhashed++;
      continue;
    }
    manifest.set(f.name(), *f.checksum);
    outcome.new_entries++;
    log_info(logger_.get(), "File checksum first recorded: {}", path);
  }

  if(manifest.empty()) {
    log_debug(logger_.get(), "No checksums to record for directory: {}", directory.path.string());
    return;
  }
  persist(manifest, manifest_path(directory.path), outcome);
}

void ManifestReconciler::compare(const DirectoryRecord& directory,
                                 Manifest manifest,
                                 bool had_malformed_lines,
                                 ReconcileOutcome& outcome) const {
  const auto file = manifest_path(directory.path);
  const Manifest original = manifest;

  // Entries for files that are gone are reported and dropped on rewrite.
  const auto present = files_on_disk(directory.path);
  std::vector<std::string> stale;
  for(const auto& [name, digest] : manifest.entries()) {
    if(Manifest::is_manifest_name(name)) {
      log_warn(logger_.get(), "Checksum file {} lists a checksum file: {}", file.string(), name);
      stale.push_back(name);
    } else if(present.count(name) == 0) {
      log_warn(logger_.get(), "Checksum file {} contains checksum for non-existent file: {}",
               file.string(), name);
      stale.push_back(name);
    }
  }
  for(const auto& name : stale) {
    manifest.erase(name);
    outcome.stale++;
  }

  for(const auto& f : directory.files) {
    const auto path = f.path.string();
    const auto name = f.name();

    if(!still_exists(f)) {
      log_warn(logger_.get(), "File no longer exists: {}", path);
      log_warn(logger_.get(), "Skipping file checksum comparison: {}", path);
      if(manifest.erase(name)) {
        log_warn(logger_.get(), "Removed file checksum from memory: {}", path);
      }
      outcome.vanished++;
      continue;
    }
    if(!recordable(f, outcome)) continue;
    if(!f.checksum) {
      log_warn(logger_.get(), "No checksum computed, stored checksum left untouched: {}", path);
      outcome.unhashed++;
      continue;
    }

    auto stored = manifest.get(name);
    if(!stored) {
      log_info(logger_.get(), "File checksum not stored in checksum file: {}", path);
      manifest.set(name, *f.checksum);
      outcome.new_entries++;
      log_info(logger_.get(), "File checksum first recorded: {}", path);
    } else if(*stored == *f.checksum) {
      log_debug(logger_.get(), "File checksum matches stored checksum: {}", path);
      outcome.matched++;
    } else {
      log_warn(logger_.get(), "File checksum differs from stored checksum: {}", path);
      log_warn(logger_.get(), "File {} last modified: {}", path, format_local_time(f.mtime));
      manifest.set(name, *f.checksum);
      outcome.changed++;
      log_warn(logger_.get(), "Formatted new checksum for checksum file: {}", path);
    }
  }

  if(options_.read_only) {
    log_debug(logger_.get(), "Read-only mode: leaving checksum file untouched: {}", file.string());
    return;
  }
  if(manifest == original && !had_malformed_lines) {
    log_debug(logger_.get(), "Checksum file up to date: {}", file.string());
    return;
  }
  persist(manifest, file, outcome);
}

void ManifestReconciler::persist(const Manifest& manifest,
                                 const fs::path& file,
                                 ReconcileOutcome& outcome) const {
  std::string error;
  if(!manifest.save(file, error)) {
    log_error(logger_.get(), "Cannot write checksum file: {} ({})", file.string(), error);
    outcome.write_failed = true;
    return;
  }
  log_debug(logger_.get(), "Wrote checksum file: {}", file.string());
  outcome.manifest_written = true;
}
