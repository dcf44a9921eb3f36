#include "audit_engine.hpp"

#include <spdlog/fmt/ranges.h>

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "checksum_calculator.hpp"
#include "inventory.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "manifest_reconciler.hpp"
#include "settings_manager.hpp"
#include "work_queue.hpp"

namespace fs = std::filesystem;

namespace {

constexpr double kBytesPerGigabyte = 1073741824.0;

} // namespace

AuditEngine::AuditEngine(Options options,
                         std::shared_ptr<Logger> logger,
                         std::shared_ptr<CancellationToken> cancel,
                         std::shared_ptr<ChecksumBackend> backend)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("integrity-audit")),
    cancel_(cancel ? std::move(cancel) : std::make_shared<CancellationToken>()),
    backend_(std::move(backend)) {
  options_.root = InventoryBuilder::normalize_root(options_.root);
  if(options_.max_depth >= 0) {
    options_.recursive = true;  // -m implies -r
  }
  validate();
  patterns_ = PatternSet(options_.pattern_mode, options_.patterns, options_.root.string());
  if(!backend_) {
    backend_ = make_checksum_backend(options_.algorithm, options_.backend, logger_.get());
  }
}

void AuditEngine::validate() const {
  if(options_.threads < 1) {
    throw std::invalid_argument("Must use at least one thread");
  }
  std::error_code ec;
  if(!fs::is_directory(options_.root, ec)) {
    throw std::invalid_argument("Not a directory: " + options_.root.string());
  }
}

AuditEngine::Summary AuditEngine::run() {
  const auto start = std::chrono::steady_clock::now();
  Summary summary;

  logger_->info("Top Directory: {}", options_.root.string());
  logger_->info("Threads: {}", options_.threads);
  logger_->info("Algorithm: {} ({})", digest_algorithm_name(options_.algorithm), backend_->describe());
  if(options_.max_depth >= 0) {
    logger_->info("Max Directory Depth: {}", options_.max_depth);
  }
  if(!patterns_.rules().empty() || options_.pattern_mode == PatternMode::Include) {
    logger_->info("Patterns ({}): {}", pattern_mode_name(options_.pattern_mode),
                  fmt::join(options_.patterns, " "));
  }
  if(options_.read_only) {
    logger_->info("Read-only mode: checksum files will not be created or modified");
  }

  // Phase 1: files stream into the checksum workers while the tree is walked.
  ChecksumCalculator calculator(backend_, cancel_, logger_);
  WorkerPool<ChecksumJob, ChecksumResult> checksum_pool(
    options_.threads,
    [&calculator](const ChecksumJob& job){ return calculator.compute(job); },
    logger_);
  checksum_pool.start();

  InventoryBuilder::Options inventory_options;
  inventory_options.root = options_.root;
  inventory_options.recursive = options_.recursive;
  inventory_options.max_depth = options_.max_depth;
  inventory_options.hidden = options_.hidden;
  InventoryBuilder builder(inventory_options, patterns_, logger_);

  const auto manifest_name = Manifest::file_name(options_.algorithm);
  auto directories = builder.build(
    [&](std::size_t index, const DirectoryRecord& dir){
      if(options_.read_only) {
        std::error_code ec;
        if(!fs::is_regular_file(dir.path / manifest_name, ec)) {
          log_debug(logger_.get(), "Read-only mode: not hashing files of directory without checksum file: {}",
                    dir.path.string());
          return;
        }
      }
      for(std::size_t i = 0; i < dir.files.size(); ++i) {
        if(!checksum_pool.submit(ChecksumJob{FileRef{index, i}, dir.files[i].path})) {
          cancel_->throw_if_cancelled();
          return;
        }
        log_debug(logger_.get(), "File placed in processing queue: {}", dir.files[i].path.string());
      }
    },
    cancel_.get());

  auto results = checksum_pool.finish();
  for(auto& result : results) {
    auto& file = directories.at(result.ref.directory).files.at(result.ref.file);
    if(result.checksum) {
      file.checksum = std::move(result.checksum);
      summary.files_hashed++;
    } else if(result.failed) {
      summary.hash_failures++;
    }
  }
  logger_->info("All file checksums calculated");

  // Phase 2: one worker per directory at a time owns that directory's manifest.
  logger_->info("Comparing file checksums to stored checksums");
  ManifestReconciler::Options reconcile_options;
  reconcile_options.algorithm = options_.algorithm;
  reconcile_options.read_only = options_.read_only;
  ManifestReconciler reconciler(reconcile_options, cancel_, logger_);

  WorkerPool<std::size_t, ReconcileOutcome> reconcile_pool(
    options_.threads,
    [&reconciler, &directories](const std::size_t& index){ return reconciler.reconcile(directories[index]); },
    logger_);
  reconcile_pool.start();
  for(std::size_t i = 0; i < directories.size(); ++i) {
    if(!reconcile_pool.submit(i)) break;
    log_debug(logger_.get(), "Directory placed in processing queue: {}", directories[i].path.string());
  }
  auto outcomes = reconcile_pool.finish();
  logger_->info("Checksum comparisons complete");

  for(const auto& outcome : outcomes) {
    if(outcome.skipped) summary.directories_skipped++;
    if(outcome.manifest_written) summary.manifests_written++;
    if(outcome.write_failed) summary.write_failures++;
    summary.new_entries += outcome.new_entries;
    summary.matched += outcome.matched;
    summary.changed += outcome.changed;
    summary.stale += outcome.stale;
    summary.vanished += outcome.vanished;
    summary.unrecordable += outcome.unrecordable;
  }
  summary.directories = directories.size();
  for(const auto& dir : directories) {
    summary.files += dir.files.size();
    summary.total_bytes += dir.size();
  }

  summary.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  logger_->info("Analyzed {:.2e} GB of data in {:.2e} minutes",
                static_cast<double>(summary.total_bytes) / kBytesPerGigabyte,
                summary.elapsed_seconds / 60.0);
  logger_->info("Directories: {} audited, {} skipped; files: {} found, {} hashed, {} failed",
                summary.directories, summary.directories_skipped,
                summary.files, summary.files_hashed, summary.hash_failures);
  logger_->info("Checksums: {} new, {} unchanged, {} changed, {} stale, {} vanished; {} checksum files written",
                summary.new_entries, summary.matched, summary.changed,
                summary.stale, summary.vanished, summary.manifests_written);
  if(summary.unrecordable > 0) {
    logger_->warn("{} files have names with whitespace and are not recorded in checksum files",
                  summary.unrecordable);
  }
  if(summary.write_failures > 0) {
    logger_->error("{} checksum files could not be written", summary.write_failures);
  }
  return summary;
}

AuditEngine::Options AuditEngine::options_from_settings(const SettingsManager& settings) {
  Options options;

  const auto directory = settings.get<std::string>("directory");
  if(directory.empty()) {
    throw std::invalid_argument("No directory given");
  }
  options.root = directory;

  const auto algorithm_name = settings.get<std::string>("algorithm");
  auto algorithm = parse_digest_algorithm(algorithm_name);
  if(!algorithm) {
    throw std::invalid_argument("Unknown checksum algorithm '" + algorithm_name + "'");
  }
  options.algorithm = *algorithm;

  const auto backend_name = settings.get<std::string>("backend");
  auto backend = parse_backend_preference(backend_name);
  if(!backend) {
    throw std::invalid_argument("Unknown checksum backend '" + backend_name + "'");
  }
  options.backend = *backend;

  options.recursive = settings.get<bool>("recursive");
  options.max_depth = settings.get<int>("max_depth");
  if(options.max_depth >= 0) options.recursive = true;
  options.hidden = settings.get<bool>("hidden");
  options.read_only = settings.get<bool>("read_only");

  const int threads = settings.get<int>("threads");
  unsigned available = std::thread::hardware_concurrency();
  if(available == 0) available = 1;
  if(threads < 1) {
    throw std::invalid_argument("Must use at least one thread");
  }
  if(static_cast<unsigned>(threads) > available) {
    throw std::invalid_argument("Cannot use more threads than available: " + std::to_string(available));
  }
  options.threads = static_cast<std::size_t>(threads);

  auto include = settings.get<std::vector<std::string>>("include");
  auto exclude = settings.get<std::vector<std::string>>("exclude");
  if(!include.empty() && !exclude.empty()) {
    throw std::invalid_argument("Include and exclude patterns are mutually exclusive");
  }
  if(!include.empty()) {
    options.pattern_mode = PatternMode::Include;
    options.patterns = std::move(include);
  } else {
    options.pattern_mode = PatternMode::Exclude;
    options.patterns = std::move(exclude);
  }
  return options;
}
