#include "checksum_calculator.hpp"

#include <unistd.h>

#include <stdexcept>
#include <system_error>

#include "log.hpp"

ChecksumCalculator::ChecksumCalculator(std::shared_ptr<ChecksumBackend> backend,
                                       std::shared_ptr<const CancellationToken> cancel,
                                       std::shared_ptr<Logger> logger)
  : backend_(std::move(backend)),
    cancel_(cancel ? std::move(cancel) : std::make_shared<const CancellationToken>()),
    logger_(std::move(logger)) {
  if(!backend_) throw std::invalid_argument("ChecksumCalculator requires a checksum backend");
}

ChecksumResult ChecksumCalculator::compute(const ChecksumJob& job) const {
  ChecksumResult result;
  result.ref = job.ref;
  const auto path = job.path.string();

  cancel_->throw_if_cancelled();
  log_debug(logger_.get(), "Worker received file: {}", path);

  std::error_code ec;
  if(!std::filesystem::is_regular_file(job.path, ec)) {
    log_warn(logger_.get(), "File no longer exists: {}", path);
    log_warn(logger_.get(), "Skipping checksum calculation: {}", path);
    return result;
  }
  if(::access(job.path.c_str(), R_OK) != 0) {
    log_warn(logger_.get(), "Cannot read file: {}", path);
    log_warn(logger_.get(), "Skipping checksum calculation: {}", path);
    return result;
  }

  log_debug(logger_.get(), "Calculating checksum: {}", path);
  try {
    result.checksum = backend_->digest(job.path, *cancel_);
  } catch(const AuditCancelled&) {
    throw;
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Suppressed error: {}", e.what());
    result.checksum.reset();
    result.failed = true;
    log_error(logger_.get(), "Reset checksum to unset: {}", path);
    log_error(logger_.get(), "Skipping checksum calculation: {}", path);
    return result;
  }

  if(!result.checksum) {
    log_warn(logger_.get(), "Cannot read file: {}", path);
    log_warn(logger_.get(), "Skipping checksum calculation: {}", path);
    return result;
  }
  log_debug(logger_.get(), "Calculated checksum: {}", path);
  return result;
}
