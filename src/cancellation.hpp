#pragma once

#include <atomic>
#include <stdexcept>

// Raised when an interrupt reaches a worker; never suppressed by per-item error handling.
class AuditCancelled : public std::runtime_error {
public:
  AuditCancelled() : std::runtime_error("audit interrupted") {}
};

class CancellationToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  void throw_if_cancelled() const {
    if(cancelled()) throw AuditCancelled();
  }

private:
  std::atomic<bool> cancelled_{false};
};
