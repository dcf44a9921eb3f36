#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "cancellation.hpp"
#include "log.hpp"

// End-of-work marker; one is queued per worker.
struct Shutdown {};

// Bounded multi-producer/multi-consumer queue. Producers block while the
// queue is full; close() releases every waiter and drops pending items.
template<typename T>
class WorkQueue {
public:
  using Item = std::variant<T, Shutdown>;

  explicit WorkQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

  bool push(Item item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [&]{ return closed_ || items_.size() < capacity_; });
    if(closed_) return false;
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  std::optional<Item> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [&]{ return closed_ || !items_.empty(); });
    if(closed_) return std::nullopt;
    Item item = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return item;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      items_.clear();
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::size_t capacity() const { return capacity_; }

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<Item> items_;
  bool closed_ = false;
};

// Fixed set of threads draining a WorkQueue sized to the worker count.
// Handlers own their per-item error policy; anything else escaping a handler
// is logged and the worker moves on, except AuditCancelled, which stops the
// pool and is rethrown from finish().
template<typename Job, typename Result>
class WorkerPool {
public:
  using Handler = std::function<Result(const Job&)>;

  WorkerPool(std::size_t workers, Handler handler, std::shared_ptr<Logger> logger)
    : workers_(workers == 0 ? 1 : workers),
      handler_(std::move(handler)),
      logger_(std::move(logger)),
      queue_(workers_),
      results_(workers_) {}

  ~WorkerPool() {
    if(!threads_.empty()) {
      queue_.close();
      join_all();
    }
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void start() {
    if(!threads_.empty()) return;
    log_debug(logger_.get(), "Initializing {} workers", workers_);
    for(std::size_t i = 0; i < workers_; ++i) {
      threads_.emplace_back([this, i](){ worker_loop(i); });
    }
  }

  // Blocks while the queue is full. False once the pool has been stopped.
  bool submit(Job job) {
    return queue_.push(typename WorkQueue<Job>::Item(std::in_place_index<0>, std::move(job)));
  }

  // Queues one shutdown per worker, waits for every worker and returns all
  // results in no particular order.
  std::vector<Result> finish() {
    log_debug(logger_.get(), "Populating end of queue with shutdown messages");
    for(std::size_t i = 0; i < threads_.size(); ++i) {
      if(!queue_.push(typename WorkQueue<Job>::Item(std::in_place_index<1>, Shutdown{}))) break;
    }
    log_debug(logger_.get(), "Waiting for workers to complete");
    join_all();
    log_debug(logger_.get(), "All workers have exited");

    {
      std::lock_guard<std::mutex> lock(failure_mutex_);
      if(failure_) std::rethrow_exception(failure_);
    }

    std::vector<Result> merged;
    for(auto& chunk : results_) {
      for(auto& result : chunk) merged.push_back(std::move(result));
      chunk.clear();
    }
    return merged;
  }

  std::size_t size() const { return workers_; }

private:
  void worker_loop(std::size_t index) {
    for(;;) {
      auto item = queue_.pop();
      if(!item) break;
      if(std::holds_alternative<Shutdown>(*item)) {
        log_debug(logger_.get(), "Worker {} received shutdown: exiting", index);
        break;
      }
      const Job& job = std::get<0>(*item);
      try {
        results_[index].push_back(handler_(job));
      } catch(const AuditCancelled&) {
        {
          std::lock_guard<std::mutex> lock(failure_mutex_);
          if(!failure_) failure_ = std::current_exception();
        }
        queue_.close();
        break;
      } catch(const std::exception& e) {
        log_error(logger_.get(), "Suppressed error: {}", e.what());
      }
    }
  }

  void join_all() {
    for(auto& thread : threads_) {
      if(thread.joinable()) thread.join();
    }
    threads_.clear();
  }

  std::size_t workers_;
  Handler handler_;
  std::shared_ptr<Logger> logger_;
  WorkQueue<Job> queue_;
  std::vector<std::vector<Result>> results_;
  std::vector<std::thread> threads_;
  std::mutex failure_mutex_;
  std::exception_ptr failure_;
};
