#include "eshare/thread_pool.hpp"
#include "eshare/allocator.hpp"

namespace eshare {

thread_local bool thread_pool::is_worker_ = false;
thread_local std::size_t thread_pool::worker_id_ = 0;

thread_pool::thread_pool(std::size_t workers) {
  init_allocator();

  if (workers == 0)
    workers = 1;

  running_ = workers;
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i)
    workers_.emplace_back([this, i] { worker_loop(i); });
}

thread_pool::~thread_pool() { shutdown(); }

bool thread_pool::on_worker_thread() noexcept { return is_worker_; }

void thread_pool::worker_loop(std::size_t id) {
  is_worker_ = true;
  worker_id_ = id;

  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] {
      return !queue_.empty() || shutting_down_.load(std::memory_order_acquire);
    });
    if (queue_.empty()) {
      --running_; // shutting down with nothing left
      return;
    }

    auto handle = queue_.front();
    queue_.pop_front();
    lock.unlock();
    // Promises capture their own exceptions; resume() does not throw.
    handle.resume();
    lock.lock();
  }
}

void thread_pool::schedule(std::coroutine_handle<> handle) {
  if (!handle || handle.done())
    return;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    // While shutting down, workers still running drain whatever is queued.
    if (!shutting_down_.load(std::memory_order_acquire) || running_ > 0) {
      queue_.push_back(handle);
      cv_.notify_one();
      return;
    }
  }
  // Every worker has exited: run inline
  handle.resume();
}

void thread_pool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.exchange(true, std::memory_order_acq_rel))
      return;
  }
  cv_.notify_all();

  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }
  workers_.clear();
}

thread_pool &default_pool() {
  static thread_pool pool;
  return pool;
}

} // namespace eshare
