#ifndef ESHARE_THREAD_POOL_HPP
#define ESHARE_THREAD_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "executor.hpp"

/*
  Fixed set of worker threads resuming coroutine handles from one shared FIFO
  queue. FIFO keeps the resume order of woken waiters, which is what the
  broadcast relies on for fair emitter wakeups; no per-worker deques or
  stealing, so a handle scheduled first is always picked up first.
*/

namespace eshare {

class thread_pool final : public executor {
public:
  explicit thread_pool(
      std::size_t workers = std::thread::hardware_concurrency());
  ~thread_pool() override;

  thread_pool(const thread_pool &) = delete;
  thread_pool &operator=(const thread_pool &) = delete;

  void schedule(std::coroutine_handle<> handle) override;

  std::size_t size() const noexcept { return workers_.size(); }

  // Stop accepting work, run what is queued, join the workers.
  void shutdown();

  // True on the threads of any thread_pool.
  static bool on_worker_thread() noexcept;

private:
  void worker_loop(std::size_t id);

  std::vector<std::thread> workers_;
  std::deque<std::coroutine_handle<>> queue_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> shutting_down_{false};
  std::size_t running_{0}; // workers not yet exited, guarded by mutex_

  static thread_local bool is_worker_;
  static thread_local std::size_t worker_id_;
};

// Process-wide pool, created on first use.
thread_pool &default_pool();

} // namespace eshare

#endif // ESHARE_THREAD_POOL_HPP
