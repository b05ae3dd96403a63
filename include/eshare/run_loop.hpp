#ifndef ESHARE_RUN_LOOP_HPP
#define ESHARE_RUN_LOOP_HPP

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

#include "executor.hpp"

namespace eshare {

// Single-threaded executor. Handles run in FIFO order on whichever thread
// calls run_until()/drain(); other threads (the timer service, a pool) may
// schedule into it at any time and wake the running thread.
class run_loop final : public executor {
public:
  run_loop() = default;
  ~run_loop() override = default;

  run_loop(const run_loop &) = delete;
  run_loop &operator=(const run_loop &) = delete;

  void schedule(std::coroutine_handle<> handle) override;

  // Resume one queued handle; false when the queue was empty.
  bool run_one();

  // Run until the queue is empty; returns how many handles ran.
  std::size_t drain();

  // Run handles, blocking while idle, until done() holds.
  void run_until(const std::function<bool()> &done);

  std::size_t queued() const;

private:
  std::deque<std::coroutine_handle<>> queue_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace eshare

#endif // ESHARE_RUN_LOOP_HPP
