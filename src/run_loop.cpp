#include "eshare/run_loop.hpp"

namespace eshare {

void run_loop::schedule(std::coroutine_handle<> handle) {
  if (!handle || handle.done())
    return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(handle);
  }
  cv_.notify_one();
}

bool run_loop::run_one() {
  std::coroutine_handle<> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
      return false;
    handle = queue_.front();
    queue_.pop_front();
  }
  handle.resume();
  return true;
}

std::size_t run_loop::drain() {
  std::size_t ran = 0;
  while (run_one())
    ++ran;
  return ran;
}

void run_loop::run_until(const std::function<bool()> &done) {
  while (!done()) {
    if (run_one())
      continue;
    std::unique_lock<std::mutex> lock(mutex_);
    // done() can only change through a handle we run, so waiting for the
    // next scheduled handle never misses it.
    cv_.wait(lock, [this] { return !queue_.empty(); });
  }
}

std::size_t run_loop::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace eshare
