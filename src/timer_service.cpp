#include "eshare/timer_service.hpp"

#include <algorithm>
#include <functional>

namespace eshare {

timer_service::timer_service() : thread_([this] { run(); }) {}

timer_service::~timer_service() { shutdown(); }

void timer_service::add_timer(clock_type::time_point deadline,
                              waiter_ptr target) {
  // A deadline at the end of time never fires.
  if (deadline == clock_type::time_point::max())
    return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    heap_.push_back(timer_entry{deadline, std::move(target)});
    std::push_heap(heap_.begin(), heap_.end(), std::greater<>{});
  }
  cv_.notify_one();
}

std::size_t timer_service::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return heap_.size();
}

void timer_service::shutdown() {
  if (!running_.exchange(false, std::memory_order_acq_rel))
    return; // already shut down

  cv_.notify_one();
  if (thread_.joinable())
    thread_.join();

  // Executors may already be gone at this point, so nothing is fired.
  std::lock_guard<std::mutex> lock(mutex_);
  heap_.clear();
}

void timer_service::run() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (running_.load(std::memory_order_acquire)) {
    if (heap_.empty()) {
      cv_.wait(lock, [this] {
        return !heap_.empty() || !running_.load(std::memory_order_acquire);
      });
      continue;
    }

    auto now = clock_type::now();
    if (heap_.front().deadline <= now) {
      std::pop_heap(heap_.begin(), heap_.end(), std::greater<>{});
      auto entry = std::move(heap_.back());
      heap_.pop_back();

      // Skip entries whose waiter already resumed through another path.
      if (!entry.target->fired()) {
        lock.unlock();
        entry.target->fire();
        lock.lock();
      }
    } else {
      // Copy: the front entry may move while we wait.
      auto deadline = heap_.front().deadline;
      cv_.wait_until(lock, deadline);
    }
  }
}

timer_service &get_timer_service() {
  static timer_service service;
  return service;
}

} // namespace eshare
