#ifndef ESHARE_TIMER_SERVICE_HPP
#define ESHARE_TIMER_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "broadcast/crtp_base.hpp"

namespace eshare {

using clock_type = std::chrono::steady_clock;

struct timer_entry {
  clock_type::time_point deadline;
  waiter_ptr target;

  // Min-heap: earliest deadline has highest priority
  bool operator>(const timer_entry &other) const {
    return deadline > other.deadline;
  }
};

// One background thread firing waiters at their deadline. A waiter that was
// already resumed by someone else loses the gate and the entry is dropped.
class timer_service {
public:
  timer_service();
  ~timer_service();

  timer_service(const timer_service &) = delete;
  timer_service &operator=(const timer_service &) = delete;

  void add_timer(clock_type::time_point deadline, waiter_ptr target);

  std::size_t pending() const;

  void shutdown();

private:
  void run();

  std::vector<timer_entry> heap_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_{true};
  std::thread thread_;
};

timer_service &get_timer_service();

// now + d without overflowing for "never" style durations.
template <typename Rep, typename Period>
clock_type::time_point deadline_after(std::chrono::duration<Rep, Period> d) {
  auto now = clock_type::now();
  // Compare in d's own unit; converting d to nanoseconds could overflow.
  auto room = std::chrono::duration_cast<std::chrono::duration<Rep, Period>>(
      clock_type::time_point::max() - now);
  if (d >= room)
    return clock_type::time_point::max();
  return now + std::chrono::duration_cast<clock_type::duration>(d);
}

} // namespace eshare

#endif // ESHARE_TIMER_SERVICE_HPP
