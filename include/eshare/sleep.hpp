#ifndef ESHARE_SLEEP_HPP
#define ESHARE_SLEEP_HPP

#include <chrono>
#include <coroutine>
#include <memory>

#include "broadcast/crtp_base.hpp"
#include "cancellation.hpp"
#include "job.hpp"
#include "timer_service.hpp"

namespace eshare {

enum class sleep_status { completed, cancelled };

// Suspends until the deadline or until the awaiting job is cancelled,
// whichever comes first.
class sleep_awaiter : public awaitable_base<sleep_awaiter, sleep_status> {
public:
  explicit sleep_awaiter(clock_type::time_point deadline)
      : deadline_(deadline) {}

  bool ready_impl() const { return clock_type::now() >= deadline_; }

  template <typename Promise>
  bool suspend_impl(std::coroutine_handle<Promise> h) {
    auto &job = *h.promise().job();
    token_ = job.token();
    if (token_.is_cancelled())
      return false;

    auto w = std::make_shared<waiter>(h, job.get_executor());
    auto deadline = deadline_;
    registration_.arm(token_, w);
    // Cancellation may already have resumed us here; touch locals only.
    get_timer_service().add_timer(deadline, std::move(w));
    return true;
  }

  sleep_status resume_impl() {
    registration_.disarm();
    if (token_.is_cancelled())
      return sleep_status::cancelled;
    return sleep_status::completed;
  }

private:
  clock_type::time_point deadline_;
  cancellation_token token_;
  cancellation_registration registration_;
};

// Sleep for a duration; cut short by cancellation of the calling job.
template <typename Rep, typename Period>
sleep_awaiter sleep_for(std::chrono::duration<Rep, Period> duration) {
  return sleep_awaiter(deadline_after(duration));
}

inline sleep_awaiter sleep_until(clock_type::time_point deadline) {
  return sleep_awaiter(deadline);
}

} // namespace eshare

#endif // ESHARE_SLEEP_HPP
