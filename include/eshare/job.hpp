#ifndef ESHARE_JOB_HPP
#define ESHARE_JOB_HPP

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "broadcast/crtp_base.hpp"
#include "cancellation.hpp"
#include "executor.hpp"
#include "task.hpp"

namespace eshare {

// =============================================================================
// Job State
// =============================================================================
//
// One launched unit of work, or a scope (a job with no body of its own).
// A job completes once its body returned and every child completed.
// Cancelling a job cancels its children; a child failing with anything other
// than cancelled_exception records the failure on the parent and cancels it.

class job_state : public std::enable_shared_from_this<job_state> {
public:
  enum class kind { task, scope };

  job_state(executor &exec, std::shared_ptr<job_state> parent,
            kind k = kind::task);
  ~job_state();

  job_state(const job_state &) = delete;
  job_state &operator=(const job_state &) = delete;

  executor &get_executor() const noexcept { return *exec_; }
  cancellation_token token() const { return source_.token(); }

  bool is_cancelled() const { return source_.is_cancelled(); }
  bool is_completed() const;

  void cancel() { source_.cancel(); }

  // Record a failure (first one wins) and cancel.
  void fail(std::exception_ptr error);

  std::exception_ptr failure() const;

  // Link to the parent: counts as a child there and follows its cancellation.
  void attach();

  // Called by the driver once the body returned or threw.
  void body_finished(std::exception_ptr error);

  // Park a waiter until completion; false when already completed.
  bool add_completion_waiter(const waiter_ptr &w);

  // Block the calling thread until completion.
  void wait_blocking();

private:
  void child_started();
  void child_finished(const std::exception_ptr &error);
  void maybe_complete(std::unique_lock<std::mutex> &lock);

  executor *exec_;
  std::weak_ptr<job_state> parent_;
  std::size_t parent_callback_id_{0};
  kind kind_;
  cancellation_source source_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool body_done_;
  bool completed_;
  std::size_t active_children_{0};
  std::exception_ptr failure_;
  std::vector<waiter_ptr> completion_waiters_;
};

// =============================================================================
// Join Awaiter
// =============================================================================

// Waits for a job to complete. The waiting coroutine's own cancellation does
// not interrupt the wait, so it is safe to use while cleaning up.
class join_awaiter : public awaitable_base<join_awaiter, void> {
public:
  explicit join_awaiter(std::shared_ptr<job_state> target)
      : target_(std::move(target)) {}

  bool ready_impl() const { return !target_ || target_->is_completed(); }

  template <typename Promise>
  bool suspend_impl(std::coroutine_handle<Promise> h) {
    auto w = std::make_shared<waiter>(h, h.promise().job()->get_executor());
    return target_->add_completion_waiter(w);
  }

  void resume_impl() {}

private:
  std::shared_ptr<job_state> target_;
};

// =============================================================================
// Job Handle
// =============================================================================

class job {
public:
  job() = default;
  explicit job(std::shared_ptr<job_state> state) : state_(std::move(state)) {}

  explicit operator bool() const noexcept { return state_ != nullptr; }

  void cancel() const {
    if (state_)
      state_->cancel();
  }

  bool is_active() const { return state_ && !state_->is_completed(); }
  bool is_cancelled() const { return state_ && state_->is_cancelled(); }
  bool is_completed() const { return !state_ || state_->is_completed(); }

  std::exception_ptr failure() const {
    return state_ ? state_->failure() : nullptr;
  }

  join_awaiter join() const { return join_awaiter{state_}; }

  void wait() const {
    if (state_)
      state_->wait_blocking();
  }

  const std::shared_ptr<job_state> &state() const noexcept { return state_; }

private:
  std::shared_ptr<job_state> state_;
};

// =============================================================================
// Launching
// =============================================================================

// How a launched body treats cancellation that arrives before it first runs:
// normal skips the body, atomic runs it anyway so it can clean up.
enum class start_mode { normal, atomic };

namespace detail {

// Self-destroying coroutine that owns a job's body.
struct job_driver {
  struct promise_type : promise_base {
    job_driver get_return_object() {
      return job_driver{
          std::coroutine_handle<promise_type>::from_promise(*this)};
    }
    std::suspend_always initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void return_void() noexcept {}
    // drive() catches everything itself.
    void unhandled_exception() noexcept { std::terminate(); }
  };

  std::coroutine_handle<promise_type> handle;
};

inline job_driver drive(std::shared_ptr<job_state> state, task<void> body,
                        start_mode mode) {
  std::exception_ptr error;
  if (mode == start_mode::normal && state->is_cancelled()) {
    error = std::make_exception_ptr(cancelled_exception{});
  } else {
    try {
      co_await body;
    } catch (...) {
      error = std::current_exception();
    }
  }
  state->body_finished(error);
}

} // namespace detail

// Start body as a child of parent (may be null) on exec. The body begins on
// the executor, never inline.
inline job launch(std::shared_ptr<job_state> parent, executor &exec,
                  task<void> body, start_mode mode = start_mode::normal) {
  auto state = std::make_shared<job_state>(exec, std::move(parent));
  state->attach();
  auto driver = detail::drive(state, std::move(body), mode);
  driver.handle.promise().set_job(state);
  exec.schedule(driver.handle);
  return job{std::move(state)};
}

// co_await current_job() yields the job context of the calling coroutine
// without suspending.
struct current_job_awaiter {
  std::shared_ptr<job_state> job_;

  bool await_ready() const noexcept { return false; }

  template <typename Promise>
  bool await_suspend(std::coroutine_handle<Promise> h) noexcept {
    job_ = h.promise().job();
    return false;
  }

  std::shared_ptr<job_state> await_resume() noexcept {
    return std::move(job_);
  }
};

inline current_job_awaiter current_job() { return {}; }

} // namespace eshare

#endif // ESHARE_JOB_HPP
