#ifndef ESHARE_TASK_SCOPE_HPP
#define ESHARE_TASK_SCOPE_HPP

#include <coroutine>
#include <exception>
#include <memory>

#include "broadcast/crtp_base.hpp"
#include "executor.hpp"
#include "job.hpp"
#include "task.hpp"

namespace eshare {

// Waits until a scope has no running children, then rethrows the first
// failure any of them reported.
class scope_join_awaiter : public awaitable_base<scope_join_awaiter, void> {
public:
  explicit scope_join_awaiter(std::shared_ptr<job_state> state)
      : state_(std::move(state)) {}

  bool ready_impl() const { return state_->is_completed(); }

  template <typename Promise>
  bool suspend_impl(std::coroutine_handle<Promise> h) {
    auto w = std::make_shared<waiter>(h, h.promise().job()->get_executor());
    return state_->add_completion_waiter(w);
  }

  void resume_impl() {
    if (auto error = state_->failure())
      std::rethrow_exception(error);
  }

private:
  std::shared_ptr<job_state> state_;
};

// Owner of background jobs. Everything launched into a scope is cancelled
// with it; a failing job cancels the whole scope and its failure surfaces
// from join()/wait(). Destroying the scope cancels it without waiting.
class task_scope {
public:
  explicit task_scope(executor &exec);
  ~task_scope();

  task_scope(const task_scope &) = delete;
  task_scope &operator=(const task_scope &) = delete;

  // Start body on exec, or on the scope's executor when exec is null.
  job launch(task<void> body, executor *exec = nullptr,
             start_mode mode = start_mode::normal);

  void cancel() { state_->cancel(); }
  bool is_cancelled() const { return state_->is_cancelled(); }

  // True when no launched job is still running.
  bool is_idle() const { return state_->is_completed(); }

  std::exception_ptr failure() const { return state_->failure(); }

  scope_join_awaiter join() const;

  // Blocking form of join() for plain threads.
  void wait() const;

  executor &get_executor() const noexcept { return state_->get_executor(); }
  cancellation_token token() const { return state_->token(); }

  const std::shared_ptr<job_state> &state() const noexcept { return state_; }

private:
  std::shared_ptr<job_state> state_;
  mutable bool failure_observed_{false};
};

} // namespace eshare

#endif // ESHARE_TASK_SCOPE_HPP
