#include "eshare/job.hpp"

namespace eshare {

job_state::job_state(executor &exec, std::shared_ptr<job_state> parent,
                     kind k)
    : exec_(&exec), parent_(parent), kind_(k), body_done_(k == kind::scope),
      completed_(k == kind::scope) {}

job_state::~job_state() {
  if (auto parent = parent_.lock())
    parent->source_.token().state()->unregister_callback(parent_callback_id_);
}

bool job_state::is_completed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_;
}

std::exception_ptr job_state::failure() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_;
}

void job_state::fail(std::exception_ptr error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_)
      failure_ = std::move(error);
  }
  cancel();
}

void job_state::attach() {
  auto parent = parent_.lock();
  if (!parent)
    return;
  parent->child_started();
  std::weak_ptr<job_state> self = weak_from_this();
  parent_callback_id_ =
      parent->source_.token().state()->register_callback([self] {
        if (auto child = self.lock())
          child->cancel();
      });
}

void job_state::child_started() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++active_children_;
  // A scope becomes busy again when something new is launched into it.
  if (kind_ == kind::scope)
    completed_ = false;
}

void job_state::child_finished(const std::exception_ptr &error) {
  bool cancel_now = false;
  std::unique_lock<std::mutex> lock(mutex_);
  --active_children_;
  if (error && !is_cancellation(error)) {
    if (!failure_)
      failure_ = error;
    cancel_now = true;
  }
  if (cancel_now) {
    lock.unlock();
    cancel();
    lock.lock();
  }
  maybe_complete(lock);
}

void job_state::body_finished(std::exception_ptr error) {
  bool cancel_children = false;
  std::unique_lock<std::mutex> lock(mutex_);
  body_done_ = true;
  if (error && !is_cancellation(error) && !failure_) {
    failure_ = std::move(error);
    cancel_children = true;
  }
  if (cancel_children) {
    lock.unlock();
    cancel();
    lock.lock();
  }
  maybe_complete(lock);
}

void job_state::maybe_complete(std::unique_lock<std::mutex> &lock) {
  if (!body_done_ || active_children_ != 0 || completed_)
    return;
  completed_ = true;
  std::vector<waiter_ptr> waiters;
  waiters.swap(completion_waiters_);
  std::exception_ptr outcome = failure_;
  lock.unlock();

  cv_.notify_all();
  fire_all(waiters);

  if (kind_ == kind::task) {
    if (auto parent = parent_.lock()) {
      parent->source_.token().state()->unregister_callback(
          parent_callback_id_);
      parent_callback_id_ = 0;
      parent->child_finished(outcome);
    }
  }
  lock.lock();
}

bool job_state::add_completion_waiter(const waiter_ptr &w) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (completed_)
    return false;
  completion_waiters_.push_back(w);
  return true;
}

void job_state::wait_blocking() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return completed_; });
}

} // namespace eshare
