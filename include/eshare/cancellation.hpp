#ifndef ESHARE_CANCELLATION_HPP
#define ESHARE_CANCELLATION_HPP

#include <atomic>
#include <coroutine>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "broadcast/crtp_base.hpp"

namespace eshare {

// Exception thrown when a cancelled operation is detected
struct cancelled_exception : std::exception {
  const char *what() const noexcept override { return "operation cancelled"; }
};

// True when the exception is a cancellation rather than a failure.
inline bool is_cancellation(const std::exception_ptr &error) {
  if (!error)
    return false;
  try {
    std::rethrow_exception(error);
  } catch (const cancelled_exception &) {
    return true;
  } catch (...) {
    // Still owned by the caller's exception_ptr, only classified here.
    return false;
  }
}

// Shared state for cancellation - one per cancellation_source
class cancellation_state {
public:
  cancellation_state() = default;

  cancellation_state(const cancellation_state &) = delete;
  cancellation_state &operator=(const cancellation_state &) = delete;

  bool is_cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  void cancel() {
    std::vector<std::function<void()>> cbs;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled_.exchange(true, std::memory_order_acq_rel))
        return; // already cancelled
      cbs.swap(callbacks_);
      callback_ids_.clear();
    }
    // Callbacks run outside the lock so they may cancel other states.
    for (auto &cb : cbs)
      cb();
  }

  // Register a callback invoked on cancellation. Returns an id for removal.
  // If already cancelled, fires immediately and returns 0.
  std::size_t register_callback(std::function<void()> cb) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!cancelled_.load(std::memory_order_acquire)) {
        std::size_t id = next_id_++;
        callbacks_.push_back(std::move(cb));
        callback_ids_.push_back(id);
        return id;
      }
    }
    cb();
    return 0;
  }

  void unregister_callback(std::size_t id) {
    if (id == 0)
      return;
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < callback_ids_.size(); ++i) {
      if (callback_ids_[i] == id) {
        callbacks_.erase(callbacks_.begin() + static_cast<std::ptrdiff_t>(i));
        callback_ids_.erase(callback_ids_.begin() +
                            static_cast<std::ptrdiff_t>(i));
        return;
      }
    }
  }

private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::vector<std::function<void()>> callbacks_;
  std::vector<std::size_t> callback_ids_;
  std::size_t next_id_{1};
};

class cancellation_awaiter;

// Lightweight copyable handle - does not own the state
class cancellation_token {
public:
  cancellation_token() = default;

  bool is_cancelled() const { return state_ && state_->is_cancelled(); }

  void throw_if_cancelled() const {
    if (is_cancelled())
      throw cancelled_exception{};
  }

  // co_await token.cancelled() - suspends until cancellation
  cancellation_awaiter cancelled() const;

  explicit operator bool() const { return state_ != nullptr; }

  std::shared_ptr<cancellation_state> state() const { return state_; }

private:
  friend class cancellation_source;
  explicit cancellation_token(std::shared_ptr<cancellation_state> state)
      : state_(std::move(state)) {}

  std::shared_ptr<cancellation_state> state_;
};

// Owns the cancellation state, creates tokens, triggers cancellation
class cancellation_source {
public:
  cancellation_source() : state_(std::make_shared<cancellation_state>()) {}

  cancellation_token token() const { return cancellation_token{state_}; }

  void cancel() { state_->cancel(); }

  bool is_cancelled() const { return state_->is_cancelled(); }

private:
  std::shared_ptr<cancellation_state> state_;
};

// =============================================================================
// Cancellation Registration - ties one suspension to a token
// =============================================================================
//
// arm() makes cancellation fire the waiter; disarm() undoes it once the
// coroutine resumed. The internal mutex orders disarm() after arm() even when
// the callback resumes the coroutine on another thread before arm() returned.

class cancellation_registration {
public:
  cancellation_registration() = default;

  cancellation_registration(const cancellation_registration &) = delete;
  cancellation_registration &
  operator=(const cancellation_registration &) = delete;

  void arm(const cancellation_token &token, const waiter_ptr &w) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = token.state();
    if (state_)
      id_ = state_->register_callback([w] { w->fire(); });
  }

  void disarm() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_) {
      state_->unregister_callback(id_);
      state_.reset();
      id_ = 0;
    }
  }

private:
  std::mutex mutex_;
  std::shared_ptr<cancellation_state> state_;
  std::size_t id_{0};
};

// =============================================================================
// Cancellation Awaiter
// =============================================================================

// Returned by cancellation_token::cancelled(); resumes once the token is
// cancelled. Resumption happens on the executor of the awaiting job.
class cancellation_awaiter
    : public awaitable_base<cancellation_awaiter, void> {
public:
  explicit cancellation_awaiter(std::shared_ptr<cancellation_state> state)
      : state_(std::move(state)) {}

  bool ready_impl() const { return !state_ || state_->is_cancelled(); }

  template <typename Promise>
  bool suspend_impl(std::coroutine_handle<Promise> h) {
    auto w = std::make_shared<waiter>(h, h.promise().job()->get_executor());
    // Only cancellation resumes us, so the callback is never unregistered.
    state_->register_callback([w] { w->fire(); });
    return true;
  }

  void resume_impl() {}

private:
  std::shared_ptr<cancellation_state> state_;
};

inline cancellation_awaiter cancellation_token::cancelled() const {
  return cancellation_awaiter{state_};
}

} // namespace eshare

#endif // ESHARE_CANCELLATION_HPP
