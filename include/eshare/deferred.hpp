#ifndef ESHARE_DEFERRED_HPP
#define ESHARE_DEFERRED_HPP

#include <coroutine>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "broadcast/crtp_base.hpp"
#include "cancellation.hpp"
#include "job.hpp"

namespace eshare {

// =============================================================================
// Result Holder - value or exception, set once
// =============================================================================

template <typename T> class result_holder {
  std::optional<T> value_;
  std::exception_ptr exception_;

public:
  void set_value(T value) { value_ = std::move(value); }

  void set_exception(std::exception_ptr e) { exception_ = e; }

  bool has_value() const { return value_.has_value(); }

  bool has_exception() const { return exception_ != nullptr; }

  bool ready() const { return has_value() || has_exception(); }

  T get() const {
    if (exception_)
      std::rethrow_exception(exception_);
    return *value_;
  }
};

// =============================================================================
// Deferred - one-shot result handed from a background job to its awaiter
// =============================================================================

template <typename T> class deferred {
public:
  class awaiter : public awaitable_base<awaiter, T> {
  public:
    explicit awaiter(deferred &owner) : owner_(owner) {}

    bool ready_impl() {
      std::lock_guard<std::mutex> lock(owner_.mutex_);
      return owner_.result_.ready();
    }

    template <typename Promise>
    bool suspend_impl(std::coroutine_handle<Promise> h) {
      auto &job = *h.promise().job();
      token_ = job.token();
      std::lock_guard<std::mutex> lock(owner_.mutex_);
      if (owner_.result_.ready() || token_.is_cancelled())
        return false;
      auto w = std::make_shared<waiter>(h, job.get_executor());
      owner_.waiters_.push_back(w);
      registration_.arm(token_, w);
      return true;
    }

    T resume_impl() {
      registration_.disarm();
      std::lock_guard<std::mutex> lock(owner_.mutex_);
      if (!owner_.result_.ready())
        throw cancelled_exception{};
      return owner_.result_.get();
    }

  private:
    deferred &owner_;
    cancellation_token token_;
    cancellation_registration registration_;
  };

  deferred() = default;

  deferred(const deferred &) = delete;
  deferred &operator=(const deferred &) = delete;

  // First completion wins; later ones return false.
  bool complete(T value) {
    std::vector<waiter_ptr> waiters;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (result_.ready())
        return false;
      result_.set_value(std::move(value));
      waiters.swap(waiters_);
    }
    fire_all(waiters);
    return true;
  }

  bool fail(std::exception_ptr error) {
    std::vector<waiter_ptr> waiters;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (result_.ready())
        return false;
      result_.set_exception(std::move(error));
      waiters.swap(waiters_);
    }
    fire_all(waiters);
    return true;
  }

  bool is_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_.ready();
  }

  // co_await d.get() - suspends until completed or the caller is cancelled
  awaiter get() { return awaiter{*this}; }

private:
  mutable std::mutex mutex_;
  result_holder<T> result_;
  std::vector<waiter_ptr> waiters_;
};

} // namespace eshare

#endif // ESHARE_DEFERRED_HPP
