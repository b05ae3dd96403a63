#ifndef ESHARE_BROADCAST_CRTP_BASE_HPP
#define ESHARE_BROADCAST_CRTP_BASE_HPP

#include <atomic>
#include <coroutine>
#include <memory>
#include <utility>

#include "../executor.hpp"
#include "policies.hpp"

namespace eshare {

// =============================================================================
// Waiter - one suspended coroutine, resumed exactly once
// =============================================================================
//
// A suspended coroutine can be woken from several places at once: the
// primitive it waits on, the timer service, and a cancellation callback.
// All of them hold the same shared waiter and race on its gate; the single
// winner schedules the handle on the executor it suspended from. Losers see
// fire() == false and must not touch the handle.

class waiter {
public:
  waiter(std::coroutine_handle<> handle, executor &exec) noexcept
      : handle_(handle), exec_(&exec) {}

  waiter(const waiter &) = delete;
  waiter &operator=(const waiter &) = delete;

  bool fire() noexcept {
    bool expected = false;
    if (!fired_.compare_exchange_strong(expected, true,
                                        std::memory_order_acq_rel))
      return false;
    exec_->schedule(handle_);
    return true;
  }

  bool fired() const noexcept {
    return fired_.load(std::memory_order_acquire);
  }

private:
  std::coroutine_handle<> handle_;
  executor *exec_;
  std::atomic<bool> fired_{false};
};

using waiter_ptr = std::shared_ptr<waiter>;

// =============================================================================
// Awaitable Base - Provides standard coroutine awaiter interface via CRTP
// =============================================================================
//
// Derived class must implement:
// - bool ready_impl()
// - template <typename Promise> bool suspend_impl(std::coroutine_handle<Promise>)
//   returning false to resume immediately
// - T resume_impl()
//
// suspend_impl receives the typed handle so it can read the job context from
// the awaiting promise.

template <typename Derived, typename T> class awaitable_base {
protected:
  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  bool await_ready() { return derived().ready_impl(); }

  template <typename Promise>
  bool await_suspend(std::coroutine_handle<Promise> h) {
    return derived().suspend_impl(h);
  }

  T await_resume() { return derived().resume_impl(); }
};

// Specialization for void
template <typename Derived> class awaitable_base<Derived, void> {
protected:
  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  bool await_ready() { return derived().ready_impl(); }

  template <typename Promise>
  bool await_suspend(std::coroutine_handle<Promise> h) {
    return derived().suspend_impl(h);
  }

  void await_resume() { derived().resume_impl(); }
};

// =============================================================================
// Sync Primitive Base - one mutex guarding a primitive's whole state
// =============================================================================

template <typename Derived, typename LockPolicy = mutex_lock_policy>
class sync_primitive_base {
protected:
  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

  mutable mutex_type mutex_;

  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  sync_primitive_base() = default;
  ~sync_primitive_base() = default;

  sync_primitive_base(const sync_primitive_base &) = delete;
  sync_primitive_base &operator=(const sync_primitive_base &) = delete;
  sync_primitive_base(sync_primitive_base &&) = delete;
  sync_primitive_base &operator=(sync_primitive_base &&) = delete;
};

// =============================================================================
// Closeable Mixin
// =============================================================================

template <typename Derived> class closeable_mixin {
protected:
  std::atomic<bool> closed_{false};

public:
  void close() {
    if (closed_.exchange(true, std::memory_order_acq_rel))
      return;
    static_cast<Derived *>(this)->on_close();
  }

  bool is_closed() const { return closed_.load(std::memory_order_acquire); }

protected:
  void on_close() {}
};

// Schedule every waiter collected while a lock was held.
template <typename Range> void fire_all(Range &waiters) {
  for (auto &w : waiters) {
    if (w)
      w->fire();
  }
}

} // namespace eshare

#endif // ESHARE_BROADCAST_CRTP_BASE_HPP
