#ifndef ESHARE_BROADCAST_LATEST_VALUE_HPP
#define ESHARE_BROADCAST_LATEST_VALUE_HPP

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "../task.hpp"
#include "concepts.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"
#include "readonly.hpp"
#include "shared_broadcast.hpp"

namespace eshare {

// =============================================================================
// Latest Value Broadcast
// =============================================================================
//
// Shared broadcast holding exactly one value at all times (replay 1, no extra
// buffer, DROP_OLDEST). A slow subscriber skips to the newest value instead
// of seeing stale ones, and emitting a value equal to the current one is a
// no-op: nothing is stored and nobody is woken. A subscription never delivers
// the same value twice in a row, even when A -> B -> A conflates to A.

template <StateValue T>
class latest_value_broadcast : public shared_broadcast<T> {
  using base = shared_broadcast<T>;
  using typename base::lock_type;

public:
  explicit latest_value_broadcast(T initial_value)
      : base(1, 0, overflow_policy::drop_oldest, std::move(initial_value)) {}

  T value() const {
    lock_type lock(this->mutex_);
    return *this->buffer_.last_value();
  }

  void set_value(T value) {
    std::vector<waiter_ptr> resumes;
    set_value(std::move(value), resumes);
    fire_all(resumes);
  }

  // Store value and hand the woken subscribers to the caller, who fires them
  // once its own locks are released.
  void set_value(T value, std::vector<waiter_ptr> &resumes) {
    lock_type lock(this->mutex_);
    update_locked(value, resumes);
  }

  task<void> emit(T value) override {
    set_value(std::move(value));
    co_return;
  }

  bool try_emit(const T &value) override {
    set_value(value);
    return true;
  }

  // Store desired if the current value equals expected. On mismatch
  // expected receives the current value.
  bool compare_exchange(T &expected, const T &desired) {
    std::vector<waiter_ptr> resumes;
    {
      lock_type lock(this->mutex_);
      const T &current = *this->buffer_.last_value();
      if (!(current == expected)) {
        expected = current;
        return false;
      }
      update_locked(desired, resumes);
    }
    fire_all(resumes);
    return true;
  }

  // Back to the initial value.
  void reset_buffer() override { set_value(*this->initial_); }

  void reset_buffer(T value) { set_value(std::move(value)); }

protected:
  bool skips_repeats() const noexcept override { return true; }

  bool is_repeat(const T &previous, const T &value) const override {
    return previous == value;
  }

private:
  void update_locked(const T &value, std::vector<waiter_ptr> &resumes) {
    if (*this->buffer_.last_value() == value)
      return;
    if (this->buffer_.try_emit(value))
      this->buffer_.collect_ready(resumes);
  }
};

// =============================================================================
// Subscription count of shared_broadcast
// =============================================================================

template <Copyable T>
readonly_latest_value<std::size_t> shared_broadcast<T>::subscription_count() const {
  lock_type lock(this->mutex_);
  if (!count_)
    count_ = std::make_shared<latest_value_broadcast<std::size_t>>(
        buffer_.cursor_count());
  return readonly_latest_value<std::size_t>{count_};
}

// The count broadcast has its own lock and never calls back into this one.
// Its waiters are only collected here, so nobody resumes under mutex_.
template <Copyable T>
void shared_broadcast<T>::publish_count_locked(
    std::vector<waiter_ptr> &resumes) const {
  if (count_)
    count_->set_value(buffer_.cursor_count(), resumes);
}

} // namespace eshare

#endif // ESHARE_BROADCAST_LATEST_VALUE_HPP
