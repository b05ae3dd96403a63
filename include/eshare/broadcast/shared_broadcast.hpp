#ifndef ESHARE_BROADCAST_SHARED_BROADCAST_HPP
#define ESHARE_BROADCAST_SHARED_BROADCAST_HPP

#include <algorithm>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../cancellation.hpp"
#include "../errors.hpp"
#include "../flow_collector.hpp"
#include "../fwd.hpp"
#include "../job.hpp"
#include "../task.hpp"
#include "../timer_service.hpp"
#include "concepts.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"
#include "readonly.hpp"
#include "replay_buffer.hpp"

namespace eshare {

namespace detail {

inline std::size_t validated_replay(int replay, int extra_capacity,
                                    overflow_policy overflow,
                                    bool has_initial_value) {
  if (replay < 0)
    throw configuration_error("replay cannot be negative, but was " +
                              std::to_string(replay));
  if (extra_capacity < 0)
    throw configuration_error(
        "extraBufferCapacity cannot be negative, but was " +
        std::to_string(extra_capacity));
  if (replay == 0 && extra_capacity == 0 &&
      overflow != overflow_policy::suspend)
    throw configuration_error("replay or extraBufferCapacity must be "
                              "positive with non-default onBufferOverflow");
  if (has_initial_value && replay == 0)
    throw configuration_error("initialValue is supported only with replay > 0");
  return static_cast<std::size_t>(replay);
}

// replay + extra, saturating at unlimited.
inline std::size_t buffer_capacity(int replay, int extra_capacity) {
  auto sum = static_cast<std::int64_t>(replay) + extra_capacity;
  return static_cast<std::size_t>(
      std::min<std::int64_t>(sum, std::numeric_limits<int>::max()));
}

} // namespace detail

// =============================================================================
// Shared Broadcast - hot multi-subscriber emission with replay
// =============================================================================
//
// Every subscriber receives every value emitted after it subscribed, plus up
// to `replay` values emitted before. Up to replay + extra_capacity values may
// be buffered for the slowest subscriber; what happens beyond that is decided
// by the overflow policy. Under SUSPEND, emit() waits until every subscriber
// has caught up far enough, and suspended emitters resume in emission order.
// Without subscribers emit() never waits.
//
// Always owned by a shared_ptr: subscriptions keep the broadcast alive.

template <Copyable T>
class shared_broadcast
    : public flow_collector<T>,
      public sync_primitive_base<shared_broadcast<T>>,
      public closeable_mixin<shared_broadcast<T>>,
      public std::enable_shared_from_this<shared_broadcast<T>> {
  using base_type = sync_primitive_base<shared_broadcast<T>>;
  using closeable = closeable_mixin<shared_broadcast<T>>;

  friend closeable;
  friend class subscription<T>;

protected:
  using lock_type = typename base_type::lock_type;
  using buffer_type = replay_buffer<T, waiter_ptr>;
  using cursor_id = typename buffer_type::cursor_id;

public:
  using value_type = T;
  using subscribed_action = std::function<task<void>(flow_collector<T> &)>;

  // ===========================================================================
  // Awaiters
  // ===========================================================================

  // Queues the emission behind a full buffer. Cancellation of the emitting
  // job withdraws the value unless a subscriber already made room for it.
  class emit_awaiter : public awaitable_base<emit_awaiter, void> {
  public:
    emit_awaiter(shared_broadcast &owner, T value)
        : owner_(owner), value_(std::move(value)) {}

    bool ready_impl() const { return false; }

    template <typename Promise>
    bool suspend_impl(std::coroutine_handle<Promise> h) {
      auto &job = *h.promise().job();
      token_ = job.token();
      std::vector<waiter_ptr> resumes;
      bool parked = false;
      {
        lock_type lock(owner_.mutex_);
        if (token_.is_cancelled()) {
          cancelled_ = true;
        } else if (owner_.buffer_.try_emit(value_)) {
          owner_.buffer_.collect_ready(resumes);
        } else {
          waiter_ = std::make_shared<waiter>(h, job.get_executor());
          index_ = owner_.buffer_.enqueue_emitter(value_, waiter_, resumes);
          registration_.arm(token_, waiter_);
          parked = true;
        }
      }
      // Only locals past this point; a subscriber may resume us right away.
      fire_all(resumes);
      return parked;
    }

    void resume_impl() {
      bool withdrawn = false;
      {
        lock_type lock(owner_.mutex_);
        registration_.disarm();
        if (waiter_ && token_.is_cancelled())
          withdrawn = owner_.buffer_.cancel_emitter(index_, waiter_);
      }
      if (cancelled_ || withdrawn)
        throw cancelled_exception{};
    }

  private:
    shared_broadcast &owner_;
    T value_;
    cancellation_token token_;
    cancellation_registration registration_;
    waiter_ptr waiter_;
    typename buffer_type::index_type index_{0};
    bool cancelled_{false};
  };

  // One attempt to receive: yields the next value, or nullopt when woken by
  // the deadline. Throws cancelled_exception on cancellation of the
  // receiving job and once the broadcast is closed and nothing is left.
  class receive_awaiter
      : public awaitable_base<receive_awaiter, std::optional<T>> {
  public:
    receive_awaiter(shared_broadcast &owner, cursor_id id,
                    clock_type::time_point deadline)
        : owner_(owner), id_(id), deadline_(deadline) {}

    bool ready_impl() const { return false; }

    template <typename Promise>
    bool suspend_impl(std::coroutine_handle<Promise> h) {
      auto &job = *h.promise().job();
      token_ = job.token();
      std::vector<waiter_ptr> resumes;
      bool parked = false;
      {
        lock_type lock(owner_.mutex_);
        auto &buffer = owner_.buffer_;
        while (!token_.is_cancelled() && !value_) {
          if (buffer.can_take(id_)) {
            value_ = buffer.try_take(id_, resumes);
            continue;
          }
          if (owner_.is_closed() || clock_type::now() >= deadline_)
            break;
          auto w = std::make_shared<waiter>(h, job.get_executor());
          buffer.park(id_, w);
          registration_.arm(token_, w);
          if (deadline_ != clock_type::time_point::max())
            get_timer_service().add_timer(deadline_, w);
          parked = true;
          break;
        }
      }
      fire_all(resumes);
      return parked;
    }

    std::optional<T> resume_impl() {
      std::vector<waiter_ptr> resumes;
      bool cancelled = false;
      bool exhausted = false;
      {
        lock_type lock(owner_.mutex_);
        registration_.disarm();
        owner_.buffer_.unpark(id_);
        cancelled = token_.is_cancelled();
        if (!value_ && !cancelled)
          value_ = owner_.buffer_.try_take(id_, resumes);
        exhausted = owner_.is_closed() && !owner_.buffer_.can_take(id_);
      }
      fire_all(resumes);
      if (value_)
        return std::move(value_);
      if (cancelled || exhausted)
        throw cancelled_exception{};
      return std::nullopt;
    }

  private:
    shared_broadcast &owner_;
    cursor_id id_;
    clock_type::time_point deadline_;
    cancellation_token token_;
    cancellation_registration registration_;
    std::optional<T> value_;
  };

  // ===========================================================================
  // Construction
  // ===========================================================================

  explicit shared_broadcast(int replay, int extra_capacity = 0,
                            overflow_policy overflow = overflow_policy::suspend,
                            std::optional<T> initial_value = std::nullopt)
      : buffer_(detail::validated_replay(replay, extra_capacity, overflow,
                                         initial_value.has_value()),
                detail::buffer_capacity(replay, extra_capacity), overflow),
        initial_(std::move(initial_value)) {
    std::vector<waiter_ptr> none;
    seed_initial_locked(none);
  }

  ~shared_broadcast() override = default;

  // ===========================================================================
  // Emission
  // ===========================================================================

  task<void> emit(T value) override {
    auto job = co_await current_job();
    if (job && job->is_cancelled())
      throw cancelled_exception{};
    if (emit_now(value))
      co_return;
    co_await emit_awaiter{*this, std::move(value)};
  }

  // Never suspends; false when SUSPEND would have to wait.
  virtual bool try_emit(const T &value) { return emit_now(value); }

  // ===========================================================================
  // Subscription
  // ===========================================================================

  subscription<T> subscribe() {
    auto self = this->shared_from_this();
    cursor_id id;
    std::vector<waiter_ptr> resumes;
    {
      lock_type lock(this->mutex_);
      id = buffer_.allocate_cursor();
      publish_count_locked(resumes);
    }
    fire_all(resumes);
    return subscription<T>{std::move(self), id};
  }

  // Subscribe and forward every value to collector. Returns only by
  // cancellation of the collecting job (or the collector throwing).
  task<void> collect(flow_collector<T> &collector,
                     subscribed_action on_subscribed = {}) {
    auto sub = subscribe();
    if (on_subscribed)
      co_await on_subscribed(collector);
    while (true)
      co_await collector.emit(co_await sub.next());
  }

  // Latest-value signal of the number of live subscriptions, published in
  // the same critical section that adds or removes a subscription.
  readonly_latest_value<std::size_t> subscription_count() const;

  // ===========================================================================
  // Replay
  // ===========================================================================

  // New subscribers start empty (or with the initial value, if any). Values
  // still owed to existing subscribers are delivered.
  virtual void reset_buffer() {
    std::vector<waiter_ptr> resumes;
    {
      lock_type lock(this->mutex_);
      buffer_.reset_replay();
      seed_initial_locked(resumes);
    }
    fire_all(resumes);
  }

  std::vector<T> replay_cache() const {
    lock_type lock(this->mutex_);
    return buffer_.replay_cache();
  }

  std::size_t replay() const noexcept { return buffer_.replay_capacity(); }
  std::size_t capacity() const noexcept { return buffer_.capacity(); }
  overflow_policy overflow() const noexcept { return buffer_.overflow(); }

protected:
  bool emit_now(const T &value) {
    std::vector<waiter_ptr> resumes;
    bool emitted;
    {
      lock_type lock(this->mutex_);
      emitted = buffer_.try_emit(value);
      if (emitted)
        buffer_.collect_ready(resumes);
    }
    fire_all(resumes);
    return emitted;
  }

  void seed_initial_locked(std::vector<waiter_ptr> &resumes) {
    if (initial_ && buffer_.try_emit(*initial_))
      buffer_.collect_ready(resumes);
  }

  // Caller holds mutex_ and fires resumes after releasing it.
  void publish_count_locked(std::vector<waiter_ptr> &resumes) const;

  // Whether subscriptions skip a value equal to the last one they delivered.
  virtual bool skips_repeats() const noexcept { return false; }
  virtual bool is_repeat(const T &, const T &) const { return false; }

  buffer_type buffer_;
  std::optional<T> initial_;

private:
  void on_close() {
    std::vector<waiter_ptr> resumes;
    {
      lock_type lock(this->mutex_);
      buffer_.collect_parked(resumes);
    }
    fire_all(resumes);
  }

  std::optional<T> take(cursor_id id) {
    std::vector<waiter_ptr> resumes;
    std::optional<T> value;
    {
      lock_type lock(this->mutex_);
      while (!value && buffer_.can_take(id))
        value = buffer_.try_take(id, resumes);
    }
    fire_all(resumes);
    return value;
  }

  void release(cursor_id id) {
    std::vector<waiter_ptr> resumes;
    {
      lock_type lock(this->mutex_);
      buffer_.free_cursor(id, resumes);
      publish_count_locked(resumes);
    }
    fire_all(resumes);
  }

  mutable std::shared_ptr<latest_value_broadcast<std::size_t>> count_;
};

// =============================================================================
// Subscription - one subscriber's cursor into a broadcast
// =============================================================================
//
// Move-only; unsubscribes on destruction. Meant to be consumed by a single
// coroutine at a time.

template <Copyable T> class subscription {
  using cursor_id = typename shared_broadcast<T>::cursor_id;

public:
  subscription() = default;

  subscription(subscription &&other) noexcept
      : owner_(std::move(other.owner_)), id_(other.id_),
        last_(std::move(other.last_)) {}

  subscription &operator=(subscription &&other) noexcept {
    if (this != &other) {
      unsubscribe();
      owner_ = std::move(other.owner_);
      id_ = other.id_;
      last_ = std::move(other.last_);
    }
    return *this;
  }

  subscription(const subscription &) = delete;
  subscription &operator=(const subscription &) = delete;

  ~subscription() { unsubscribe(); }

  // co_await sub.next() - suspends until the next value
  task<T> next() {
    if (!owner_)
      throw cancelled_exception{};
    while (true) {
      auto value = co_await receive(clock_type::time_point::max());
      if (value && accept(*value))
        co_return std::move(*value);
    }
  }

  // Next value, or nullopt once the deadline passed.
  task<std::optional<T>> next_until(clock_type::time_point deadline) {
    if (!owner_)
      throw cancelled_exception{};
    while (true) {
      auto value = co_await receive(deadline);
      if (value && !accept(*value))
        value.reset();
      if (value || clock_type::now() >= deadline)
        co_return std::move(value);
    }
  }

  template <typename Rep, typename Period>
  task<std::optional<T>> next_for(std::chrono::duration<Rep, Period> timeout) {
    return next_until(deadline_after(timeout));
  }

  std::optional<T> try_next() {
    if (!owner_)
      return std::nullopt;
    while (auto value = owner_->take(id_)) {
      if (accept(*value))
        return value;
    }
    return std::nullopt;
  }

  void unsubscribe() {
    if (auto owner = std::move(owner_))
      owner->release(id_);
  }

  bool is_active() const noexcept { return owner_ != nullptr; }

private:
  friend class shared_broadcast<T>;

  subscription(std::shared_ptr<shared_broadcast<T>> owner, cursor_id id)
      : owner_(std::move(owner)), id_(id) {}

  typename shared_broadcast<T>::receive_awaiter
  receive(clock_type::time_point deadline) {
    return {*owner_, id_, deadline};
  }

  // False for a repeat of the last delivered value, which is dropped.
  bool accept(const T &value) {
    if (!owner_->skips_repeats())
      return true;
    if (last_ && owner_->is_repeat(*last_, value))
      return false;
    last_ = value;
    return true;
  }

  std::shared_ptr<shared_broadcast<T>> owner_;
  cursor_id id_{0};
  std::optional<T> last_;
};

} // namespace eshare

// subscription_count() needs the complete latest-value broadcast.
#include "latest_value.hpp"

#endif // ESHARE_BROADCAST_SHARED_BROADCAST_HPP
