#ifndef ESHARE_BROADCAST_READONLY_HPP
#define ESHARE_BROADCAST_READONLY_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "../fwd.hpp"
#include "../task.hpp"

namespace eshare {

// =============================================================================
// Read-only views
// =============================================================================
//
// Handed out by share()/stateify(). They share ownership of the broadcast but
// only expose the receiving side, so whoever holds a view cannot emit into
// or reset the broadcast behind the coordinator's back.
//
// as_flow() and on_subscription() are defined in flow.hpp.

template <Copyable T> class readonly_broadcast {
public:
  using value_type = T;
  using subscribed_action = std::function<task<void>(flow_collector<T> &)>;

  readonly_broadcast() = default;
  explicit readonly_broadcast(std::shared_ptr<shared_broadcast<T>> target)
      : target_(std::move(target)) {}

  explicit operator bool() const noexcept { return target_ != nullptr; }

  subscription<T> subscribe() const { return target_->subscribe(); }

  readonly_latest_value<std::size_t> subscription_count() const;

  std::vector<T> replay_cache() const { return target_->replay_cache(); }

  // Never completes on its own; ends with cancellation of the collector.
  flow<T> as_flow() const;

  // Like as_flow(), running action after the subscription is registered and
  // before the first value is delivered.
  flow<T> on_subscription(subscribed_action action) const;

  bool operator==(const readonly_broadcast &other) const {
    return target_ == other.target_;
  }

private:
  std::shared_ptr<shared_broadcast<T>> target_;
};

template <StateValue T> class readonly_latest_value {
public:
  using value_type = T;
  using subscribed_action = std::function<task<void>(flow_collector<T> &)>;

  readonly_latest_value() = default;
  explicit readonly_latest_value(
      std::shared_ptr<latest_value_broadcast<T>> target)
      : target_(std::move(target)) {}

  explicit operator bool() const noexcept { return target_ != nullptr; }

  T value() const { return target_->value(); }

  subscription<T> subscribe() const { return target_->subscribe(); }

  readonly_latest_value<std::size_t> subscription_count() const;

  std::vector<T> replay_cache() const { return target_->replay_cache(); }

  readonly_broadcast<T> as_broadcast() const {
    return readonly_broadcast<T>{target_};
  }

  flow<T> as_flow() const;

  flow<T> on_subscription(subscribed_action action) const;

  bool operator==(const readonly_latest_value &other) const {
    return target_ == other.target_;
  }

private:
  std::shared_ptr<latest_value_broadcast<T>> target_;
};

template <Copyable T>
readonly_latest_value<std::size_t>
readonly_broadcast<T>::subscription_count() const {
  return target_->subscription_count();
}

template <StateValue T>
readonly_latest_value<std::size_t>
readonly_latest_value<T>::subscription_count() const {
  return target_->subscription_count();
}

} // namespace eshare

#endif // ESHARE_BROADCAST_READONLY_HPP
