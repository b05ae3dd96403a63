#ifndef ESHARE_SHARING_SHARE_HPP
#define ESHARE_SHARING_SHARE_HPP

#include <exception>
#include <memory>
#include <optional>
#include <utility>

#include "../broadcast/latest_value.hpp"
#include "../broadcast/policies.hpp"
#include "../broadcast/readonly.hpp"
#include "../broadcast/shared_broadcast.hpp"
#include "../cancellation.hpp"
#include "../deferred.hpp"
#include "../errors.hpp"
#include "../executor.hpp"
#include "../flow.hpp"
#include "../job.hpp"
#include "../task.hpp"
#include "../task_scope.hpp"
#include "coordinator.hpp"
#include "start_policy.hpp"

namespace eshare {

// =============================================================================
// Sharing configuration
// =============================================================================

template <typename T> struct sharing_config {
  flow<T> upstream;
  int extra_capacity;
  overflow_policy overflow;
  executor *context; // null: the scope's executor
};

// A pure buffer()/flow_on() stage directly in front of share() is unwrapped:
// its capacity becomes the broadcast's extra capacity, its overflow policy
// the broadcast's, and its context the producer's. Anything else is shared
// as it is, with the default buffer.
template <typename T>
sharing_config<T> configure_sharing(const flow<T> &upstream) {
  if (const auto *stage = upstream.stage()) {
    int capacity = stage->capacity;
    if (capacity == buffered || capacity == detail::optional_channel)
      capacity = default_buffer_capacity;
    return {*stage->upstream, capacity, stage->overflow, stage->context};
  }
  return {upstream, default_buffer_capacity, overflow_policy::suspend,
          nullptr};
}

// =============================================================================
// share / stateify
// =============================================================================

// Share upstream among all subscribers of the returned broadcast, replaying
// the last `replay` values to new ones. The session lives in scope.
template <Copyable T>
readonly_broadcast<T> share(const flow<T> &upstream, task_scope &scope,
                            int replay,
                            start_policy policy = start_policy::eagerly(),
                            std::optional<T> initial_value = std::nullopt) {
  auto config = configure_sharing(upstream);
  auto broadcast = std::make_shared<shared_broadcast<T>>(
      replay, config.extra_capacity, config.overflow,
      std::move(initial_value));
  sharing_coordinator<shared_broadcast<T>>::launch(
      scope, config.context, std::move(config.upstream), broadcast,
      std::move(policy));
  return readonly_broadcast<T>{std::move(broadcast)};
}

// Keep the latest value of upstream in a live value, starting from
// initial_value.
template <StateValue T>
readonly_latest_value<T> stateify(const flow<T> &upstream, task_scope &scope,
                                  start_policy policy, T initial_value) {
  auto config = configure_sharing(upstream);
  auto state =
      std::make_shared<latest_value_broadcast<T>>(std::move(initial_value));
  sharing_coordinator<latest_value_broadcast<T>>::launch(
      scope, config.context, std::move(config.upstream), state,
      std::move(policy));
  return readonly_latest_value<T>{std::move(state)};
}

namespace detail {

template <StateValue T>
task<void> share_first_value(
    flow<T> upstream,
    std::shared_ptr<deferred<readonly_latest_value<T>>> result) {
  auto self = co_await current_job();
  if (self->is_cancelled()) {
    result->fail(std::make_exception_ptr(cancelled_exception{}));
    co_return;
  }

  std::shared_ptr<latest_value_broadcast<T>> state;
  std::exception_ptr error;
  try {
    co_await upstream.collect([&state, &result](T value) {
      if (state) {
        state->set_value(std::move(value));
        return;
      }
      state = std::make_shared<latest_value_broadcast<T>>(std::move(value));
      result->complete(readonly_latest_value<T>{state});
    });
  } catch (...) {
    error = std::current_exception();
  }
  if (error) {
    result->fail(error);
    std::rethrow_exception(error);
  }
  if (state)
    co_return;
  if (self->is_cancelled())
    result->fail(std::make_exception_ptr(cancelled_exception{}));
  else
    result->fail(std::make_exception_ptr(
        sharing_error("upstream completed without emitting a value")));
}

} // namespace detail

// Start upstream eagerly and wait for its first value, which seeds the
// returned live value; later values update it. Throws cancelled_exception
// when scope is cancelled before the first value arrives.
template <StateValue T>
task<readonly_latest_value<T>> stateify(flow<T> upstream, task_scope &scope) {
  auto config = configure_sharing(upstream);
  auto result = std::make_shared<deferred<readonly_latest_value<T>>>();
  // Atomic so the result is always settled, even on a cancelled scope.
  scope.launch(detail::share_first_value(std::move(config.upstream), result),
               config.context, start_mode::atomic);
  co_return co_await result->get();
}

} // namespace eshare

#endif // ESHARE_SHARING_SHARE_HPP
