#ifndef ESHARE_FLOW_HPP
#define ESHARE_FLOW_HPP

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "broadcast/policies.hpp"
#include "broadcast/readonly.hpp"
#include "broadcast/shared_broadcast.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "flow_collector.hpp"
#include "job.hpp"
#include "task.hpp"

namespace eshare {

namespace detail {

// Adapts a callable (returning void or task<void>) to a flow_collector.
template <typename T, typename Fn> class callable_collector final
    : public flow_collector<T> {
public:
  explicit callable_collector(Fn fn) : fn_(std::move(fn)) {}

  task<void> emit(T value) override {
    if constexpr (is_task_v<std::invoke_result_t<Fn &, T>>) {
      co_await fn_(std::move(value));
    } else {
      fn_(std::move(value));
      co_return;
    }
  }

private:
  Fn fn_;
};

} // namespace detail

// =============================================================================
// Flow - cold asynchronous sequence
// =============================================================================
//
// Runs its body anew for every collect(). buffer() and flow_on() wrap the
// flow in a channel stage: the upstream then runs in its own job (on the
// stage context) and hands values over through a bounded buffer. Chained
// stages fuse into one; share()/stateify() unwrap a stage entirely and use
// its configuration for the broadcast itself.

template <typename T> class flow {
public:
  using value_type = T;
  using body_type = std::function<task<void>(flow_collector<T> &)>;

  struct channel_stage {
    std::shared_ptr<const flow> upstream;
    int capacity;
    overflow_policy overflow;
    executor *context;
  };

  // The empty flow.
  flow() : body_([](flow_collector<T> &) -> task<void> { co_return; }) {}

  explicit flow(body_type body) : body_(std::move(body)) {}

  // Runs the flow into collector; completes when the flow does.
  task<void> collect(flow_collector<T> &collector) const {
    if (stage_)
      return run_stage(*stage_, collector);
    return body_(collector);
  }

  template <typename Fn>
    requires std::invocable<Fn &, T>
  task<void> collect(Fn fn) const {
    return collect_with(*this, std::move(fn));
  }

  // Decouple the upstream through a buffer of capacity values (buffered:
  // the default size). Overflow other than SUSPEND replaces whatever an
  // earlier stage configured.
  flow buffer(int capacity = buffered,
              overflow_policy overflow = overflow_policy::suspend) const {
    if (capacity < 0 && capacity != buffered)
      throw configuration_error(
          "Buffer size should be non-negative or BUFFERED, but was " +
          std::to_string(capacity));
    return fuse(capacity, overflow, nullptr);
  }

  // Keep only the latest value for a slow collector.
  flow conflate() const { return buffer(0, overflow_policy::drop_oldest); }

  // Run the upstream on context. A context set closer to the source wins.
  flow flow_on(executor &context) const {
    return fuse(detail::optional_channel, overflow_policy::suspend, &context);
  }

  // Non-null when this flow is a pure buffer/flow_on stage.
  const channel_stage *stage() const noexcept {
    return stage_ ? &*stage_ : nullptr;
  }

private:
  struct stage_item {
    std::optional<T> value; // empty: upstream finished
    std::exception_ptr error;
  };

  using bridge_type = shared_broadcast<stage_item>;

  class bridge_collector final : public flow_collector<T> {
  public:
    bridge_collector(bridge_type &bridge, bool drop_latest)
        : bridge_(bridge), drop_latest_(drop_latest) {}

    task<void> emit(T value) override {
      stage_item item{std::move(value), nullptr};
      if (drop_latest_) {
        // A full buffer discards the value.
        static_cast<void>(bridge_.try_emit(item));
        co_return;
      }
      co_await bridge_.emit(std::move(item));
    }

  private:
    bridge_type &bridge_;
    bool drop_latest_;
  };

  flow(channel_stage stage) : stage_(std::move(stage)) {}

  flow fuse(int capacity, overflow_policy overflow, executor *context) const {
    if (!stage_)
      return flow{channel_stage{std::make_shared<const flow>(*this), capacity,
                                overflow, context}};

    channel_stage fused = *stage_;
    if (!fused.context)
      fused.context = context;
    if (overflow != overflow_policy::suspend) {
      fused.capacity = capacity;
      fused.overflow = overflow;
    } else if (fused.capacity == detail::optional_channel) {
      fused.capacity = capacity;
    } else if (capacity == detail::optional_channel) {
      // flow_on alone keeps the configured capacity
    } else if (fused.capacity == buffered) {
      fused.capacity = capacity;
    } else if (capacity != buffered) {
      auto sum = static_cast<long long>(fused.capacity) + capacity;
      fused.capacity = sum >= unlimited ? unlimited : static_cast<int>(sum);
    }
    return flow{std::move(fused)};
  }

  template <typename Fn>
  static task<void> collect_with(flow self, Fn fn) {
    detail::callable_collector<T, Fn> collector{std::move(fn)};
    co_await self.collect(collector);
  }

  static task<void> run_stage(channel_stage stage,
                              flow_collector<T> &collector) {
    auto job = co_await current_job();
    // flow_on to where we already run needs no hand-over at all.
    if (stage.capacity == detail::optional_channel &&
        (!stage.context || stage.context == &job->get_executor())) {
      co_await stage.upstream->collect(collector);
      co_return;
    }

    int capacity = stage.capacity;
    if (capacity == buffered || capacity == detail::optional_channel)
      capacity = default_buffer_capacity;
    if (capacity == 0 && stage.overflow != overflow_policy::suspend)
      capacity = 1;
    bool drop_latest = stage.overflow == overflow_policy::drop_latest;
    auto bridge = std::make_shared<bridge_type>(
        0, capacity, drop_latest ? overflow_policy::suspend : stage.overflow);

    // Subscribe before the pump starts so nothing is emitted into the void.
    auto sub = bridge->subscribe();
    executor &exec = stage.context ? *stage.context : job->get_executor();
    auto pump_job =
        launch(job, exec, pump(stage.upstream, bridge, drop_latest));

    std::exception_ptr error;
    try {
      while (true) {
        auto item = co_await sub.next();
        if (item.error)
          std::rethrow_exception(item.error);
        if (!item.value)
          break;
        co_await collector.emit(std::move(*item.value));
      }
    } catch (...) {
      error = std::current_exception();
    }
    pump_job.cancel();
    co_await pump_job.join();
    if (error)
      std::rethrow_exception(error);
  }

  // Drives the upstream into the bridge; its failure travels through the
  // bridge so the collector rethrows it.
  static task<void> pump(std::shared_ptr<const flow> upstream,
                         std::shared_ptr<bridge_type> bridge,
                         bool drop_latest) {
    bridge_collector sink{*bridge, drop_latest};
    std::exception_ptr error;
    try {
      co_await upstream->collect(sink);
    } catch (const cancelled_exception &) {
      throw;
    } catch (...) {
      error = std::current_exception();
    }
    co_await bridge->emit(stage_item{std::nullopt, error});
  }

  body_type body_;
  std::optional<channel_stage> stage_;
};

// =============================================================================
// Views as flows
// =============================================================================

template <Copyable T> flow<T> readonly_broadcast<T>::as_flow() const {
  return on_subscription({});
}

template <Copyable T>
flow<T> readonly_broadcast<T>::on_subscription(subscribed_action action) const {
  auto target = target_;
  return flow<T>{[target, action](flow_collector<T> &collector) {
    return target->collect(collector, action);
  }};
}

template <StateValue T> flow<T> readonly_latest_value<T>::as_flow() const {
  return as_broadcast().as_flow();
}

template <StateValue T>
flow<T>
readonly_latest_value<T>::on_subscription(subscribed_action action) const {
  return as_broadcast().on_subscription(std::move(action));
}

} // namespace eshare

#endif // ESHARE_FLOW_HPP
