#include "eshare/sharing/start_policy.hpp"

#include <optional>
#include <utility>

#include "eshare/errors.hpp"
#include "eshare/timer_service.hpp"

namespace eshare {

namespace {

// Drops leading stops and back-to-back duplicates.
class command_emitter {
public:
  explicit command_emitter(flow_collector<sharing_command> &out) : out_(out) {}

  task<void> emit(sharing_command command) {
    if (!last_ && command != sharing_command::start)
      co_return;
    if (last_ == command)
      co_return;
    last_ = command;
    co_await out_.emit(command);
  }

private:
  flow_collector<sharing_command> &out_;
  std::optional<sharing_command> last_;
};

task<void> run_eager(flow_collector<sharing_command> &out) {
  co_await out.emit(sharing_command::start);
}

task<void> run_lazy(readonly_latest_value<std::size_t> count,
                    flow_collector<sharing_command> &out) {
  auto sub = count.subscribe();
  bool started = false;
  while (true) {
    auto n = co_await sub.next();
    if (n > 0 && !started) {
      started = true;
      co_await out.emit(sharing_command::start);
    }
  }
}

// A later count cancels any pending wait; a repeated zero (seen after
// conflation) keeps the deadline that is already running.
task<std::optional<std::size_t>>
wait_for_subscriber(subscription<std::size_t> &sub,
                    clock_type::time_point deadline) {
  while (true) {
    auto n = co_await sub.next_until(deadline);
    if (!n || *n > 0)
      co_return n;
  }
}

task<void> run_while_subscribed(readonly_latest_value<std::size_t> count,
                                start_policy::windowed window,
                                flow_collector<sharing_command> &out) {
  command_emitter commands{out};
  auto sub = count.subscribe();
  std::size_t n = co_await sub.next();
  while (true) {
    if (n > 0) {
      co_await commands.emit(sharing_command::start);
      n = co_await sub.next();
      continue;
    }

    auto arrived =
        co_await wait_for_subscriber(sub, deadline_after(window.stop_timeout));
    if (arrived) {
      n = *arrived;
      continue;
    }
    if (window.replay_expiration > start_policy::duration::zero()) {
      co_await commands.emit(sharing_command::stop);
      if (window.replay_expiration == start_policy::never) {
        n = co_await sub.next();
        continue;
      }
      arrived = co_await wait_for_subscriber(
          sub, deadline_after(window.replay_expiration));
      if (arrived) {
        n = *arrived;
        continue;
      }
    }
    co_await commands.emit(sharing_command::stop_and_reset_buffer);
    n = co_await sub.next();
  }
}

} // namespace

start_policy start_policy::while_subscribed(duration stop_timeout,
                                            duration replay_expiration) {
  if (stop_timeout < duration::zero())
    throw configuration_error("stopTimeout cannot be negative");
  if (replay_expiration < duration::zero())
    throw configuration_error("replayExpiration cannot be negative");
  return start_policy{windowed{stop_timeout, replay_expiration}};
}

flow<sharing_command> start_policy::command_flow(
    readonly_latest_value<std::size_t> subscription_count) const {
  using collector_type = flow_collector<sharing_command>;

  if (std::holds_alternative<eager>(mode_))
    return flow<sharing_command>{
        [](collector_type &out) { return run_eager(out); }};

  if (std::holds_alternative<lazy>(mode_))
    return flow<sharing_command>{[subscription_count](collector_type &out) {
      return run_lazy(subscription_count, out);
    }};

  auto window = std::get<windowed>(mode_);
  return flow<sharing_command>{
      [subscription_count, window](collector_type &out) {
        return run_while_subscribed(subscription_count, window, out);
      }};
}

std::string start_policy::to_string() const {
  if (std::holds_alternative<eager>(mode_))
    return "SharingStarted.Eagerly";
  if (std::holds_alternative<lazy>(mode_))
    return "SharingStarted.Lazily";

  const auto &window = std::get<windowed>(mode_);
  std::string params;
  if (window.stop_timeout > duration::zero())
    params += "stopTimeout=" + std::to_string(window.stop_timeout.count()) + "ms";
  if (window.replay_expiration < never) {
    if (!params.empty())
      params += ", ";
    params += "replayExpiration=" +
              std::to_string(window.replay_expiration.count()) + "ms";
  }
  return "SharingStarted.WhileSubscribed(" + params + ")";
}

} // namespace eshare
