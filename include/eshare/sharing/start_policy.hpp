#ifndef ESHARE_SHARING_START_POLICY_HPP
#define ESHARE_SHARING_START_POLICY_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

#include "../broadcast/readonly.hpp"
#include "../flow.hpp"

namespace eshare {

// What the sharing coordinator does with the upstream producer.
enum class sharing_command {
  start,                // start the producer (no-op if running)
  stop,                 // cancel the producer, keep the buffer
  stop_and_reset_buffer // cancel the producer and reset the buffer
};

constexpr std::string_view to_string(sharing_command command) noexcept {
  switch (command) {
  case sharing_command::start:
    return "START";
  case sharing_command::stop:
    return "STOP";
  case sharing_command::stop_and_reset_buffer:
    return "STOP_AND_RESET_BUFFER";
  }
  return "UNKNOWN";
}

// =============================================================================
// Start Policy
// =============================================================================
//
// Decides when a shared producer runs, as a function of the live subscriber
// count: command_flow() turns the count signal into START / STOP /
// STOP_AND_RESET_BUFFER commands.

class start_policy {
public:
  using duration = std::chrono::milliseconds;

  // Start right away, never stop.
  struct eager {
    bool operator==(const eager &) const = default;
  };

  // Start with the first subscriber, never stop.
  struct lazy {
    bool operator==(const lazy &) const = default;
  };

  // Run while there are subscribers. After the last one left, stop once
  // stop_timeout elapsed and reset the buffer replay_expiration later.
  struct windowed {
    duration stop_timeout;
    duration replay_expiration;

    bool operator==(const windowed &) const = default;
  };

  using mode_type = std::variant<eager, lazy, windowed>;

  // replay_expiration that never expires the replay cache
  static constexpr duration never = duration::max();

  static start_policy eagerly() { return start_policy{eager{}}; }
  static start_policy lazily() { return start_policy{lazy{}}; }
  static start_policy while_subscribed(duration stop_timeout = duration::zero(),
                                       duration replay_expiration = never);

  // Commands for the given subscriber count signal. Never starts with STOP
  // or STOP_AND_RESET_BUFFER and never repeats a command back to back.
  flow<sharing_command>
  command_flow(readonly_latest_value<std::size_t> subscription_count) const;

  const mode_type &mode() const noexcept { return mode_; }

  std::string to_string() const;

  bool operator==(const start_policy &) const = default;

private:
  explicit start_policy(mode_type mode) : mode_(mode) {}

  mode_type mode_;
};

} // namespace eshare

#endif // ESHARE_SHARING_START_POLICY_HPP
