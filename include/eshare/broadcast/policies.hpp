#ifndef ESHARE_BROADCAST_POLICIES_HPP
#define ESHARE_BROADCAST_POLICIES_HPP

#include <cstddef>
#include <limits>
#include <mutex>
#include <string_view>

namespace eshare {

// =============================================================================
// Lock Policies
// =============================================================================

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

// =============================================================================
// Buffer Overflow Policies
// =============================================================================

// What an emitter does when the buffer is full and a subscriber lags.
enum class overflow_policy {
  suspend,     // wait until the slowest subscriber frees a slot
  drop_oldest, // evict the oldest buffered value, lagging cursors skip it
  drop_latest, // discard the value being emitted
};

constexpr std::string_view to_string(overflow_policy policy) noexcept {
  switch (policy) {
  case overflow_policy::suspend:
    return "SUSPEND";
  case overflow_policy::drop_oldest:
    return "DROP_OLDEST";
  case overflow_policy::drop_latest:
    return "DROP_LATEST";
  }
  return "UNKNOWN";
}

// =============================================================================
// Buffer Capacity Constants
// =============================================================================

// Extra capacity a shared broadcast gets when the upstream does not ask for
// anything specific.
inline constexpr int default_buffer_capacity = 64;

// Stage capacity requesting the default buffer size.
inline constexpr int buffered = -2;

// Stage capacity that never suspends the emitter.
inline constexpr int unlimited = std::numeric_limits<int>::max();

namespace detail {
// Capacity of a stage created by flow_on alone; defers to any other setting.
inline constexpr int optional_channel = -3;
} // namespace detail

} // namespace eshare

#endif // ESHARE_BROADCAST_POLICIES_HPP
