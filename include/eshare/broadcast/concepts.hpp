#ifndef ESHARE_BROADCAST_CONCEPTS_HPP
#define ESHARE_BROADCAST_CONCEPTS_HPP

#include <concepts>
#include <coroutine>
#include <cstddef>
#include <optional>
#include <type_traits>

namespace eshare {

// =============================================================================
// Core Type Concepts
// =============================================================================

// Values of a broadcast are handed to every subscriber, so they are copied.
template <typename T>
concept Copyable = std::copy_constructible<T> && std::copyable<T>;

// Values of a latest-value broadcast are de-duplicated by equality.
template <typename T>
concept StateValue = Copyable<T> && std::equality_comparable<T>;

// =============================================================================
// Coroutine Awaitable Concepts
// =============================================================================

template <typename T>
concept Awaiter = requires(T a) {
  { a.await_ready() } -> std::convertible_to<bool>;
  { a.await_resume() };
};

template <typename T>
concept AwaitableWithMemberOperator = requires(T a) {
  { a.operator co_await() } -> Awaiter;
};

template <typename T>
concept Awaitable = Awaiter<T> || AwaitableWithMemberOperator<T>;

// =============================================================================
// Broadcast Concepts
// =============================================================================

// Anything the sharing coordinator can drive: it must be able to reset the
// retained values, publish its subscriber count and release subscribers.
template <typename B>
concept ResettableBroadcast = requires(B b) {
  { b.reset_buffer() } -> std::same_as<void>;
  { b.subscription_count() };
  { b.close() } -> std::same_as<void>;
};

// A receiving side handed out by subscribe().
template <typename S, typename T>
concept Subscription = requires(S s) {
  { s.try_next() } -> std::convertible_to<std::optional<T>>;
  { s.next() } -> Awaitable;
  { s.unsubscribe() } -> std::same_as<void>;
};

} // namespace eshare

#endif // ESHARE_BROADCAST_CONCEPTS_HPP
