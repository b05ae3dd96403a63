#ifndef ESHARE_ASYNC_RUNTIME_HPP
#define ESHARE_ASYNC_RUNTIME_HPP

#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "job.hpp"
#include "run_loop.hpp"
#include "task.hpp"
#include "thread_pool.hpp"

namespace eshare {

namespace detail {

template <typename T>
task<void> store_result(task<T> body, std::optional<T> &out) {
  out.emplace(co_await body);
}

inline task<void> store_result(task<void> body) { co_await body; }

} // namespace detail

// Run a task to completion on a fresh run_loop driven by the calling thread.
// Everything the task launches onto the loop runs on this thread too; the
// loop is drained before returning so cancelled jobs get to finish.
template <typename T> T block_on(task<T> body) {
  run_loop loop;
  std::optional<std::conditional_t<std::is_void_v<T>, int, T>> result;
  job root;
  if constexpr (std::is_void_v<T>) {
    root = launch(nullptr, loop, detail::store_result(std::move(body)));
  } else {
    root = launch(nullptr, loop, detail::store_result(std::move(body), result));
  }
  loop.run_until([&root] { return root.is_completed(); });
  loop.drain();

  if (auto error = root.failure())
    std::rethrow_exception(error);
  if constexpr (!std::is_void_v<T>) {
    if (!result)
      throw cancelled_exception{};
    return std::move(*result);
  }
}

// Run a task on a pool and block the calling thread until it completes.
template <typename T> T block_on(task<T> body, thread_pool &pool) {
  std::optional<std::conditional_t<std::is_void_v<T>, int, T>> result;
  job root;
  if constexpr (std::is_void_v<T>) {
    root = launch(nullptr, pool, detail::store_result(std::move(body)));
  } else {
    root = launch(nullptr, pool, detail::store_result(std::move(body), result));
  }
  root.wait();

  if (auto error = root.failure())
    std::rethrow_exception(error);
  if constexpr (!std::is_void_v<T>) {
    if (!result)
      throw cancelled_exception{};
    return std::move(*result);
  }
}

} // namespace eshare

#endif // ESHARE_ASYNC_RUNTIME_HPP
