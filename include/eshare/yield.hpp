#ifndef ESHARE_YIELD_HPP
#define ESHARE_YIELD_HPP

#include <coroutine>

#include "job.hpp"

namespace eshare {

// Awaitable that yields execution back to the job's executor
// Allows other coroutines to run before resuming
struct yield_awaiter {
  bool await_ready() noexcept { return false; }

  template <typename Promise>
  void await_suspend(std::coroutine_handle<Promise> h) {
    h.promise().job()->get_executor().schedule(h);
  }

  void await_resume() noexcept {}
};

// Create a yield awaiter - use with co_await
inline yield_awaiter yield() { return {}; }

} // namespace eshare

#endif // ESHARE_YIELD_HPP
