#ifndef ESHARE_TASK_HPP
#define ESHARE_TASK_HPP

#include <coroutine>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace eshare {

class job_state;

// =============================================================================
// Promise Base - job context shared by every coroutine of a job
// =============================================================================
//
// A launched job's driver coroutine owns the job context. Any task awaited
// from it inherits the context when it is started, so the awaiters deep in
// the call chain know which executor to resume on and which token to watch.

class promise_base {
public:
  const std::shared_ptr<job_state> &job() const noexcept { return job_; }

  void set_job(std::shared_ptr<job_state> job) noexcept {
    job_ = std::move(job);
  }

  std::coroutine_handle<> continuation() const noexcept {
    return continuation_;
  }

  void set_continuation(std::coroutine_handle<> continuation) noexcept {
    continuation_ = continuation;
  }

private:
  std::shared_ptr<job_state> job_;
  std::coroutine_handle<> continuation_{nullptr};
};

template <typename T> class task;

namespace detail {

// Resumes whoever awaited the task by symmetric transfer.
template <typename Promise> struct task_final_awaiter {
  bool await_ready() noexcept { return false; }

  std::coroutine_handle<>
  await_suspend(std::coroutine_handle<Promise> h) noexcept {
    if (auto continuation = h.promise().continuation())
      return continuation;
    return std::noop_coroutine();
  }

  void await_resume() noexcept {}
};

template <typename T> struct task_promise : promise_base {
  std::variant<std::monostate, T, std::exception_ptr> result;

  task<T> get_return_object();

  std::suspend_always initial_suspend() noexcept { return {}; }

  task_final_awaiter<task_promise> final_suspend() noexcept { return {}; }

  template <typename U>
    requires std::is_convertible_v<U &&, T>
  void return_value(U &&value) {
    result.template emplace<1>(std::forward<U>(value));
  }

  void unhandled_exception() noexcept {
    result.template emplace<2>(std::current_exception());
  }

  T take() {
    if (result.index() == 2)
      std::rethrow_exception(std::get<2>(result));
    return std::move(std::get<1>(result));
  }
};

template <> struct task_promise<void> : promise_base {
  std::exception_ptr error;

  task<void> get_return_object();

  std::suspend_always initial_suspend() noexcept { return {}; }

  task_final_awaiter<task_promise> final_suspend() noexcept { return {}; }

  void return_void() noexcept {}

  void unhandled_exception() noexcept { error = std::current_exception(); }

  void take() {
    if (error)
      std::rethrow_exception(error);
  }
};

} // namespace detail

// =============================================================================
// task<T> - lazily started coroutine
// =============================================================================
//
// Nothing runs until the task is awaited; the awaiting coroutine is resumed
// when the task finishes, with its value or its exception. To run a task in
// the background, launch it as a job (job.hpp).

template <typename T = void> class task {
public:
  using promise_type = detail::task_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  task() noexcept = default;

  task(const task &) = delete;
  task &operator=(const task &) = delete;

  task(task &&other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

  task &operator=(task &&other) noexcept {
    if (this != &other) {
      if (handle_)
        handle_.destroy();
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  ~task() {
    if (handle_)
      handle_.destroy();
  }

  bool valid() const noexcept { return handle_ != nullptr; }

  bool await_ready() const noexcept { return !handle_ || handle_.done(); }

  template <typename Promise>
  std::coroutine_handle<>
  await_suspend(std::coroutine_handle<Promise> awaiting) noexcept {
    handle_.promise().set_job(awaiting.promise().job());
    handle_.promise().set_continuation(awaiting);
    return handle_;
  }

  T await_resume() { return handle_.promise().take(); }

private:
  friend struct detail::task_promise<T>;

  explicit task(handle_type h) noexcept : handle_(h) {}

  handle_type handle_{nullptr};
};

namespace detail {

template <typename T> task<T> task_promise<T>::get_return_object() {
  return task<T>{std::coroutine_handle<task_promise>::from_promise(*this)};
}

inline task<void> task_promise<void>::get_return_object() {
  return task<void>{std::coroutine_handle<task_promise>::from_promise(*this)};
}

} // namespace detail

template <typename T> struct is_task : std::false_type {};
template <typename T> struct is_task<task<T>> : std::true_type {};

template <typename T> inline constexpr bool is_task_v = is_task<T>::value;

} // namespace eshare

#endif // ESHARE_TASK_HPP
