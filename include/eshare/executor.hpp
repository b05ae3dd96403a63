#ifndef ESHARE_EXECUTOR_HPP
#define ESHARE_EXECUTOR_HPP

#include <coroutine>

namespace eshare {

// Something that can resume coroutine handles. Every suspension point in
// eshare resumes on the executor of the job that suspended, so a job never
// migrates between executors on its own.
class executor {
public:
  virtual ~executor() = default;

  virtual void schedule(std::coroutine_handle<> handle) = 0;
};

} // namespace eshare

#endif // ESHARE_EXECUTOR_HPP
