#include "eshare/task_scope.hpp"

#include <cstdio>

namespace eshare {

task_scope::task_scope(executor &exec)
    : state_(std::make_shared<job_state>(exec, nullptr,
                                         job_state::kind::scope)) {}

task_scope::~task_scope() {
  state_->cancel();
  if (failure_observed_)
    return;
  if (auto error = state_->failure()) {
    try {
      std::rethrow_exception(error);
    } catch (const std::exception &e) {
      std::fprintf(stderr, "[task_scope] unobserved failure: %s\n", e.what());
    } catch (...) {
      std::fprintf(stderr, "[task_scope] unobserved failure of unknown type\n");
    }
  }
}

job task_scope::launch(task<void> body, executor *exec, start_mode mode) {
  return eshare::launch(state_, exec ? *exec : state_->get_executor(),
                        std::move(body), mode);
}

scope_join_awaiter task_scope::join() const {
  failure_observed_ = true;
  return scope_join_awaiter{state_};
}

void task_scope::wait() const {
  failure_observed_ = true;
  state_->wait_blocking();
  if (auto error = state_->failure())
    std::rethrow_exception(error);
}

} // namespace eshare
