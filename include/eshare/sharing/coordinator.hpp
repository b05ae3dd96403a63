#ifndef ESHARE_SHARING_COORDINATOR_HPP
#define ESHARE_SHARING_COORDINATOR_HPP

#include <exception>
#include <memory>
#include <optional>
#include <utility>

#include "../broadcast/concepts.hpp"
#include "../executor.hpp"
#include "../flow.hpp"
#include "../job.hpp"
#include "../task.hpp"
#include "../task_scope.hpp"
#include "start_policy.hpp"

namespace eshare {

// =============================================================================
// Sharing Coordinator
// =============================================================================
//
// The one job per sharing session. Follows the start policy's commands and
// runs at most one producer (upstream collected into the broadcast) at any
// time: every command cancels and joins the running producer before acting,
// so the latest command wins.
//
// On the way out (scope cancelled, producer failed, or the command stream
// and the last producer completed) the producer is stopped and the buffer
// reset. A session ending by cancellation or failure also closes the
// broadcast, which releases suspended subscribers with cancelled_exception.

template <ResettableBroadcast Broadcast,
          typename T = typename Broadcast::value_type>
class sharing_coordinator final : public flow_collector<sharing_command> {
public:
  sharing_coordinator(flow<T> upstream, std::shared_ptr<Broadcast> broadcast,
                      start_policy policy)
      : upstream_(std::move(upstream)), broadcast_(std::move(broadcast)),
        policy_(std::move(policy)) {}

  // Start the session in scope. The coordinator and the producer run on
  // context, or on the scope's executor when it is null.
  static job launch(task_scope &scope, executor *context, flow<T> upstream,
                    std::shared_ptr<Broadcast> broadcast, start_policy policy) {
    auto self = std::make_shared<sharing_coordinator>(
        std::move(upstream), std::move(broadcast), std::move(policy));
    // Started atomically: the cleanup below must run even when the scope is
    // cancelled before the coordinator is first scheduled.
    return scope.launch(run(std::move(self)), context, start_mode::atomic);
  }

  // One command from the policy.
  task<void> emit(sharing_command command) override {
    if (last_ == command)
      co_return;
    last_ = command;

    producer_.cancel();
    co_await producer_.join();

    switch (command) {
    case sharing_command::start: {
      auto self_job = co_await current_job();
      producer_ = eshare::launch(self_job, self_job->get_executor(),
                                 produce(upstream_, broadcast_));
      break;
    }
    case sharing_command::stop:
      break;
    case sharing_command::stop_and_reset_buffer:
      broadcast_->reset_buffer();
      break;
    }
  }

private:
  static task<void> run(std::shared_ptr<sharing_coordinator> self) {
    auto self_job = co_await current_job();
    std::exception_ptr error;
    if (!self_job->is_cancelled()) {
      try {
        co_await self->policy_
            .command_flow(self->broadcast_->subscription_count())
            .collect(*self);
        // Commands are over; the last producer may still be running.
        co_await self->producer_.join();
      } catch (...) {
        error = std::current_exception();
      }
    }

    bool shutting_down = error || self_job->is_cancelled();
    self->producer_.cancel();
    co_await self->producer_.join();
    self->broadcast_->reset_buffer();
    if (shutting_down)
      self->broadcast_->close();
    if (error)
      std::rethrow_exception(error);
  }

  static task<void> produce(flow<T> upstream,
                            std::shared_ptr<Broadcast> broadcast) {
    co_await upstream.collect(*broadcast);
  }

  flow<T> upstream_;
  std::shared_ptr<Broadcast> broadcast_;
  start_policy policy_;
  std::optional<sharing_command> last_;
  job producer_;
};

} // namespace eshare

#endif // ESHARE_SHARING_COORDINATOR_HPP
