#ifndef ESHARE_ESHARE_HPP
#define ESHARE_ESHARE_HPP

// Runtime
#include "async_runtime.hpp"
#include "cancellation.hpp"
#include "deferred.hpp"
#include "errors.hpp"
#include "job.hpp"
#include "run_loop.hpp"
#include "sleep.hpp"
#include "task.hpp"
#include "task_scope.hpp"
#include "thread_pool.hpp"
#include "yield.hpp"

// Broadcasts and flows
#include "broadcast.hpp"
#include "flow.hpp"

// Sharing
#include "sharing/coordinator.hpp"
#include "sharing/share.hpp"
#include "sharing/start_policy.hpp"

#endif // ESHARE_ESHARE_HPP
