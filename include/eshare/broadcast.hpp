#ifndef ESHARE_BROADCAST_HPP
#define ESHARE_BROADCAST_HPP

// =============================================================================
// eshare broadcast primitives
// =============================================================================
//
// Hot multi-subscriber primitives with coroutine-awaitable receiving and
// back-pressured emission.
//
// Primitives:
// - replay_buffer: cursor/index bookkeeping shared by every broadcast
// - shared_broadcast: replaying broadcast with a configurable overflow policy
// - latest_value_broadcast: single conflated value, equal values ignored
// - readonly_broadcast / readonly_latest_value: receive-only views
//
// =============================================================================

// Foundation headers
#include "broadcast/concepts.hpp"
#include "broadcast/policies.hpp"
#include "broadcast/crtp_base.hpp"
#include "broadcast/replay_buffer.hpp"

// Primitive headers
#include "broadcast/shared_broadcast.hpp"
#include "broadcast/latest_value.hpp"
#include "broadcast/readonly.hpp"

#endif // ESHARE_BROADCAST_HPP
