#ifndef ESHARE_FWD_HPP
#define ESHARE_FWD_HPP

#include "broadcast/concepts.hpp"

namespace eshare {

template <typename T> class flow_collector;
template <typename T> class flow;

template <Copyable T> class shared_broadcast;
template <StateValue T> class latest_value_broadcast;
template <Copyable T> class subscription;

template <Copyable T> class readonly_broadcast;
template <StateValue T> class readonly_latest_value;

class start_policy;

} // namespace eshare

#endif // ESHARE_FWD_HPP
