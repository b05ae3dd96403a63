#ifndef ESHARE_FLOW_COLLECTOR_HPP
#define ESHARE_FLOW_COLLECTOR_HPP

#include "task.hpp"

namespace eshare {

// Receiving end of a flow. emit() may suspend the producer (back-pressure)
// and throws cancelled_exception once the producing job is cancelled.
template <typename T> class flow_collector {
public:
  virtual ~flow_collector() = default;

  virtual task<void> emit(T value) = 0;
};

} // namespace eshare

#endif // ESHARE_FLOW_COLLECTOR_HPP
