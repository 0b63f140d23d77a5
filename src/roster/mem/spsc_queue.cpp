/**
 * @file spsc_queue.cpp
 * @brief Explicit template instantiations for SpscQueue to reduce code bloat.
 */

#include "roster/mem/spsc_queue.hpp"
#include "roster/membership/event.hpp"
namespace roster::mem {

    template class SpscQueue<int>;                               // For unit tests and benchmarks
    template class SpscQueue<roster::membership::MembershipEvent>; // transport → dispatch hand-off
} // namespace roster::mem
