/**
 * @file spsc_queue.cpp
 * @brief Out-of-line instantiations of the rings the library itself uses.
 */

#include "drguard/mem/spsc_queue.hpp"
#include "drguard/core/types.hpp"

namespace drguard::mem {

template class SpscQueue<drguard::HealthSample>;  // probe thread -> ingestion thread
template class SpscQueue<int>;                    // tests

} // namespace drguard::mem
