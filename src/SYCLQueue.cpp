/**
 * @file SYCLQueue.cpp
 * @brief Global SYCL queue definition.
 */

#include "neuron/SYCLQueue.hpp"

namespace neuron {

sycl::queue g_sycl_queue{ sycl::cpu_selector_v };

} // namespace neuron
