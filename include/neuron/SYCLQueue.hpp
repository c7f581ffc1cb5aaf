/**
 * @file SYCLQueue.hpp
 * @brief Declaration of the global SYCL queue.
 *
 * This header declares a global `sycl::queue` variable that can be used
 * throughout the project, avoiding the need to pass it explicitly
 * between functions. The queue is bound to the host CPU device.
 */

#ifndef NEURON_SYCLQUEUE_HPP
#define NEURON_SYCLQUEUE_HPP

#include <sycl/sycl.hpp>

namespace neuron
{

/**
 * @brief Global SYCL queue used for all tensor kernels.
 *
 * Submissions are thread-safe, so the training workers share it.
 */
extern sycl::queue g_sycl_queue;

} // namespace neuron

#endif // NEURON_SYCLQUEUE_HPP
