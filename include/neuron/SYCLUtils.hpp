/**
 * @file SYCLUtils.hpp
 * @brief Kernel-side helpers and the USM scratch array used to feed
 * shapes and strides to kernels.
 */

#ifndef NEURON_SYCLUTILS_HPP
#define NEURON_SYCLUTILS_HPP

#include <sycl/sycl.hpp>
#include <cstdint>
#include <limits>
#include <vector>

#include "Errors.hpp"

namespace neuron::sycl_utils
{

/**
 * @brief Physical offset of the row-major element @p logical_idx.
 *
 * @param logical_idx Linear index in [0, element count).
 * @param p_divisors Elements spanned by one step of each axis
 * (length == rank).
 * @param p_strides Strides of the tensor being read (length == rank).
 * @param rank Number of axes.
 */
inline uint64_t idx_of(uint64_t logical_idx,
                       const uint64_t* p_divisors,
                       const uint64_t* p_strides,
                       int64_t rank)
{
    uint64_t off = 0;
    for (int64_t d = 0; d < rank; ++d)
    {
        const uint64_t div = p_divisors[d];
        off += (logical_idx / div) * p_strides[d];
        logical_idx %= div;
    }
    return off;
}

/**
 * @brief Replace non-finite values by finite ones.
 *
 * NaN becomes 0, +inf becomes the largest finite value and -inf the
 * lowest finite value. Every other value is returned unchanged.
 */
template <typename value_t>
inline value_t nan_to_num(value_t v)
{
    if (sycl::isnan(v))
    {
        return static_cast<value_t>(0);
    }
    if (sycl::isinf(v))
    {
        return v > static_cast<value_t>(0) ?
            std::numeric_limits<value_t>::max() :
            std::numeric_limits<value_t>::lowest();
    }
    return v;
}

/**
 * @brief RAII owner of a small zero-initialized USM shared array.
 *
 * Non-copyable. Converts to the raw pointer so it can be captured by
 * kernels.
 */
template <typename value_t>
class SyclArray
{
public:
    /// @throws device_error if the allocation fails.
    SyclArray(sycl::queue & q, size_t count)
        : m_queue(q),
          m_size(count)
    {
        const size_t alloc_count = count == 0 ? 1 : count;
        m_p_data = sycl::malloc_shared<value_t>(alloc_count, m_queue);

        NEURON_CHECK(!m_p_data,
            device_error,
            R"(SyclArray: error allocating scratch memory.)");

        m_queue.memset(m_p_data, 0, alloc_count * sizeof(value_t)).wait();
    }

    /// @throws device_error if the allocation fails.
    SyclArray(sycl::queue & q, const std::vector<value_t> & values)
        : SyclArray(q, values.size())
    {
        if (!values.empty())
        {
            m_queue.memcpy(m_p_data, values.data(),
                values.size() * sizeof(value_t)).wait();
        }
    }

    ~SyclArray()
    {
        sycl::free(m_p_data, m_queue);
    }

    SyclArray(const SyclArray &) = delete;
    SyclArray & operator=(const SyclArray &) = delete;

    operator value_t*() const noexcept { return m_p_data; }

    size_t size() const noexcept { return m_size; }

private:
    sycl::queue & m_queue;
    value_t * m_p_data {nullptr};
    size_t m_size {0};
};

} // namespace neuron::sycl_utils

#endif // NEURON_SYCLUTILS_HPP
