/**
 * @file Elementwise.hpp
 * @brief Generic elementwise kernels.
 *
 * Launchers shared by the Tensor operators and the math module. The
 * functors are copied into the kernels, so they must be trivially
 * copyable and must not capture host references.
 */

#ifndef NEURON_ELEMENTWISE_HPP
#define NEURON_ELEMENTWISE_HPP

#include <string>

#include "Tensor.hpp"
#include "SYCLUtils.hpp"
#include "Utils.hpp"

namespace neuron::kernels
{

/**
 * @brief Row-major traversal of a possibly strided tensor.
 *
 * Owns the kernel-visible copies of the divisors and strides.
 */
class Traversal
{
public:
    Traversal(const std::vector<uint64_t> & shape,
        const std::vector<uint64_t> & strides)
        : m_divisors(g_sycl_queue, utils::compute_divisors(shape)),
          m_strides(g_sycl_queue, strides),
          m_rank(static_cast<int64_t>(shape.size())),
          m_count(utils::count_elements(shape))
    {
    }

    const uint64_t * divisors() const noexcept { return m_divisors; }
    const uint64_t * strides() const noexcept { return m_strides; }
    int64_t rank() const noexcept { return m_rank; }
    size_t count() const noexcept { return static_cast<size_t>(m_count); }

private:
    sycl_utils::SyclArray<uint64_t> m_divisors;
    sycl_utils::SyclArray<uint64_t> m_strides;
    int64_t m_rank;
    uint64_t m_count;
};

/**
 * @brief Apply @p fn to every element of @p tensor.
 *
 * @param tensor Input tensor, possibly a strided view.
 * @param fn Functor value_t(value_t) run on the device.
 * @param where Name used in error messages.
 * @return A new contiguous tensor with the same shape.
 *
 * @throws validation_error if @p tensor has no elements.
 */
template <typename value_t, typename fn_t>
Tensor<value_t> map(const Tensor<value_t> & tensor,
    fn_t fn,
    const std::string & where)
{
    NEURON_CHECK(tensor.get_rank() == 0,
        validation_error,
        where + ": input tensor has no elements.");

    Tensor<value_t> result(tensor.get_dimensions());
    Traversal src(tensor.get_dimensions(), tensor.get_strides());

    const uint64_t* p_divs = src.divisors();
    const uint64_t* p_strides = src.strides();
    const int64_t rank = src.rank();
    const value_t* p_src = tensor.get_data();
    value_t* p_dst = result.get_data();

    g_sycl_queue.parallel_for(sycl::range<1>(src.count()),
        [=](sycl::id<1> idx)
    {
        const uint64_t i = static_cast<uint64_t>(idx[0]);
        p_dst[i] = fn(p_src[sycl_utils::idx_of(i, p_divs, p_strides, rank)]);
    }).wait();

    return result;
}

/**
 * @brief Combine two tensors elementwise with @p fn.
 *
 * Shapes must match exactly.
 *
 * @param fn Functor value_t(value_t, value_t) run on the device.
 * @param where Name used in error messages.
 * @return A new contiguous tensor with the output shape.
 *
 * @throws validation_error on empty operands or differing shapes.
 */
template <typename value_t, typename fn_t>
Tensor<value_t> zip(const Tensor<value_t> & first,
    const Tensor<value_t> & second,
    fn_t fn,
    const std::string & where)
{
    NEURON_CHECK(first.get_rank() == 0 || second.get_rank() == 0,
        validation_error,
        where + ": either tensor has no elements.");

    const utils::ElementwiseLayout layout = utils::compute_elementwise(
        utils::TensorDesc{first.get_dimensions(), first.get_strides()},
        utils::TensorDesc{second.get_dimensions(), second.get_strides()});

    Tensor<value_t> result(layout.shape);
    Traversal lhs(layout.shape, layout.strides[0]);
    Traversal rhs(layout.shape, layout.strides[1]);

    const uint64_t* p_divs = lhs.divisors();
    const uint64_t* p_a_strides = lhs.strides();
    const uint64_t* p_b_strides = rhs.strides();
    const int64_t rank = lhs.rank();
    const value_t* p_a = first.get_data();
    const value_t* p_b = second.get_data();
    value_t* p_r = result.get_data();

    g_sycl_queue.parallel_for(sycl::range<1>(lhs.count()),
        [=](sycl::id<1> idx)
    {
        const uint64_t i = static_cast<uint64_t>(idx[0]);
        p_r[i] = fn(p_a[sycl_utils::idx_of(i, p_divs, p_a_strides, rank)],
                    p_b[sycl_utils::idx_of(i, p_divs, p_b_strides, rank)]);
    }).wait();

    return result;
}

/**
 * @brief Copy @p src into @p dst element by element.
 *
 * Both tensors must have the same shape; either may be strided, so this
 * writes through views.
 *
 * @throws validation_error if the shapes differ or are empty.
 */
template <typename value_t>
void copy_into(Tensor<value_t> & dst,
    const Tensor<value_t> & src,
    const std::string & where)
{
    NEURON_CHECK(dst.get_rank() == 0 ||
        dst.get_dimensions() != src.get_dimensions(),
        validation_error,
        where + ": source and destination shapes differ.");

    Traversal out(dst.get_dimensions(), dst.get_strides());
    Traversal in(src.get_dimensions(), src.get_strides());

    const uint64_t* p_divs = out.divisors();
    const uint64_t* p_dst_strides = out.strides();
    const uint64_t* p_src_strides = in.strides();
    const int64_t rank = out.rank();
    const value_t* p_src = src.get_data();
    value_t* p_dst = dst.get_data();

    g_sycl_queue.parallel_for(sycl::range<1>(out.count()),
        [=](sycl::id<1> idx)
    {
        const uint64_t i = static_cast<uint64_t>(idx[0]);
        p_dst[sycl_utils::idx_of(i, p_divs, p_dst_strides, rank)] =
            p_src[sycl_utils::idx_of(i, p_divs, p_src_strides, rank)];
    }).wait();
}

/**
 * @brief Sum every element of @p tensor after applying @p transform.
 *
 * @param transform Functor value_t(value_t) applied before summation.
 * @param where Name used in error messages.
 * @return The sum. Summation order is unspecified.
 *
 * @throws validation_error if @p tensor has no elements.
 */
template <typename value_t, typename fn_t>
value_t reduce_sum(const Tensor<value_t> & tensor,
    fn_t transform,
    const std::string & where)
{
    NEURON_CHECK(tensor.get_rank() == 0,
        validation_error,
        where + ": input tensor has no elements.");

    Traversal src(tensor.get_dimensions(), tensor.get_strides());
    sycl_utils::SyclArray<value_t> total(g_sycl_queue, 1);

    const uint64_t* p_divs = src.divisors();
    const uint64_t* p_strides = src.strides();
    const int64_t rank = src.rank();
    const value_t* p_src = tensor.get_data();
    value_t* p_total = total;

    g_sycl_queue.submit([&](sycl::handler& cgh)
    {
        auto sum = sycl::reduction(p_total, sycl::plus<value_t>());

        cgh.parallel_for(sycl::range<1>(src.count()), sum,
            [=](sycl::id<1> idx, auto & acc)
        {
            const uint64_t i = static_cast<uint64_t>(idx[0]);
            acc += transform(
                p_src[sycl_utils::idx_of(i, p_divs, p_strides, rank)]);
        });
    }).wait();

    return *p_total;
}

} // namespace neuron::kernels

#endif // NEURON_ELEMENTWISE_HPP
