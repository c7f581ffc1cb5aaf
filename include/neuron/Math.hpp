/**
 * @file Math.hpp
 * @brief Mathematical operations for tensors.
 *
 * Provides the elementwise, reduction and linear algebra functionality
 * used by the network engine.
 */

#ifndef NEURON_MATH_HPP
#define NEURON_MATH_HPP

#include "Tensor.hpp"
#include "Elementwise.hpp"
#include "SYCLUtils.hpp"

namespace neuron::math
{

/**
 * @brief Identity transform for sum().
 */
struct Identity
{
    template <typename value_t>
    value_t operator()(value_t v) const { return v; }
};

/**
 * @brief Sanitizing transform for sum().
 *
 * NaN becomes 0, +inf the largest finite value and -inf the lowest
 * finite value.
 */
struct NanToNum
{
    template <typename value_t>
    value_t operator()(value_t v) const { return sycl_utils::nan_to_num(v); }
};

/**
 * @brief Product of two vectors or matrices.
 *
 * A vector on the left is read as a row and a vector on the right as a
 * column; the vector axis is dropped again in the result, so matrix by
 * vector gives a vector and vector by vector gives {1}. Operands may be
 * strided views such as transposes.
 *
 * @throws validation_error if either operand is empty or has a rank
 * above 2, or if the inner dimensions differ.
 */
template <typename value_t>
Tensor<value_t> matmul(const Tensor<value_t> & first,
                        const Tensor<value_t> & second);
/// Explicit instantiation of matmul for float
extern template Tensor<float> matmul<float>
    (const Tensor<float>&, const Tensor<float>&);

/**
 * @brief Outer product of two vectors.
 *
 * Computes the column @p first times the row @p second, giving a
 * {len(first), len(second)} matrix with entry (i, j) = first[i] * second[j].
 *
 * @throws validation_error if either tensor is not a non-empty vector.
 */
template <typename value_t>
Tensor<value_t> outer(const Tensor<value_t> & first,
                        const Tensor<value_t> & second);
/// Explicit instantiation of outer for float
extern template Tensor<float> outer<float>
    (const Tensor<float>&, const Tensor<float>&);

/**
 * @brief Inner product of two equal-length vectors.
 *
 * @throws validation_error if the operands are not vectors or their
 * lengths differ.
 */
template <typename value_t>
value_t dot(const Tensor<value_t> & first, const Tensor<value_t> & second);
/// Explicit instantiation of dot for float
extern template float dot<float>(const Tensor<float>&, const Tensor<float>&);

/// Free-function form of Tensor::transpose(); returns a view.
template <typename value_t>
Tensor<value_t> transpose(const Tensor<value_t> & tensor);
/// Explicit instantiation of transpose for float
extern template Tensor<float> transpose<float>(const Tensor<float>&);

/**
 * @brief Zero-filled tensor of the given shape.
 */
template <typename value_t>
Tensor<value_t> zeros(const std::vector<uint64_t> & shape);
/// Explicit instantiation of zeros for float
extern template Tensor<float> zeros<float>(const std::vector<uint64_t>&);

/**
 * @brief Elementwise natural logarithm.
 *
 * log(0) yields -inf and log of a negative value yields NaN; such values
 * are returned, not reported.
 *
 * @throws validation_error if @p tensor has no elements.
 */
template <typename value_t>
Tensor<value_t> log(const Tensor<value_t> & tensor);
/// Explicit instantiation of log for float
extern template Tensor<float> log<float>(const Tensor<float>&);

/**
 * @brief Elementwise exponential.
 *
 * @throws validation_error if @p tensor has no elements.
 */
template <typename value_t>
Tensor<value_t> exp(const Tensor<value_t> & tensor);
/// Explicit instantiation of exp for float
extern template Tensor<float> exp<float>(const Tensor<float>&);

/**
 * @brief Elementwise 1 - x.
 *
 * @throws validation_error if @p tensor has no elements.
 */
template <typename value_t>
Tensor<value_t> one_minus(const Tensor<value_t> & tensor);
/// Explicit instantiation of one_minus for float
extern template Tensor<float> one_minus<float>(const Tensor<float>&);

/**
 * @brief Index of the largest element in row-major order.
 *
 * Ties resolve to the first index. NaN values never win.
 *
 * @throws validation_error if @p tensor has no elements.
 */
template <typename value_t>
uint64_t argmax(const Tensor<value_t> & tensor);
/// Explicit instantiation of argmax for float
extern template uint64_t argmax<float>(const Tensor<float>&);

/**
 * @brief Apply a device functor to every element.
 *
 * @param tensor Input tensor.
 * @param fn Trivially copyable functor value_t(value_t).
 * @return A new tensor with the same shape.
 *
 * @throws validation_error if @p tensor has no elements.
 */
template <typename value_t, typename fn_t>
Tensor<value_t> map(const Tensor<value_t> & tensor, fn_t fn)
{
    return kernels::map(tensor, fn, "map");
}

/**
 * @brief Sum all elements after applying @p transform to each of them.
 *
 * @param tensor Input tensor.
 * @param transform Trivially copyable functor value_t(value_t), e.g.
 * NanToNum to sanitize non-finite terms before they are added.
 * @return The scalar sum.
 *
 * @throws validation_error if @p tensor has no elements.
 */
template <typename value_t, typename fn_t>
value_t sum(const Tensor<value_t> & tensor, fn_t transform)
{
    return kernels::reduce_sum(tensor, transform, "sum");
}

/**
 * @brief Sum all elements.
 *
 * @throws validation_error if @p tensor has no elements.
 */
template <typename value_t>
value_t sum(const Tensor<value_t> & tensor)
{
    return kernels::reduce_sum(tensor, Identity{}, "sum");
}

} // namespace neuron::math

#endif // NEURON_MATH_HPP
