/**
 * @file Utils.hpp
 * @brief General-purpose tensor utility functions.
 *
 * Provides helpers for elementwise shape alignment, stride/divisor
 * computation, and index translation.
 */

#ifndef NEURON_UTILS_HPP
#define NEURON_UTILS_HPP

#include <cstdint>
#include <vector>
#include <stdexcept>

#include "Errors.hpp"

namespace neuron::utils
{

/**
 * @brief Descriptor of a tensor's layout.
 *
 * Encapsulates the shape and strides.
 */
struct TensorDesc
{
    std::vector<uint64_t> shape;    ///< Sizes of each dimension.
    std::vector<uint64_t> strides;  ///< Strides for each dimension.
};

/**
 * @brief Layout of a binary elementwise operation.
 *
 * - `shape`: Output shape.
 * - `divisors`: Precomputed divisors for indexing the output.
 * - `strides`: Per-operand strides expressed on the output shape.
 */
struct ElementwiseLayout
{
    std::vector<uint64_t> shape;    ///< Sizes of each dimension.
    std::vector<uint64_t> divisors; ///< Precomputed divisors for fast indexing.

    /// Operand strides, one vector per operand.
    std::vector<std::vector<uint64_t>> strides;
};

/**
 * @brief Precompute divisors for fast index translation.
 *
 * @param shape The tensor shape.
 * @return A vector of divisors matching the rank.
 */
inline std::vector<uint64_t>
compute_divisors(const std::vector<uint64_t>& shape)
{
    const int64_t rank = static_cast<int64_t>(shape.size());
    std::vector<uint64_t> divs(rank, 1);

    for (int64_t i = rank - 2; i >= 0; --i)
    {
        divs[i] = divs[i + 1] * shape[i + 1];
    }
    return divs;
}

/**
 * @brief Number of elements described by a shape.
 *
 * @param shape The tensor shape.
 * @return Product of the dimensions, 0 for an empty shape.
 */
inline uint64_t count_elements(const std::vector<uint64_t>& shape)
{
    if (shape.empty())
    {
        return 0;
    }

    uint64_t total = 1;
    for (uint64_t d : shape)
    {
        total *= d;
    }
    return total;
}

/**
 * @brief Compute the layout of an elementwise operation on two operands.
 *
 * Both operands must have the same shape. No broadcasting is performed,
 * single-element operands included; scalars go through the dedicated
 * Tensor overloads.
 *
 * @param first Descriptor of the left-hand operand.
 * @param second Descriptor of the right-hand operand.
 * @return ElementwiseLayout with the output shape, its divisors and the
 * per-operand strides.
 *
 * @throws validation_error if the shapes differ.
 */
inline ElementwiseLayout compute_elementwise(const TensorDesc& first,
    const TensorDesc& second)
{
    if (first.shape != second.shape)
    {
        throw validation_error(R"(compute_elementwise:
            operand shapes differ (no broadcasting is performed).)");
    }

    ElementwiseLayout res;
    res.shape = first.shape;
    res.strides = {first.strides, second.strides};
    res.divisors = compute_divisors(res.shape);
    return res;
}

} // namespace neuron::utils

#endif // NEURON_UTILS_HPP
