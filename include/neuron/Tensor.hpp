/**
 * @file Tensor.hpp
 * @brief Declaration of the Tensor data structure.
 */

#ifndef NEURON_TENSOR_HPP
#define NEURON_TENSOR_HPP

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <vector>

#include "SYCLQueue.hpp"

namespace neuron
{

/**
 * @brief Row-major strided tensor stored in USM shared memory.
 * @tparam value_t Floating point element type.
 *
 * A tensor either owns its buffer or is a view aliasing the buffer of
 * another tensor through an offset and its own strides. Views keep the
 * buffer alive. Shared memory is readable from the host, so scalar reads
 * and host transfers need no explicit copy.
 *
 * Operators never broadcast: tensor operands must have the same shape.
 * Scalars are applied through the value_t overloads.
 */
template <typename value_t>
class Tensor
{
public:

    /// Empty tensor (rank 0, no storage).
    Tensor() = default;

    /**
     * @brief Zero-filled tensor with the given dimensions.
     *
     * @throws validation_error if @p dimensions is empty or holds a zero.
     * @throws bounds_error if the element count overflows.
     * @throws device_error if the allocation fails.
     */
    explicit Tensor(const std::vector<uint64_t> & dimensions);

    /// @copydoc Tensor(const std::vector<uint64_t>&)
    explicit Tensor(std::initializer_list<uint64_t> dimensions);

    /// Single-element tensor of shape {1} holding @p val.
    explicit Tensor(value_t val);

    /**
     * @brief Copy constructor.
     *
     * An owning source is deep-copied; a view source yields another view
     * on the same buffer.
     */
    Tensor(const Tensor & other);

    /// Move constructor. @p other is left empty.
    Tensor(Tensor && other) noexcept;

    /**
     * @brief View on a sub-block of @p owner.
     *
     * The view keeps the trailing @p view_shape.size() axes of the owner
     * with the owner's strides, starting at @p start_indices.
     *
     * @throws validation_error on an uninitialized owner or rank mismatch.
     * @throws bounds_error if the block leaves the owner.
     */
    Tensor(const Tensor & owner,
        const std::vector<uint64_t> & start_indices,
        const std::vector<uint64_t> & view_shape);

    /**
     * @brief View on @p owner with arbitrary dimensions and strides.
     *
     * Transposes and row views of vectors are built this way.
     *
     * @throws validation_error on an uninitialized owner or rank mismatch.
     * @throws bounds_error if an element reachable through the view lies
     * outside the owner's buffer.
     */
    Tensor(const Tensor & owner,
        const std::vector<uint64_t> & start_indices,
        const std::vector<uint64_t> & dims,
        const std::vector<uint64_t> & strides);

    /// Copy assignment; same ownership rules as the copy constructor.
    Tensor & operator=(const Tensor & other);

    /// Move assignment. @p other is left empty.
    Tensor & operator=(Tensor && other) noexcept;

    /**
     * @brief Overwrite every element, in row-major order.
     *
     * Writes through views.
     *
     * @throws validation_error if the tensor is empty or the sizes differ.
     */
    Tensor & operator=(const std::vector<value_t> & values);

    /**
     * @brief Overwrite the single element of the tensor.
     *
     * An empty tensor becomes a scalar tensor.
     *
     * @throws validation_error if the tensor holds more than one element.
     */
    Tensor & operator=(value_t val);

    /**
     * @brief View on slice @p idx of the first axis.
     *
     * Indexing a vector yields a {1} view on one element.
     *
     * @throws bounds_error if @p idx is out of range.
     */
    Tensor operator[](uint64_t idx);

    /// @copydoc operator[](uint64_t)
    const Tensor operator[](uint64_t idx) const;

    /**
     * @brief Read the single element of the tensor.
     *
     * @throws validation_error if the tensor does not hold exactly one
     * element.
     */
    operator value_t() const;

    /// Elementwise addition.
    Tensor operator+(const Tensor & other) const;

    /// Elementwise subtraction.
    Tensor operator-(const Tensor & other) const;

    /// Elementwise multiplication.
    Tensor operator*(const Tensor & other) const;

    /// Elementwise division. x / 0 follows IEEE-754.
    Tensor operator/(const Tensor & other) const;

    /// Elementwise negation.
    Tensor operator-() const;

    /// Add @p scalar to every element.
    Tensor operator+(value_t scalar) const;

    /// Subtract @p scalar from every element.
    Tensor operator-(value_t scalar) const;

    /// Multiply every element by @p scalar.
    Tensor operator*(value_t scalar) const;

    /// Divide every element by @p scalar.
    Tensor operator/(value_t scalar) const;

    /// @p scalar minus every element of @p tensor.
    friend Tensor operator-(value_t scalar, const Tensor & tensor)
    {
        return -tensor + scalar;
    }

    /// @p scalar times every element of @p tensor.
    friend Tensor operator*(value_t scalar, const Tensor & tensor)
    {
        return tensor * scalar;
    }

    /// Same shape and same values. NaN never compares equal.
    bool operator==(const Tensor & other) const;

    bool operator!=(const Tensor & other) const;

    /// Contiguous owning copy, also of views.
    Tensor clone() const;

    /**
     * @brief Transposed view.
     *
     * A vector {n} becomes the column {n, 1}; otherwise the axis order
     * is reversed.
     */
    Tensor transpose() const;

    /// Elements in row-major order.
    std::vector<value_t> to_vector() const;

    /// Write the values as nested brackets.
    void print(std::ostream & os = std::cout) const;

    /// Write the dimensions as "[d0, d1, ...]".
    void print_shape(std::ostream & os = std::cout) const;

    const value_t * get_data() const noexcept;
    value_t * get_data() noexcept;
    const std::vector<uint64_t> & get_dimensions() const noexcept;
    const std::vector<uint64_t> & get_strides() const noexcept;
    int64_t get_rank() const noexcept;
    uint64_t get_num_elements() const noexcept;
    bool get_owns_data() const noexcept;

private:

    /// Row-major strides of m_dimensions.
    void compute_strides();

    std::shared_ptr<value_t> m_p_data {};
    std::vector<uint64_t>    m_dimensions {};
    std::vector<uint64_t>    m_strides {};
    bool                     m_own_data {true};
};
/// Explicit instantiation of Tensor for float
extern template class Tensor<float>;

} // namespace neuron

#endif // NEURON_TENSOR_HPP
