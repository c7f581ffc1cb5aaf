/**
 * @file Math.cpp
 * @brief Mathematical tensor operation definitions.
 */

#include "neuron/Math.hpp"
#include "neuron/SYCLUtils.hpp"
#include "neuron/Utils.hpp"

#include <cmath>

namespace neuron::math
{

namespace
{

/// Operand of a matrix product viewed as a {rows, cols} matrix.
struct MatrixView
{
    uint64_t rows;
    uint64_t cols;
    uint64_t row_stride;
    uint64_t col_stride;
};

/// A vector is a row on the left of the product and a column on the right.
template <typename value_t>
MatrixView as_matrix(const Tensor<value_t> & t, bool left)
{
    const std::vector<uint64_t> & dims = t.get_dimensions();
    const std::vector<uint64_t> & strides = t.get_strides();

    if (dims.size() == 2)
    {
        return MatrixView{dims[0], dims[1], strides[0], strides[1]};
    }
    if (left)
    {
        return MatrixView{1, dims[0], 0, strides[0]};
    }
    return MatrixView{dims[0], 1, strides[0], 0};
}

} // namespace

template <typename value_t>
Tensor<value_t> matmul(const Tensor<value_t> & first,
                       const Tensor<value_t> & second)
{
    const int64_t a_rank = first.get_rank();
    const int64_t b_rank = second.get_rank();

    NEURON_CHECK(a_rank == 0 || b_rank == 0,
        validation_error,
        R"(matmul: either tensor has no elements.)");

    NEURON_CHECK(a_rank > 2 || b_rank > 2,
        validation_error,
        R"(matmul: only vectors and matrices are supported.)");

    const MatrixView a = as_matrix(first, true);
    const MatrixView b = as_matrix(second, false);

    NEURON_CHECK(a.cols != b.rows,
        validation_error,
        R"(matmul: inner dimensions must match.)");

    std::vector<uint64_t> out_shape;
    if (a_rank == 2)
    {
        out_shape.push_back(a.rows);
    }
    if (b_rank == 2)
    {
        out_shape.push_back(b.cols);
    }
    if (out_shape.empty())
    {
        out_shape.push_back(1);
    }

    Tensor<value_t> result(out_shape);

    const uint64_t n = b.cols;
    const uint64_t inner = a.cols;
    const value_t* p_a = first.get_data();
    const value_t* p_b = second.get_data();
    value_t* p_r = result.get_data();

    // Every output shape above stores its rows * cols entries row-major.
    g_sycl_queue.parallel_for(sycl::range<1>(
        static_cast<size_t>(a.rows * b.cols)), [=](sycl::id<1> idx)
    {
        const uint64_t flat = static_cast<uint64_t>(idx[0]);
        const uint64_t i = flat / n;
        const uint64_t j = flat % n;

        value_t acc = static_cast<value_t>(0);
        for (uint64_t k = 0; k < inner; ++k)
        {
            acc += p_a[i * a.row_stride + k * a.col_stride] *
                   p_b[k * b.row_stride + j * b.col_stride];
        }
        p_r[flat] = acc;
    }).wait();

    return result;
}
template Tensor<float> matmul<float>
    (const Tensor<float>&, const Tensor<float>&);

template <typename value_t>
Tensor<value_t> outer(const Tensor<value_t> & first,
                      const Tensor<value_t> & second)
{
    NEURON_CHECK(first.get_rank() != 1 || second.get_rank() != 1,
        validation_error,
        R"(outer: both operands must be vectors.)");

    const uint64_t n = second.get_dimensions()[0];
    const uint64_t s = second.get_strides()[0];

    // Row view {1, n} of the second vector.
    Tensor<value_t> row(second, {0}, {1, n}, {s * n, s});

    return matmul(first.transpose(), row);
}
template Tensor<float> outer<float>
    (const Tensor<float>&, const Tensor<float>&);

template <typename value_t>
value_t dot(const Tensor<value_t> & first, const Tensor<value_t> & second)
{
    NEURON_CHECK(first.get_rank() != 1 || second.get_rank() != 1,
        validation_error,
        R"(dot: both operands must be vectors.)");

    return static_cast<value_t>(matmul(first, second));
}
template float dot<float>(const Tensor<float>&, const Tensor<float>&);

template <typename value_t>
Tensor<value_t> transpose(const Tensor<value_t> & tensor)
{
    return tensor.transpose();
}
template Tensor<float> transpose<float>(const Tensor<float>&);

template <typename value_t>
Tensor<value_t> zeros(const std::vector<uint64_t> & shape)
{
    return Tensor<value_t>(shape);
}
template Tensor<float> zeros<float>(const std::vector<uint64_t>&);

template <typename value_t>
Tensor<value_t> log(const Tensor<value_t> & tensor)
{
    return kernels::map(tensor,
        [](value_t v) { return sycl::log(v); },
        "log");
}
template Tensor<float> log<float>(const Tensor<float>&);

template <typename value_t>
Tensor<value_t> exp(const Tensor<value_t> & tensor)
{
    return kernels::map(tensor,
        [](value_t v) { return sycl::exp(v); },
        "exp");
}
template Tensor<float> exp<float>(const Tensor<float>&);

template <typename value_t>
Tensor<value_t> one_minus(const Tensor<value_t> & tensor)
{
    return kernels::map(tensor,
        [](value_t v) { return static_cast<value_t>(1) - v; },
        "one_minus");
}
template Tensor<float> one_minus<float>(const Tensor<float>&);

template <typename value_t>
uint64_t argmax(const Tensor<value_t> & tensor)
{
    NEURON_CHECK(tensor.get_rank() == 0,
        validation_error,
        R"(argmax: input tensor has no elements.)");

    const std::vector<value_t> values = tensor.to_vector();

    uint64_t best = 0;
    for (uint64_t i = 1; i < values.size(); ++i)
    {
        if (values[i] > values[best] || std::isnan(values[best]))
        {
            best = i;
        }
    }
    return best;
}
template uint64_t argmax<float>(const Tensor<float>&);

} // namespace neuron::math
